#include "report.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <ostream>

using json = nlohmann::json;

namespace dgadmin {

int exit_code_for(const Outcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::Success:          return kExitSuccess;
        case OutcomeKind::ApplicationError: return kExitApplicationError;
        case OutcomeKind::TransportError:   return kExitTransportError;
    }
    return kExitTransportError;
}

// A node needs string "address" and "status"; anything else is not a
// health entry (e.g. an {"errors":[...]} body).
static bool is_health_node(const json& node) {
    return node.is_object() &&
           node.contains("address") && node["address"].is_string() &&
           node.contains("status") && node["status"].is_string();
}

static std::string health_line(const json& node) {
    std::string line = node["address"].get<std::string>() + " is " +
                       node["status"].get<std::string>();
    if (node.contains("uptime") && node["uptime"].is_number_unsigned())
        line += ", uptime: " + format_duration(node["uptime"].get<uint64_t>());
    return line + "\n";
}

std::string render_health(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) return body;

    if (j.is_object()) return is_health_node(j) ? health_line(j) : body;
    if (!j.is_array() || j.empty()) return body;

    std::string out;
    for (const auto& node : j) {
        if (!is_health_node(node)) return body;
        out += health_line(node);
    }
    return out;
}

// Locate the schema string in the known response shapes.
static const json* find_schema(const json& j) {
    if (!j.is_object()) return nullptr;
    if (j.contains("schema")) return &j["schema"];
    if (j.contains("data") && j["data"].is_object()) {
        const json& data = j["data"];
        if (data.contains("schema")) return &data["schema"];
        if (data.contains("getGQLSchema") && data["getGQLSchema"].is_object() &&
            data["getGQLSchema"].contains("schema"))
            return &data["getGQLSchema"]["schema"];
        if (data.contains("getGQLSchema") && data["getGQLSchema"].is_null())
            return &data["getGQLSchema"];
    }
    return nullptr;
}

std::string render_schema(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    std::string schema;
    if (j.is_discarded()) {
        // Plain-text schema
        schema = trim(body);
    } else {
        const json* node = find_schema(j);
        if (!node) return body;
        // Null on a fresh database; "" after drop-all
        if (node->is_string()) schema = trim(node->get<std::string>());
        else if (!node->is_null()) return body;
    }
    return schema.empty() ? "no schema\n" : schema + "\n";
}

bool is_alter_success(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || j.contains("errors")) return false;
    if (!j.contains("data") || !j["data"].is_object()) return false;
    const json& data = j["data"];
    return data.contains("code") && data["code"].is_string() &&
           data["code"].get<std::string>() == "Success";
}

static std::string with_newline(const std::string& text) {
    if (text.empty() || text.back() == '\n') return text;
    return text + "\n";
}

std::string render_success(CommandKind command, const std::string& body,
                           OutputMode mode) {
    if (mode == OutputMode::Raw) return with_newline(body);
    switch (command) {
        case CommandKind::GetHealth:
            return with_newline(render_health(body));
        case CommandKind::GetSchema:
            return with_newline(render_schema(body));
        case CommandKind::UpdateSchema:
        case CommandKind::DropAll:
        case CommandKind::DropData:
            return is_alter_success(body) ? "success\n" : with_newline(body);
    }
    return with_newline(body);
}

int report_outcome(const Outcome& outcome, CommandKind command, OutputMode mode,
                   std::ostream& out, std::ostream& err) {
    switch (outcome.kind) {
        case OutcomeKind::Success:
            out << render_success(command, outcome.body, mode);
            break;
        case OutcomeKind::ApplicationError:
            err << "Error: server returned HTTP " << outcome.status_code << "\n";
            if (!outcome.body.empty()) {
                err << outcome.body;
                if (outcome.body.back() != '\n') err << "\n";
            }
            break;
        case OutcomeKind::TransportError:
            err << "Error: request failed: " << outcome.cause << "\n";
            if (is_destructive(command))
                err << "Warning: " << command_name(command)
                    << " may or may not have been applied; check the database"
                       " before retrying.\n";
            break;
    }
    return exit_code_for(outcome);
}

} // namespace dgadmin
