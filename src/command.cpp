#include "command.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace dgadmin {

Command Command::update_schema(std::optional<std::string> schema) {
    return {CommandKind::UpdateSchema, std::move(schema)};
}

const char* method_name(HttpMethod method) {
    return method == HttpMethod::Post ? "POST" : "GET";
}

static std::string drop_payload(const char* op) {
    return json{{"drop_op", op}}.dump();
}

RequestDescriptor resolve(const Command& command, const EndpointConfig& endpoint) {
    RequestDescriptor desc;

    switch (command.kind) {
        case CommandKind::UpdateSchema:
            if (!command.schema || command.schema->empty())
                throw ConfigurationError("update-schema requires a non-empty schema");
            desc.method = HttpMethod::Post;
            desc.path = admin_paths::Alter;
            desc.headers.emplace_back("Content-Type", kSchemaContentType);
            desc.body = *command.schema;
            break;
        case CommandKind::GetSchema:
            desc.method = HttpMethod::Get;
            desc.path = admin_paths::Schema;
            break;
        case CommandKind::DropAll:
            desc.method = HttpMethod::Post;
            desc.path = admin_paths::Alter;
            desc.headers.emplace_back("Content-Type", kJsonContentType);
            desc.body = drop_payload("all");
            break;
        case CommandKind::DropData:
            desc.method = HttpMethod::Post;
            desc.path = admin_paths::Alter;
            desc.headers.emplace_back("Content-Type", kJsonContentType);
            desc.body = drop_payload("data");
            break;
        case CommandKind::GetHealth:
            desc.method = HttpMethod::Get;
            desc.path = admin_paths::Health;
            break;
    }

    if (endpoint.auth)
        desc.headers.emplace_back(endpoint.auth->name, endpoint.auth->value);
    return desc;
}

struct CommandNameEntry {
    const char* name;
    CommandKind kind;
};

static const CommandNameEntry kCommandNames[] = {
    {"update-schema", CommandKind::UpdateSchema},
    {"get-schema",    CommandKind::GetSchema},
    {"drop-all",      CommandKind::DropAll},
    {"drop-data",     CommandKind::DropData},
    {"get-health",    CommandKind::GetHealth},
};

std::optional<CommandKind> command_from_name(const std::string& name) {
    for (const auto& entry : kCommandNames) {
        if (name == entry.name) return entry.kind;
    }
    return std::nullopt;
}

const char* command_name(CommandKind kind) {
    for (const auto& entry : kCommandNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "unknown";
}

bool is_destructive(CommandKind kind) {
    return kind == CommandKind::DropAll || kind == CommandKind::DropData;
}

} // namespace dgadmin
