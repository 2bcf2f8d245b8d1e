#pragma once
#include "endpoint.hpp"
#include "http.hpp"
#include <optional>
#include <string>
#include <vector>

namespace dgadmin {

enum class CommandKind {
    UpdateSchema,
    GetSchema,
    DropAll,
    DropData,
    GetHealth,
};

// A command and, for UpdateSchema only, the schema text it uploads.
struct Command {
    CommandKind kind = CommandKind::GetHealth;
    std::optional<std::string> schema;

    static Command update_schema(std::optional<std::string> schema);
    static Command get_schema()  { return {CommandKind::GetSchema, std::nullopt}; }
    static Command drop_all()    { return {CommandKind::DropAll, std::nullopt}; }
    static Command drop_data()   { return {CommandKind::DropData, std::nullopt}; }
    static Command get_health()  { return {CommandKind::GetHealth, std::nullopt}; }
};

// ── Admin API (Dgraph HTTP, pinned paths) ───────────────────────

namespace admin_paths {
    constexpr const char* Alter  = "/alter";
    constexpr const char* Schema = "/admin/schema";
    constexpr const char* Health = "/admin/health";
} // namespace admin_paths

constexpr const char* kSchemaContentType = "application/dql";
constexpr const char* kJsonContentType   = "application/json";

enum class HttpMethod { Get, Post };

const char* method_name(HttpMethod method);

// Fully specified request; path is relative to EndpointConfig::base_url.
struct RequestDescriptor {
    HttpMethod method = HttpMethod::Get;
    std::string path;
    std::vector<Header> headers;
    std::optional<std::string> body;

    bool operator==(const RequestDescriptor& other) const {
        return method == other.method && path == other.path &&
               headers == other.headers && body == other.body;
    }
    bool operator!=(const RequestDescriptor& other) const { return !(*this == other); }
};

// Map a command to its request. Pure; never touches the network.
// Throws ConfigurationError for UpdateSchema without a (non-empty) schema.
RequestDescriptor resolve(const Command& command, const EndpointConfig& endpoint);

// CLI name <-> kind ("update-schema", "get-schema", "drop-all", "drop-data",
// "get-health"). Unknown names yield nullopt.
std::optional<CommandKind> command_from_name(const std::string& name);
const char* command_name(CommandKind kind);

// Drops are destructive; a transport failure leaves their effect unknown.
bool is_destructive(CommandKind kind);

} // namespace dgadmin
