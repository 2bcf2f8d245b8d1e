#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "endpoint.hpp"

namespace dgadmin {

// Connection settings before validation. Precedence, lowest first:
// defaults < ~/.dgraph-admin/config.json < DGRAPH_ADMIN_* env < CLI flags.
struct Config {
    std::string url = kDefaultUrl;
    std::optional<std::string> auth;
    uint64_t timeout_seconds = kDefaultTimeoutSeconds;

    // Diagnostics collected while loading ([config] lines, shown with -v)
    std::vector<std::string> notes;

    // Set when DGRAPH_ADMIN_TIMEOUT is not a number. Reported as a
    // configuration error unless --timeout replaces it.
    std::optional<std::string> timeout_error;

    // Load from ~/.dgraph-admin/config.json + env vars. Never writes.
    static Config load();

    // Load from an explicit path + env vars (used by load() and tests)
    static Config load_from(const std::string& path);

    // Apply recognised keys from a parsed config object; wrong types are skipped
    void apply_json(const nlohmann::json& j);

    // Apply DGRAPH_ADMIN_URL / DGRAPH_ADMIN_AUTH / DGRAPH_ADMIN_TIMEOUT
    void apply_env();

    // Override the timeout (e.g. from --timeout), clearing any env error
    void set_timeout(uint64_t seconds);
};

constexpr const char* kConfigPath = "~/.dgraph-admin/config.json";

} // namespace dgadmin
