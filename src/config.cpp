#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>

namespace dgadmin {

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        notes.push_back("config root is not an object, ignoring");
        return;
    }
    if (j.contains("url") && j["url"].is_string())
        url = j["url"].get<std::string>();
    if (j.contains("auth") && j["auth"].is_string())
        auth = j["auth"].get<std::string>();
    if (j.contains("timeout") && j["timeout"].is_number_unsigned())
        timeout_seconds = j["timeout"].get<uint64_t>();
}

void Config::apply_env() {
    if (const char* v = std::getenv("DGRAPH_ADMIN_URL"))
        url = v;
    if (const char* v = std::getenv("DGRAPH_ADMIN_AUTH"))
        auth = std::string(v);
    if (const char* v = std::getenv("DGRAPH_ADMIN_TIMEOUT")) {
        auto secs = parse_unsigned(v);
        if (secs) {
            set_timeout(*secs);
        } else {
            timeout_error = std::string("DGRAPH_ADMIN_TIMEOUT must be a "
                                        "whole number of seconds, got '") + v + "'";
            notes.push_back(*timeout_error);
        }
    }
}

void Config::set_timeout(uint64_t seconds) {
    timeout_seconds = seconds;
    timeout_error.reset();
}

Config Config::load_from(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            cfg.apply_json(nlohmann::json::parse(file));
            cfg.notes.push_back("Loaded " + path);
        } catch (const nlohmann::json::parse_error& e) {
            // Malformed file: keep defaults
            cfg.notes.push_back("Ignoring malformed " + path + ": " + e.what());
        }
    }

    cfg.apply_env();
    return cfg;
}

Config Config::load() {
    return load_from(expand_home(kConfigPath));
}

} // namespace dgadmin
