#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace dgadmin {

// Invalid local input (bad URL, malformed auth string, empty schema...).
// Always raised before any network activity.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Dgraph alpha's HTTP port on loopback.
constexpr const char* kDefaultUrl = "localhost:8080";

constexpr long kDefaultTimeoutSeconds = 30;
constexpr long kMaxTimeoutSeconds = 86400;

struct AuthHeader {
    std::string name;
    std::string value;
};

// Where requests go and which header authenticates them. Built once per
// invocation; read-only afterwards.
struct EndpointConfig {
    std::string base_url; // scheme://host[:port], never a trailing slash
    std::optional<AuthHeader> auth;

    // Normalizes url (empty = kDefaultUrl) and splits auth ("Name:Value").
    // Throws ConfigurationError on invalid input.
    static EndpointConfig make(const std::string& url,
                               const std::optional<std::string>& auth);
};

// Adds "http://" when no scheme is given and drops any path, query or
// fragment: "localhost:8080/graphql" -> "http://localhost:8080".
std::string normalize_base_url(const std::string& url);

// Split on the first ':' into header name and value (value kept verbatim).
AuthHeader parse_auth_header(const std::string& auth);

} // namespace dgadmin
