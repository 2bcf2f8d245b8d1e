#include "endpoint.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>

namespace dgadmin {

static bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

static bool has_control_chars(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) {
        return c < 0x20 && c != '\t';
    });
}

std::string normalize_base_url(const std::string& raw) {
    std::string url = trim(raw);
    if (url.empty())
        throw ConfigurationError("URL must not be empty");

    std::string scheme = "http";
    std::string rest = url;
    size_t sep = url.find("://");
    if (sep != std::string::npos) {
        scheme = to_lower(url.substr(0, sep));
        rest = url.substr(sep + 3);
        if (scheme != "http" && scheme != "https")
            throw ConfigurationError("unsupported URL scheme '" + scheme +
                                     "' (expected http or https): " + raw);
    }

    std::string authority = rest.substr(0, rest.find_first_of("/?#"));
    if (authority.find('@') != std::string::npos)
        throw ConfigurationError("credentials in URL are not supported, use --auth: " + raw);

    std::string host;
    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        // IPv6 literal: [::1]:8080
        size_t close = authority.find(']');
        if (close == std::string::npos)
            throw ConfigurationError("invalid IPv6 address in URL: " + raw);
        host = authority.substr(0, close + 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':')
                throw ConfigurationError("invalid URL: " + raw);
            port = tail.substr(1);
            if (port.empty())
                throw ConfigurationError("invalid port in URL: " + raw);
        }
    } else {
        size_t colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port = authority.substr(colon + 1);
            if (port.empty())
                throw ConfigurationError("invalid port in URL: " + raw);
        }
    }

    if (host.empty() || host == "[]")
        throw ConfigurationError("URL has no host: " + raw);
    if (has_control_chars(host) || host.find(' ') != std::string::npos)
        throw ConfigurationError("invalid host in URL: " + raw);

    if (!port.empty()) {
        if (!is_digits(port) || port.size() > 5)
            throw ConfigurationError("invalid port in URL: " + raw);
        int p = std::stoi(port);
        if (p <= 0 || p > 65535)
            throw ConfigurationError("port out of range in URL: " + raw);
        return scheme + "://" + to_lower(host) + ":" + port;
    }
    return scheme + "://" + to_lower(host);
}

AuthHeader parse_auth_header(const std::string& auth) {
    size_t colon = auth.find(':');
    if (colon == std::string::npos)
        throw ConfigurationError("auth header must be in Name:Value form, got '" +
                                 auth + "'");

    AuthHeader header{auth.substr(0, colon), auth.substr(colon + 1)};
    if (header.name.empty())
        throw ConfigurationError("auth header name must not be empty");

    // RFC 7230 token: no whitespace or separators in a field name
    for (unsigned char c : header.name) {
        if (c <= 0x20 || c >= 0x7f || std::string("()<>@,;:\\\"/[]?={}").find(
                static_cast<char>(c)) != std::string::npos)
            throw ConfigurationError("invalid character in auth header name '" +
                                     header.name + "'");
    }
    // Headers the transport writes itself
    static const char* const kReserved[] = {
        "host", "content-length", "content-type", "connection", "transfer-encoding",
    };
    std::string lowered = to_lower(header.name);
    for (const char* reserved : kReserved) {
        if (lowered == reserved)
            throw ConfigurationError("auth header name '" + header.name +
                                     "' is reserved for the request itself");
    }
    if (has_control_chars(header.value))
        throw ConfigurationError("auth header value must not contain control characters");
    return header;
}

EndpointConfig EndpointConfig::make(const std::string& url,
                                    const std::optional<std::string>& auth) {
    EndpointConfig cfg;
    cfg.base_url = normalize_base_url(url.empty() ? kDefaultUrl : url);
    if (auth) cfg.auth = parse_auth_header(*auth);
    return cfg;
}

} // namespace dgadmin
