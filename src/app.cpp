#include "app.hpp"
#include "command.hpp"
#include "executor.hpp"
#include "report.hpp"
#include "util.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace dgadmin {

Config merge_options(Config config, const CliOptions& opts) {
    if (opts.url) config.url = *opts.url;
    if (opts.auth) config.auth = *opts.auth;
    if (opts.timeout_seconds) config.set_timeout(*opts.timeout_seconds);
    return config;
}

static std::string read_schema(const CliOptions& opts, std::istream& in) {
    if (!opts.schema_file || *opts.schema_file == "-")
        return read_all(in);
    auto content = read_file(*opts.schema_file);
    if (!content)
        throw ConfigurationError("cannot read schema file: " + *opts.schema_file);
    return *content;
}

static void log_request(std::ostream& err, const RequestDescriptor& desc,
                        const EndpointConfig& endpoint) {
    err << "[http] " << method_name(desc.method) << " "
        << endpoint.base_url << desc.path;
    if (desc.body) err << " (" << desc.body->size() << " bytes)";
    err << "\n";
    for (const auto& h : desc.headers) {
        bool secret = endpoint.auth && h.first == endpoint.auth->name;
        err << "[http]   " << h.first << ": " << (secret ? "<redacted>" : h.second) << "\n";
    }
}

int run(const CliOptions& opts, const Config& loaded, HttpClient& http,
        std::istream& in, std::ostream& out, std::ostream& err) {
    Config config = merge_options(loaded, opts);
    if (opts.verbose) {
        for (const auto& note : config.notes)
            err << "[config] " << note << "\n";
    }

    RequestDescriptor desc;
    EndpointConfig endpoint;
    try {
        if (config.timeout_error)
            throw ConfigurationError(*config.timeout_error);
        if (config.timeout_seconds == 0 ||
            config.timeout_seconds > static_cast<uint64_t>(kMaxTimeoutSeconds))
            throw ConfigurationError("timeout must be between 1 and " +
                                     std::to_string(kMaxTimeoutSeconds) + " seconds");
        endpoint = EndpointConfig::make(config.url, config.auth);

        Command command{opts.command, std::nullopt};
        if (opts.command == CommandKind::UpdateSchema)
            command = Command::update_schema(read_schema(opts, in));
        desc = resolve(command, endpoint);
    } catch (const ConfigurationError& e) {
        err << "Error: " << e.what() << "\n";
        return kExitUsage;
    }

    if (opts.verbose) log_request(err, desc, endpoint);

    Outcome outcome = execute(desc, endpoint, http,
                              static_cast<long>(config.timeout_seconds));

    if (opts.verbose) {
        if (outcome.kind == OutcomeKind::TransportError)
            err << "[http] no response\n";
        else if (outcome.ok())
            err << "[http] success, " << outcome.body.size() << " bytes\n";
        else
            err << "[http] HTTP " << outcome.status_code << ", "
                << outcome.body.size() << " bytes\n";
    }

    return report_outcome(outcome, opts.command, opts.output, out, err);
}

} // namespace dgadmin
