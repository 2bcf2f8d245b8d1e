#include "cli.hpp"
#include "util.hpp"

namespace dgadmin {

std::string usage_text() {
    return "Usage: dgraph-admin [options] <command> [args]\n"
           "\n"
           "Commands:\n"
           "  update-schema [FILE]   Add or modify schema (reads stdin if FILE is absent or -)\n"
           "  get-schema             Get the current schema\n"
           "  drop-all               Drop all data and schema\n"
           "  drop-data              Drop all data only (keep schema)\n"
           "  get-health             Get status of nodes\n"
           "\n"
           "Options:\n"
           "  --url URL              Dgraph URL (default: localhost:8080)\n"
           "  --auth NAME:VALUE      Auth header to include with the request\n"
           "                         (e.g. X-Dgraph-AuthToken:secret or DG-Auth:key)\n"
           "  --timeout SECS         Request timeout in seconds (default: 30)\n"
           "  --raw                  Print the server response verbatim (default)\n"
           "  --pretty               Print a human-readable summary\n"
           "  -v, --verbose          Log requests and config to stderr\n"
           "  --version              Show version\n"
           "  -h, --help             Show this help\n"
           "\n"
           "Environment variables:\n"
           "  DGRAPH_ADMIN_URL       Default for --url\n"
           "  DGRAPH_ADMIN_AUTH      Default for --auth\n"
           "  DGRAPH_ADMIN_TIMEOUT   Default for --timeout\n"
           "\n"
           "Config file: ~/.dgraph-admin/config.json (keys: url, auth, timeout)\n";
}

// Accepts "--name VALUE" and "--name=VALUE".
static bool take_value(const std::vector<std::string>& args, size_t& i,
                       const std::string& name, std::string& value) {
    const std::string& arg = args[i];
    if (arg == name) {
        if (i + 1 >= args.size())
            throw UsageError("option " + name + " requires a value");
        value = args[++i];
        return true;
    }
    if (arg.size() > name.size() && arg.compare(0, name.size(), name) == 0 &&
        arg[name.size()] == '=') {
        value = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions opts;
    std::vector<std::string> positional;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        std::string value;

        if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
            positional.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--raw") {
            opts.output = OutputMode::Raw;
        } else if (arg == "--pretty") {
            opts.output = OutputMode::Pretty;
        } else if (take_value(args, i, "--url", value)) {
            opts.url = value;
        } else if (take_value(args, i, "--auth", value)) {
            opts.auth = value;
        } else if (take_value(args, i, "--timeout", value)) {
            auto secs = parse_unsigned(value);
            if (!secs || *secs == 0)
                throw UsageError("--timeout must be a positive number of seconds, got '" +
                                 value + "'");
            opts.timeout_seconds = *secs;
        } else {
            throw UsageError("unknown option: " + arg);
        }
    }

    if (opts.show_help || opts.show_version) return opts;

    if (positional.empty())
        throw UsageError("no command given");

    auto kind = command_from_name(positional[0]);
    if (!kind)
        throw UsageError("unknown command: " + positional[0]);
    opts.command = *kind;

    size_t max_args = (*kind == CommandKind::UpdateSchema) ? 1 : 0;
    if (positional.size() - 1 > max_args)
        throw UsageError("unexpected argument for " + positional[0] + ": " +
                         positional[1 + max_args]);
    if (*kind == CommandKind::UpdateSchema && positional.size() == 2)
        opts.schema_file = positional[1];

    return opts;
}

CliOptions parse_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) args.emplace_back(argv[i]);
    return parse_args(args);
}

} // namespace dgadmin
