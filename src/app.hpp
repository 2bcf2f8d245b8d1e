#pragma once
#include "cli.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iosfwd>

namespace dgadmin {

// Settings after CLI flags are laid over the loaded config.
Config merge_options(Config config, const CliOptions& opts);

// One invocation: build the endpoint, read the schema if needed, resolve,
// execute and report. Returns the process exit code. Never throws for
// configuration problems (they become kExitUsage).
int run(const CliOptions& opts, const Config& config, HttpClient& http,
        std::istream& in, std::ostream& out, std::ostream& err);

} // namespace dgadmin
