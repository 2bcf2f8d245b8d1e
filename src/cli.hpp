#pragma once
#include "command.hpp"
#include "report.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef DGADMIN_VERSION
#define DGADMIN_VERSION "0.1.0"
#endif

namespace dgadmin {

// Bad command line: unknown option or command, missing value, stray argument.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::optional<std::string> url;
    std::optional<std::string> auth;
    std::optional<uint64_t> timeout_seconds;
    OutputMode output = OutputMode::Raw;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;

    CommandKind command = CommandKind::GetHealth;
    std::optional<std::string> schema_file; // update-schema only; "-" = stdin
};

// Options may appear before or after the command; "--" ends option parsing.
// Throws UsageError. With --help/--version no command is required.
CliOptions parse_args(const std::vector<std::string>& args);
CliOptions parse_args(int argc, char* argv[]);

std::string usage_text();

} // namespace dgadmin
