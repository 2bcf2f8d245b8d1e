#pragma once
#include "command.hpp"
#include "executor.hpp"
#include <iosfwd>
#include <string>

namespace dgadmin {

enum class OutputMode {
    Raw,    // response body verbatim
    Pretty, // per-command human summary
};

// Process exit codes
constexpr int kExitSuccess          = 0;
constexpr int kExitApplicationError = 1; // server answered non-2xx
constexpr int kExitUsage            = 2; // bad arguments or configuration
constexpr int kExitTransportError   = 3; // no response; remote state unknown

int exit_code_for(const Outcome& outcome);

// "<address> is <status>, uptime: <duration>" per node. Accepts the node
// list or a single node object; returns the body unchanged otherwise,
// including when any node lacks a string address or status.
std::string render_health(const std::string& body);

// Schema text trimmed, or "no schema" when null/empty.
std::string render_schema(const std::string& body);

// True for the alter reply {"data":{"code":"Success",...}} with no "errors".
bool is_alter_success(const std::string& body);

// Text printed to stdout for a successful command. In pretty mode a body
// that doesn't have the expected shape is printed as-is.
std::string render_success(CommandKind command, const std::string& body,
                           OutputMode mode);

// Print the outcome (stdout for success, stderr otherwise) and return the
// exit code.
int report_outcome(const Outcome& outcome, CommandKind command, OutputMode mode,
                   std::ostream& out, std::ostream& err);

} // namespace dgadmin
