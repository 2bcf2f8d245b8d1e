#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace dgadmin {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Whole file contents, or nullopt if it can't be opened
std::optional<std::string> read_file(const std::string& path);

// Everything remaining on the stream
std::string read_all(std::istream& in);

// Strict base-10 unsigned parse ("30" ok; "", "-1", "3s", overflow rejected)
std::optional<uint64_t> parse_unsigned(const std::string& s);

// Human-readable duration: 3723 -> "1h 2m 3s", 90061 -> "1day 1h 1m 1s",
// 31557600 -> "1year". Months are 30.44 days, years 365.25 days.
std::string format_duration(uint64_t seconds);

} // namespace dgadmin
