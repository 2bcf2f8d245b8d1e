#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <istream>
#include <limits>

namespace dgadmin {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return read_all(file);
}

std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

std::optional<uint64_t> parse_unsigned(const std::string& s) {
    if (s.empty()) return std::nullopt;
    uint64_t value = 0;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return std::nullopt;
        uint64_t digit = c - '0';
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

static void append_unit(std::string& out, uint64_t n, const char* unit, bool plural) {
    if (n == 0) return;
    if (!out.empty()) out += ' ';
    out += std::to_string(n) + unit;
    if (plural && n > 1) out += 's';
}

// Calendar-average units: a year is 365.25 days, a month a twelfth of that.
constexpr uint64_t kSecondsPerYear  = 31557600;
constexpr uint64_t kSecondsPerMonth = 2630016;
constexpr uint64_t kSecondsPerDay   = 86400;

std::string format_duration(uint64_t seconds) {
    if (seconds == 0) return "0s";
    uint64_t years = seconds / kSecondsPerYear;
    uint64_t rest = seconds % kSecondsPerYear;
    uint64_t months = rest / kSecondsPerMonth;
    rest %= kSecondsPerMonth;
    uint64_t days = rest / kSecondsPerDay;
    rest %= kSecondsPerDay;

    std::string out;
    append_unit(out, years, "year", true);
    append_unit(out, months, "month", true);
    append_unit(out, days, "day", true);
    append_unit(out, rest / 3600, "h", false);
    append_unit(out, rest / 60 % 60, "m", false);
    append_unit(out, rest % 60, "s", false);
    return out;
}

} // namespace dgadmin
