#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace vcomp {
namespace utils {

// Shortest fixed-point text with at most 6 decimals: 5 -> "5", 0.25 -> "0.25"
std::string format_number(double value);

// Microsecond tick count as seconds text: 5000000 -> "5", 1500 -> "0.0015"
std::string format_seconds(int64_t microseconds);

// Quote one argument for a POSIX shell when needed
std::string shell_quote(const std::string& arg);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

std::string to_lower(const std::string& text);

// Lower-case extension without the dot, "" when none
std::string file_extension(const std::string& path);

} // namespace utils
} // namespace vcomp
