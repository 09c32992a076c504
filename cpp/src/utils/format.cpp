/**
 * Text formatting helpers for emitted programs
 */

#include "format.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace vcomp {
namespace utils {

std::string format_number(double value) {
    if (std::fabs(value) < 5e-7) return "0";

    char buf[64];
    snprintf(buf, sizeof(buf), "%.6f", value);

    std::string text(buf);
    size_t dot = text.find('.');
    if (dot != std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    return text;
}

std::string format_seconds(int64_t microseconds) {
    bool negative = microseconds < 0;
    uint64_t magnitude = negative ? static_cast<uint64_t>(-microseconds)
                                  : static_cast<uint64_t>(microseconds);

    std::string text = std::to_string(magnitude / 1000000);
    uint64_t frac = magnitude % 1000000;
    if (frac != 0) {
        char buf[8];
        snprintf(buf, sizeof(buf), "%06llu", static_cast<unsigned long long>(frac));
        std::string digits(buf);
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        text += "." + digits;
    }
    return negative ? "-" + text : text;
}

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) return "''";

    bool safe = true;
    for (char c : arg) {
        bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                     (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                     c == '.' || c == '/' || c == ':' || c == '=' ||
                     c == ',' || c == '+' || c == '%' || c == '@';
        if (!plain) {
            safe = false;
            break;
        }
    }
    if (safe) return arg;

    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::string to_lower(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::string file_extension(const std::string& path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return to_lower(path.substr(dot + 1));
}

} // namespace utils
} // namespace vcomp
