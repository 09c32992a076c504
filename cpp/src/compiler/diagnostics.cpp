#include "diagnostics.hpp"

#include <cstdio>

namespace vcomp {
namespace compiler {

void Diagnostics::note(const std::string& stage, const std::string& message) {
    record(Diagnostic::Level::Note, stage, message);
}

void Diagnostics::warn(const std::string& stage, const std::string& message) {
    record(Diagnostic::Level::Warning, stage, message);
}

void Diagnostics::record(Diagnostic::Level level, const std::string& stage, const std::string& message) {
    entries_.push_back(Diagnostic{level, stage, message});
    if (echo_) {
        if (level == Diagnostic::Level::Warning) {
            fprintf(stderr, "[%s] Warning: %s\n", stage.c_str(), message.c_str());
        } else {
            fprintf(stderr, "[%s] %s\n", stage.c_str(), message.c_str());
        }
    }
}

const char* to_string(Diagnostic::Level level) {
    return level == Diagnostic::Level::Warning ? "warning" : "note";
}

} // namespace compiler
} // namespace vcomp
