#pragma once

#include <string>
#include <vector>

namespace vcomp {
namespace compiler {

struct Diagnostic {
    enum class Level { Note, Warning };

    Level level;
    std::string stage;      // "Canvas", "Audio", "Encoder"...
    std::string message;

    bool operator==(const Diagnostic& other) const {
        return level == other.level && stage == other.stage && message == other.message;
    }
};

/**
 * Diagnostics collected during one compilation
 *
 * Optionally echoed to stderr as they are recorded.
 */
class Diagnostics {
public:
    explicit Diagnostics(bool echo = false)
        : echo_(echo)
    {
    }

    void note(const std::string& stage, const std::string& message);
    void warn(const std::string& stage, const std::string& message);

    const std::vector<Diagnostic>& entries() const { return entries_; }

private:
    void record(Diagnostic::Level level, const std::string& stage, const std::string& message);

    bool echo_;
    std::vector<Diagnostic> entries_;
};

const char* to_string(Diagnostic::Level level);

} // namespace compiler
} // namespace vcomp
