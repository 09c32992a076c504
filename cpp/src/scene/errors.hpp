#pragma once

#include <stdexcept>
#include <string>

namespace vcomp {

/**
 * Base of every failure raised while describing or compiling a scene.
 */
class CompositionError : public std::runtime_error {
public:
    explicit CompositionError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

// Invalid declaration: timing, size mode, stacked layout, encoder/container...
class ConfigurationError : public CompositionError {
public:
    explicit ConfigurationError(const std::string& message)
        : CompositionError(message)
    {
    }
};

// Canvas or output duration cannot be determined from the scene
class ResolutionError : public CompositionError {
public:
    explicit ResolutionError(const std::string& message)
        : CompositionError(message)
    {
    }
};

/**
 * Media engine exited with a non-zero status.
 *
 * Carries the engine's diagnostic output verbatim.
 */
class EngineError : public CompositionError {
public:
    EngineError(int exit_code, const std::string& diagnostics)
        : CompositionError("media engine exited with status " + std::to_string(exit_code))
        , exit_code_(exit_code)
        , diagnostics_(diagnostics)
    {
    }

    int exit_code() const { return exit_code_; }
    const std::string& diagnostics() const { return diagnostics_; }

private:
    int exit_code_;
    std::string diagnostics_;
};

} // namespace vcomp
