#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstddef>

#include "compiler/program.hpp"

namespace vcomp {
namespace pipeline {

/**
 * Progress callback type
 * Parameters: seconds rendered, total seconds (0 if unknown), speed factor
 */
using ProgressCallback = std::function<void(double, double, double)>;

// Receives the engine's stdout when the program writes to a pipe
using OutputCallback = std::function<void(const char*, size_t)>;

struct EngineResult {
    int exit_code = -1;
    std::string diagnostics;    // engine stderr, verbatim
    bool cancelled = false;
    bool timed_out = false;
    double elapsed = 0.0;
};

/**
 * Engine Runner
 *
 * Runs one compiled program as one engine child process and waits for it.
 * Cancellation (process-wide cancel flag) and the timeout only ever affect
 * that child.
 */
class EngineRunner {
public:
    explicit EngineRunner(const std::string& engine_path);

    void set_progress_callback(ProgressCallback callback);
    void set_output_callback(OutputCallback callback);

    // Seconds; 0 waits forever
    void set_timeout(double seconds);

    // Runs to completion and reports; does not throw on engine failure
    EngineResult run(const compiler::CompiledProgram& program);

    // Runs and throws EngineError on a non-zero exit, CompositionError on cancel/timeout
    void render(const compiler::CompiledProgram& program);

    // Parse "time=00:01:02.50" and "speed=1.5x" from an engine status line
    static bool parse_progress(const std::string& line, double* seconds, double* speed);

private:
    EngineResult execute(const std::vector<std::string>& argv, double total);

    std::string engine_path_;
    ProgressCallback progress_callback_;
    OutputCallback output_callback_;
    double timeout_;
};

} // namespace pipeline
} // namespace vcomp
