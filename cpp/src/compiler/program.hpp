#pragma once

#include <string>
#include <vector>
#include <optional>

#include "compiler/filter_graph.hpp"
#include "compiler/diagnostics.hpp"
#include "compiler/encoder_profile.hpp"
#include "scene/types.hpp"

namespace Json {
class Value;
}

namespace vcomp {
namespace compiler {

/**
 * Compiled engine program
 *
 * Immutable once emitted. Holds everything needed to run the engine or to
 * inspect the plan without running it.
 */
class CompiledProgram {
public:
    struct Parts {
        scene::Canvas canvas;
        std::vector<InputSpec> inputs;
        std::vector<FilterNode> nodes;
        std::string video_map;
        std::optional<std::string> audio_map;
        std::optional<double> duration;
        EncoderArgs encoder;
        OutputTarget output;
        bool requires_alpha = false;
        std::vector<Diagnostic> diagnostics;
    };

    explicit CompiledProgram(Parts parts);

    const scene::Canvas& canvas() const { return parts_.canvas; }
    const std::vector<InputSpec>& inputs() const { return parts_.inputs; }
    const std::vector<FilterNode>& nodes() const { return parts_.nodes; }
    const std::string& video_map() const { return parts_.video_map; }
    const std::optional<std::string>& audio_map() const { return parts_.audio_map; }
    const std::optional<double>& duration() const { return parts_.duration; }
    const OutputTarget& output() const { return parts_.output; }
    bool requires_alpha() const { return parts_.requires_alpha; }
    const std::vector<Diagnostic>& diagnostics() const { return parts_.diagnostics; }

    // Nodes with the given operation, in graph order
    std::vector<FilterNode> nodes_named(const std::string& operation) const;

    // Engine filter-graph text; empty when no filtering is needed
    std::string filter_graph() const;

    // Everything after the engine binary
    std::vector<std::string> arguments() const;

    std::vector<std::string> argv(const std::string& engine) const;

    // Copy-pasteable shell command
    std::string command_line(const std::string& engine) const;

    // Structured dry-run description
    void json_summary(Json::Value& root) const;

    bool operator==(const CompiledProgram& other) const;
    bool operator!=(const CompiledProgram& other) const { return !(*this == other); }

private:
    Parts parts_;
};

} // namespace compiler
} // namespace vcomp
