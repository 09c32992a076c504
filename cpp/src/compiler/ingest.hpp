#pragma once

#include <string>
#include <vector>
#include <optional>

#include "compiler/filter_graph.hpp"
#include "scene/foreground.hpp"

namespace vcomp {
namespace compiler {

// Engine inputs in first-referenced order
class InputTable {
public:
    // Returns the input index
    int add(const InputSpec& input);

    const std::vector<InputSpec>& inputs() const { return inputs_; }
    size_t size() const { return inputs_.size(); }

private:
    std::vector<InputSpec> inputs_;
};

struct IngestOptions {
    int mask_threshold = 128;   // 0 keeps the mask's grey levels
};

// Label of the RGBA stream and, when present, the source's audio stream
struct IngestResult {
    std::string video;
    std::optional<std::string> audio;
};

// "-ss S -t D" for a trimmed source, empty otherwise
std::vector<std::string> trim_options(const std::optional<scene::SourceTrim>& trim);

/**
 * Append the inputs and nodes that turn one foreground into an RGBA stream
 *
 * Every label it creates starts with prefix. With alpha disabled the
 * stream is made opaque and only the color part is read.
 */
IngestResult plan_ingest(const scene::Foreground& source,
                         bool alpha_enabled,
                         const std::string& prefix,
                         const IngestOptions& options,
                         InputTable& inputs,
                         FilterGraph& graph);

} // namespace compiler
} // namespace vcomp
