#pragma once

#include <string>
#include <optional>

#include "compiler/filter_graph.hpp"
#include "compiler/ingest.hpp"
#include "compiler/diagnostics.hpp"
#include "compiler/encoder_profile.hpp"
#include "config/defaults.hpp"
#include "scene/composition.hpp"

namespace vcomp {
namespace compiler {

// Inputs, nodes and stream mapping for one scene
struct BuildResult {
    InputTable inputs;
    FilterGraph graph;
    std::string video_map;                  // "[vout]" or a plain stream such as "0:v"
    std::optional<std::string> audio_map;   // absent: no audio track
};

struct BuildOptions {
    bool keep_alpha = false;                // composite in RGBA for an alpha-capable output
    bool audio_supported = true;            // the container can carry audio
    std::optional<StackLayout> stacked;     // pack color and alpha into one opaque frame
};

/**
 * Filter Graph Builder
 *
 * Lays the background down as input 0, then ingests, transforms and
 * overlays each layer in z-order, then mixes audio.
 */
class GraphBuilder {
public:
    GraphBuilder(const scene::Canvas& canvas,
                 const config::Defaults& defaults,
                 Diagnostics& diagnostics);

    BuildResult build(const scene::SceneSnapshot& scene, const BuildOptions& options);

private:
    // Returns the label of the canvas-sized base stream
    std::string add_background(const std::optional<scene::Background>& background,
                               bool keep_alpha, BuildResult& result);

    // Returns the label of the transformed layer stream
    std::string add_layer_chain(const scene::LayerState& layer, const std::string& prefix,
                                const std::string& source, BuildResult& result);

    void add_stacked_output(const std::string& composite, StackLayout layout, BuildResult& result);

    void finish_video(const std::string& label, BuildResult& result);

    void add_audio(const scene::SceneSnapshot& scene,
                   const std::vector<std::optional<std::string>>& layer_audio,
                   const BuildOptions& options, BuildResult& result);

    scene::Canvas canvas_;
    const config::Defaults& defaults_;
    Diagnostics& diagnostics_;
};

} // namespace compiler
} // namespace vcomp
