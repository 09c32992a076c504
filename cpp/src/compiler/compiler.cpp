/**
 * Composition Compiler Implementation
 */

#include "compiler.hpp"
#include "compiler/canvas_resolver.hpp"
#include "compiler/graph_builder.hpp"
#include "compiler/timing.hpp"

namespace vcomp {
namespace compiler {

CompositionCompiler::CompositionCompiler(const config::Defaults& defaults)
    : defaults_(defaults)
{
}

bool CompositionCompiler::requires_alpha(const scene::SceneSnapshot& scene) {
    return !scene.background || scene.background->is_transparent();
}

CompiledProgram CompositionCompiler::compile(const scene::Composition& composition,
                                             const EncoderProfile& profile,
                                             const OutputTarget& output) const {
    return compile(composition.snapshot(), profile, output);
}

CompiledProgram CompositionCompiler::compile(const scene::SceneSnapshot& scene,
                                             const EncoderProfile& profile,
                                             const OutputTarget& output) const {
    // Configuration checks come before any node is built
    bool alpha = requires_alpha(scene);
    EncoderProfileApplier applier(defaults_);
    applier.validate(profile, output, alpha);
    for (const auto& layer : scene.layers) {
        resolve_timing(layer.timing);
        layer.size.validate();
    }

    Diagnostics diagnostics(defaults_.log_diagnostics);
    CanvasResolution canvas = resolve_canvas(scene, defaults_, diagnostics);

    int frame_w = canvas.canvas.width;
    int frame_h = canvas.canvas.height;
    if (profile.kind() == EncoderKind::StackedVideo) {
        if (profile.layout() == StackLayout::Vertical) frame_h *= 2;
        else frame_w *= 2;
    }
    applier.validate_frame(profile, frame_w, frame_h);

    std::optional<double> duration = resolve_duration(scene, diagnostics);

    EncoderArgs encoder = applier.apply(profile, output);

    BuildOptions options;
    options.keep_alpha = alpha && profile.alpha_capable();
    options.audio_supported = encoder.audio_supported;
    if (profile.kind() == EncoderKind::StackedVideo) {
        options.keep_alpha = true;
        options.stacked = profile.layout();
    }

    GraphBuilder builder(canvas.canvas, defaults_, diagnostics);
    BuildResult built = builder.build(scene, options);

    CompiledProgram::Parts parts;
    parts.canvas = canvas.canvas;
    parts.inputs = built.inputs.inputs();
    parts.nodes = built.graph.nodes();
    parts.video_map = built.video_map;
    parts.audio_map = built.audio_map;
    parts.duration = duration;
    parts.encoder = encoder;
    parts.output = output;
    parts.requires_alpha = alpha;
    parts.diagnostics = diagnostics.entries();
    return CompiledProgram(std::move(parts));
}

} // namespace compiler
} // namespace vcomp
