#pragma once

#include <optional>

#include "scene/composition.hpp"
#include "compiler/diagnostics.hpp"
#include "config/defaults.hpp"

namespace vcomp {
namespace compiler {

enum class CanvasSource { Explicit, Background, LayerBounds };

struct CanvasResolution {
    scene::Canvas canvas;
    CanvasSource source = CanvasSource::Explicit;
};

const char* to_string(CanvasSource source);

/**
 * Decide the output canvas
 *
 * Explicit canvas, then the background's intrinsic size, then the
 * bounding box of all layers at the default rate (with a warning).
 * Throws ResolutionError when nothing can size the canvas.
 */
CanvasResolution resolve_canvas(const scene::SceneSnapshot& scene,
                                const config::Defaults& defaults,
                                Diagnostics& diagnostics);

/**
 * Decide the output duration in seconds
 *
 * Explicit duration, then a video background, then the longest layer.
 * Returns nullopt when the inputs end on their own; throws ResolutionError
 * when the background never ends and nothing bounds the output.
 */
std::optional<double> resolve_duration(const scene::SceneSnapshot& scene,
                                       Diagnostics& diagnostics);

} // namespace compiler
} // namespace vcomp
