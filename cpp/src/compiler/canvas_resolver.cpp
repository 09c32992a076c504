/**
 * Canvas Resolver Implementation
 */

#include "canvas_resolver.hpp"
#include "compiler/geometry.hpp"
#include "compiler/timing.hpp"
#include "scene/errors.hpp"
#include "utils/format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace vcomp {
namespace compiler {

namespace {

int round_up_even(double value) {
    int n = static_cast<int>(std::ceil(value - 1e-9));
    if (n < 2) n = 2;
    if (n % 2 != 0) n++;
    return n;
}

} // namespace

const char* to_string(CanvasSource source) {
    switch (source) {
    case CanvasSource::Explicit: return "explicit";
    case CanvasSource::Background: return "background";
    case CanvasSource::LayerBounds: return "layer-bounds";
    }
    return "explicit";
}

CanvasResolution resolve_canvas(const scene::SceneSnapshot& scene,
                                const config::Defaults& defaults,
                                Diagnostics& diagnostics) {
    if (scene.canvas) {
        return CanvasResolution{*scene.canvas, CanvasSource::Explicit};
    }

    if (scene.background && scene.background->has_intrinsic_size()) {
        const scene::BackgroundSource& source = scene.background->source();
        scene::FrameRate fps = defaults.image_fps;
        if (const auto* clip = std::get_if<scene::VideoClip>(&source)) {
            fps = clip->media.fps;
        }
        scene::Canvas canvas{scene.background->width(), scene.background->height(), fps};
        return CanvasResolution{canvas, CanvasSource::Background};
    }

    if (scene.layers.empty()) {
        throw ResolutionError("cannot determine the canvas: no explicit canvas, "
                              "no sized background and no layers");
    }

    double width = 0.0;
    double height = 0.0;
    for (const auto& layer : scene.layers) {
        scene::Size natural = natural_size(layer.size, cropped_source(layer));
        scene::Size placed = rotated_bounds(natural, layer.rotation);
        double dx = layer.placement.custom() ? 0.0 : std::abs(layer.placement.dx);
        double dy = layer.placement.custom() ? 0.0 : std::abs(layer.placement.dy);
        width = std::max(width, placed.width + dx);
        height = std::max(height, placed.height + dy);
    }

    scene::Canvas canvas{round_up_even(width), round_up_even(height), defaults.fps};
    diagnostics.warn("Canvas", "no canvas or sized background; using layer bounding box " +
                     std::to_string(canvas.width) + "x" + std::to_string(canvas.height) +
                     " @ " + canvas.fps.to_string() + " fps");
    return CanvasResolution{canvas, CanvasSource::LayerBounds};
}

std::optional<double> resolve_duration(const scene::SceneSnapshot& scene,
                                       Diagnostics& diagnostics) {
    if (scene.duration) return scene.duration;

    if (scene.background) {
        std::optional<double> bg = scene.background->duration();
        if (bg) return bg;
    }

    std::optional<double> longest;
    for (const auto& layer : scene.layers) {
        TimeWindow window = resolve_timing(layer.timing);
        std::optional<double> extent = window.end();
        if (!extent && layer.source.duration() > 0.0) {
            extent = window.start() + layer.source.duration();
        }
        if (extent && (!longest || *extent > *longest)) longest = extent;
    }
    if (longest) {
        diagnostics.note("Duration", "output length follows the longest layer: " +
                         utils::format_number(*longest) + "s");
        return longest;
    }

    bool endless_background = !scene.background ||
        !std::holds_alternative<scene::VideoClip>(scene.background->source());
    if (endless_background) {
        throw ResolutionError("cannot determine the output duration: the background never "
                              "ends and no layer or composition duration bounds it");
    }
    return std::nullopt;
}

} // namespace compiler
} // namespace vcomp
