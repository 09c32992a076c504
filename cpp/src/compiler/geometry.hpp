#pragma once

#include <string>
#include <optional>

#include "scene/types.hpp"
#include "scene/layer.hpp"

namespace vcomp {
namespace compiler {

/**
 * Scale operation for one layer
 *
 * Dimensions are engine expressions ("1920", "iw*0.5", "-2").
 */
struct ScaleTarget {
    enum class Aspect { Exact, Decrease, Increase };

    std::string width;
    std::string height;
    Aspect aspect = Aspect::Exact;

    // "1920:1080:force_original_aspect_ratio=decrease"
    std::string params() const;
};

// Overlay position expressions over W,H (canvas) and w,h (overlaid frame)
struct Position {
    std::string x;
    std::string y;
};

// Scale to apply for a size mode on a known canvas; nullopt when the source passes unscaled
std::optional<ScaleTarget> resolve_scale(const scene::SizeSpec& size, const scene::Canvas& canvas);

// Pixel size after scaling on a known canvas
scene::Size target_size(const scene::SizeSpec& size, scene::Size source, const scene::Canvas& canvas);

// Pixel size without a canvas; canvas-relative modes keep the source size
scene::Size natural_size(const scene::SizeSpec& size, scene::Size source);

// Bounding box of a w x h frame rotated by degrees
scene::Size rotated_bounds(scene::Size size, double degrees);

// Size of the cropped source picture feeding the scale
scene::Size cropped_source(const scene::LayerState& layer);

// Overlay x/y for a layer placed on the canvas
Position resolve_position(const scene::LayerState& layer, const scene::Canvas& canvas);

// Concrete rectangle the layer occupies on the canvas
scene::Rect layer_rect(const scene::LayerState& layer, const scene::Canvas& canvas);

// Append a signed pixel offset: ("W-w", -10) -> "W-w-10"
std::string with_offset(const std::string& base, int offset);

// Parse with the engine's expression evaluator against the overlay variables
bool check_position_expression(const std::string& expr, std::string* error);

} // namespace compiler
} // namespace vcomp
