/**
 * Geometry Resolver Implementation
 */

#include "geometry.hpp"
#include "utils/format.hpp"

extern "C" {
#include <libavutil/eval.h>
#include <libavutil/error.h>
}

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace vcomp {
namespace compiler {

namespace {

// Variables the overlay filter exposes to its x/y expressions
const char* const kOverlayVars[] = {
    "main_w", "W", "main_h", "H",
    "overlay_w", "w", "overlay_h", "h",
    "hsub", "vsub", "x", "y", "n", "pos", "t",
    nullptr
};

constexpr double kPi = 3.14159265358979323846;

enum class Align { Start, Middle, End };

Align horizontal(scene::Anchor anchor) {
    switch (anchor) {
    case scene::Anchor::TopLeft:
    case scene::Anchor::CenterLeft:
    case scene::Anchor::BottomLeft:
        return Align::Start;
    case scene::Anchor::TopRight:
    case scene::Anchor::CenterRight:
    case scene::Anchor::BottomRight:
        return Align::End;
    default:
        return Align::Middle;
    }
}

Align vertical(scene::Anchor anchor) {
    switch (anchor) {
    case scene::Anchor::TopLeft:
    case scene::Anchor::TopCenter:
    case scene::Anchor::TopRight:
        return Align::Start;
    case scene::Anchor::BottomLeft:
    case scene::Anchor::BottomCenter:
    case scene::Anchor::BottomRight:
        return Align::End;
    default:
        return Align::Middle;
    }
}

// Anchor expression along one axis: "0", "(W-w)/2", "W-w"
std::string axis_expr(Align align, const char* outer, const char* inner) {
    switch (align) {
    case Align::Start:
        return "0";
    case Align::Middle:
        return std::string("(") + outer + "-" + inner + ")/2";
    case Align::End:
        return std::string(outer) + "-" + inner;
    }
    return "0";
}

double axis_value(Align align, double outer, double inner) {
    switch (align) {
    case Align::Start:
        return 0.0;
    case Align::Middle:
        return (outer - inner) / 2.0;
    case Align::End:
        return outer - inner;
    }
    return 0.0;
}

// Alignment of the frame inside a box at a fixed canvas offset
std::string box_expr(Align align, double box_origin, double box_extent, const char* inner) {
    std::string origin = utils::format_number(box_origin);
    std::string extent = utils::format_number(box_extent);
    std::string rel;
    switch (align) {
    case Align::Start:
        return origin;
    case Align::Middle:
        rel = "(" + extent + "-" + inner + ")/2";
        break;
    case Align::End:
        rel = extent + "-" + inner;
        break;
    }
    if (box_origin == 0.0) return rel;
    return origin + "+" + rel;
}

scene::Size percent_box(const scene::SizeSpec& size, const scene::Canvas& canvas) {
    double wp = size.percent.value_or(100.0);
    double hp = size.height_percent.value_or(wp);
    // scale reads 0 as "keep input size", so the box never collapses below a pixel
    return scene::Size{std::max(1.0, std::round(canvas.width * wp / 100.0)),
                       std::max(1.0, std::round(canvas.height * hp / 100.0))};
}

scene::Size fit(scene::Size source, scene::Size box, bool grow) {
    if (source.width <= 0.0 || source.height <= 0.0) return box;
    double sx = box.width / source.width;
    double sy = box.height / source.height;
    double s = grow ? std::max(sx, sy) : std::min(sx, sy);
    return scene::Size{source.width * s, source.height * s};
}

bool eval_expr(const std::string& expr, double canvas_w, double canvas_h,
               double w, double h, double* out) {
    const double values[] = {
        canvas_w, canvas_w, canvas_h, canvas_h,
        w, w, h, h,
        1.0, 1.0, NAN, NAN, 0.0, NAN, 0.0
    };
    int ret = av_expr_parse_and_eval(out, expr.c_str(), kOverlayVars, values,
                                     nullptr, nullptr, nullptr, nullptr,
                                     nullptr, 0, nullptr);
    return ret >= 0 && std::isfinite(*out);
}

} // namespace

std::string ScaleTarget::params() const {
    std::string out = width + ":" + height;
    if (aspect == Aspect::Decrease) out += ":force_original_aspect_ratio=decrease";
    else if (aspect == Aspect::Increase) out += ":force_original_aspect_ratio=increase";
    return out;
}

std::optional<ScaleTarget> resolve_scale(const scene::SizeSpec& size, const scene::Canvas& canvas) {
    ScaleTarget target;
    std::string cw = std::to_string(canvas.width);
    std::string ch = std::to_string(canvas.height);

    switch (size.mode) {
    case scene::SizeMode::Contain:
        target = ScaleTarget{cw, ch, ScaleTarget::Aspect::Decrease};
        break;
    case scene::SizeMode::Cover:
        target = ScaleTarget{cw, ch, ScaleTarget::Aspect::Increase};
        break;
    case scene::SizeMode::Pixels:
        target = ScaleTarget{std::to_string(size.width.value_or(0)),
                             std::to_string(size.height.value_or(0)),
                             ScaleTarget::Aspect::Exact};
        break;
    case scene::SizeMode::CanvasPercent: {
        scene::Size box = percent_box(size, canvas);
        target = ScaleTarget{utils::format_number(box.width), utils::format_number(box.height),
                             ScaleTarget::Aspect::Decrease};
        break;
    }
    case scene::SizeMode::Scale: {
        double fx = size.factor.value_or(1.0);
        double fy = size.factor_y.value_or(fx);
        if (fx == 1.0 && fy == 1.0) return std::nullopt;
        target = ScaleTarget{"iw*" + utils::format_number(fx), "ih*" + utils::format_number(fy),
                             ScaleTarget::Aspect::Exact};
        break;
    }
    case scene::SizeMode::FitWidth:
        target = ScaleTarget{cw, "-2", ScaleTarget::Aspect::Exact};
        break;
    case scene::SizeMode::FitHeight:
        target = ScaleTarget{"-2", ch, ScaleTarget::Aspect::Exact};
        break;
    }
    return target;
}

scene::Size target_size(const scene::SizeSpec& size, scene::Size source, const scene::Canvas& canvas) {
    scene::Size frame{static_cast<double>(canvas.width), static_cast<double>(canvas.height)};

    switch (size.mode) {
    case scene::SizeMode::Contain:
        return fit(source, frame, false);
    case scene::SizeMode::Cover:
        return fit(source, frame, true);
    case scene::SizeMode::CanvasPercent:
        return fit(source, percent_box(size, canvas), false);
    case scene::SizeMode::FitWidth:
        if (source.width <= 0.0) return source;
        return scene::Size{frame.width, source.height * frame.width / source.width};
    case scene::SizeMode::FitHeight:
        if (source.height <= 0.0) return source;
        return scene::Size{source.width * frame.height / source.height, frame.height};
    case scene::SizeMode::Pixels:
    case scene::SizeMode::Scale:
        return natural_size(size, source);
    }
    return source;
}

scene::Size natural_size(const scene::SizeSpec& size, scene::Size source) {
    switch (size.mode) {
    case scene::SizeMode::Pixels:
        return scene::Size{static_cast<double>(size.width.value_or(0)),
                           static_cast<double>(size.height.value_or(0))};
    case scene::SizeMode::Scale: {
        double fx = size.factor.value_or(1.0);
        double fy = size.factor_y.value_or(fx);
        return scene::Size{source.width * fx, source.height * fy};
    }
    default:
        return source;
    }
}

scene::Size rotated_bounds(scene::Size size, double degrees) {
    double rad = degrees * kPi / 180.0;
    double c = std::fabs(std::cos(rad));
    double s = std::fabs(std::sin(rad));
    // Snap float noise at right angles
    if (c < 1e-12) c = 0.0;
    if (s < 1e-12) s = 0.0;
    return scene::Size{size.width * c + size.height * s,
                       size.width * s + size.height * c};
}

scene::Size cropped_source(const scene::LayerState& layer) {
    if (layer.crop) {
        return scene::Size{static_cast<double>(layer.crop->width),
                           static_cast<double>(layer.crop->height)};
    }
    return scene::Size{static_cast<double>(layer.source.source_width()),
                       static_cast<double>(layer.source.source_height())};
}

std::string with_offset(const std::string& base, int offset) {
    if (offset == 0) return base;
    if (base == "0") return std::to_string(offset);
    if (offset > 0) return base + "+" + std::to_string(offset);
    return base + "-" + std::to_string(-offset);
}

Position resolve_position(const scene::LayerState& layer, const scene::Canvas& canvas) {
    const scene::Placement& placement = layer.placement;
    if (placement.custom()) {
        return Position{placement.x_expr, placement.y_expr};
    }

    Align ha = horizontal(placement.anchor);
    Align va = vertical(placement.anchor);

    if (layer.size.mode == scene::SizeMode::CanvasPercent) {
        scene::Size box = percent_box(layer.size, canvas);
        double box_x = axis_value(ha, canvas.width, box.width) + placement.dx;
        double box_y = axis_value(va, canvas.height, box.height) + placement.dy;
        return Position{box_expr(ha, box_x, box.width, "w"),
                        box_expr(va, box_y, box.height, "h")};
    }

    return Position{with_offset(axis_expr(ha, "W", "w"), placement.dx),
                    with_offset(axis_expr(va, "H", "h"), placement.dy)};
}

scene::Rect layer_rect(const scene::LayerState& layer, const scene::Canvas& canvas) {
    scene::Size scaled = target_size(layer.size, cropped_source(layer), canvas);
    scene::Size placed = rotated_bounds(scaled, layer.rotation);

    scene::Rect rect;
    rect.width = placed.width;
    rect.height = placed.height;

    const scene::Placement& placement = layer.placement;
    if (placement.custom()) {
        double x = 0.0;
        double y = 0.0;
        if (eval_expr(placement.x_expr, canvas.width, canvas.height, placed.width, placed.height, &x)) rect.x = x;
        if (eval_expr(placement.y_expr, canvas.width, canvas.height, placed.width, placed.height, &y)) rect.y = y;
        return rect;
    }

    Align ha = horizontal(placement.anchor);
    Align va = vertical(placement.anchor);
    if (layer.size.mode == scene::SizeMode::CanvasPercent) {
        scene::Size box = percent_box(layer.size, canvas);
        rect.x = axis_value(ha, canvas.width, box.width) + placement.dx + axis_value(ha, box.width, placed.width);
        rect.y = axis_value(va, canvas.height, box.height) + placement.dy + axis_value(va, box.height, placed.height);
    } else {
        rect.x = axis_value(ha, canvas.width, placed.width) + placement.dx;
        rect.y = axis_value(va, canvas.height, placed.height) + placement.dy;
    }
    return rect;
}

bool check_position_expression(const std::string& expr, std::string* error) {
    if (expr.empty()) {
        if (error) *error = "empty expression";
        return false;
    }
    if (expr.find('\'') != std::string::npos || expr.find('[') != std::string::npos ||
        expr.find(';') != std::string::npos) {
        if (error) *error = "quotes, brackets and ';' are not allowed";
        return false;
    }

    AVExpr* parsed = nullptr;
    int ret = av_expr_parse(&parsed, expr.c_str(), kOverlayVars,
                            nullptr, nullptr, nullptr, nullptr, 0, nullptr);
    if (ret < 0) {
        if (error) {
            char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
            av_strerror(ret, buf, sizeof(buf));
            *error = std::string("undefined variable or syntax error (") + buf + ")";
        }
        return false;
    }
    av_expr_free(parsed);
    return true;
}

} // namespace compiler
} // namespace vcomp
