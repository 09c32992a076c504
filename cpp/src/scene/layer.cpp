/**
 * Layer builder
 */

#include "layer.hpp"
#include "scene/errors.hpp"
#include "compiler/timing.hpp"
#include "compiler/geometry.hpp"
#include "utils/format.hpp"

#include <cmath>

namespace vcomp {
namespace scene {

namespace {

bool finite_non_negative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

bool valid_percent(double value) {
    return std::isfinite(value) && value > 0.0 && value <= 100.0;
}

bool valid_factor(double value) {
    return std::isfinite(value) && value > 0.0;
}

} // namespace

SizeSpec SizeSpec::contain() {
    SizeSpec spec;
    spec.mode = SizeMode::Contain;
    return spec;
}

SizeSpec SizeSpec::cover() {
    SizeSpec spec;
    spec.mode = SizeMode::Cover;
    return spec;
}

SizeSpec SizeSpec::pixels(int width, int height) {
    SizeSpec spec;
    spec.mode = SizeMode::Pixels;
    spec.width = width;
    spec.height = height;
    return spec;
}

SizeSpec SizeSpec::canvas_percent(double percent) {
    SizeSpec spec;
    spec.mode = SizeMode::CanvasPercent;
    spec.percent = percent;
    return spec;
}

SizeSpec SizeSpec::canvas_percent(double width_percent, double height_percent) {
    SizeSpec spec;
    spec.mode = SizeMode::CanvasPercent;
    spec.percent = width_percent;
    spec.height_percent = height_percent;
    return spec;
}

SizeSpec SizeSpec::scale(double factor) {
    SizeSpec spec;
    spec.mode = SizeMode::Scale;
    spec.factor = factor;
    return spec;
}

SizeSpec SizeSpec::scale(double factor_x, double factor_y) {
    SizeSpec spec;
    spec.mode = SizeMode::Scale;
    spec.factor = factor_x;
    spec.factor_y = factor_y;
    return spec;
}

SizeSpec SizeSpec::fit_width() {
    SizeSpec spec;
    spec.mode = SizeMode::FitWidth;
    return spec;
}

SizeSpec SizeSpec::fit_height() {
    SizeSpec spec;
    spec.mode = SizeMode::FitHeight;
    return spec;
}

void SizeSpec::validate() const {
    switch (mode) {
    case SizeMode::Pixels:
        if (!width || !height) {
            throw ConfigurationError("pixels size mode requires both width and height");
        }
        if (*width <= 0 || *height <= 0) {
            throw ConfigurationError("pixel size must be positive, got " +
                                     std::to_string(*width) + "x" + std::to_string(*height));
        }
        break;
    case SizeMode::CanvasPercent:
        if (!percent) {
            throw ConfigurationError("canvas-percent size mode requires a percentage");
        }
        if (!valid_percent(*percent) || (height_percent && !valid_percent(*height_percent))) {
            throw ConfigurationError("canvas percentage must be within (0, 100]");
        }
        break;
    case SizeMode::Scale:
        if (!factor) {
            throw ConfigurationError("scale size mode requires a factor");
        }
        if (!valid_factor(*factor) || (factor_y && !valid_factor(*factor_y))) {
            throw ConfigurationError("scale factor must be positive");
        }
        break;
    case SizeMode::Contain:
    case SizeMode::Cover:
    case SizeMode::FitWidth:
    case SizeMode::FitHeight:
        break;
    }
}

Layer::Layer(LayerId id, const std::string& name, const Foreground& source)
    : state_(id, name, source)
{
}

Layer& Layer::at(Anchor anchor, int dx, int dy) {
    state_.placement.anchor = anchor;
    state_.placement.dx = dx;
    state_.placement.dy = dy;
    state_.placement.x_expr.clear();
    state_.placement.y_expr.clear();
    return *this;
}

Layer& Layer::xy(const std::string& x_expr, const std::string& y_expr) {
    std::string error;
    if (!compiler::check_position_expression(x_expr, &error)) {
        throw ConfigurationError("invalid x expression '" + x_expr + "': " + error);
    }
    if (!compiler::check_position_expression(y_expr, &error)) {
        throw ConfigurationError("invalid y expression '" + y_expr + "': " + error);
    }
    state_.placement.x_expr = x_expr;
    state_.placement.y_expr = y_expr;
    return *this;
}

Layer& Layer::size(const SizeSpec& spec) {
    spec.validate();
    state_.size = spec;
    return *this;
}

Layer& Layer::opacity(double alpha) {
    if (!(std::isfinite(alpha) && alpha >= 0.0 && alpha <= 1.0)) {
        throw ConfigurationError("opacity must be within [0, 1], got " + utils::format_number(alpha));
    }
    state_.opacity = alpha;
    return *this;
}

Layer& Layer::rotate(double degrees) {
    if (!std::isfinite(degrees)) {
        throw ConfigurationError("rotation must be a finite angle");
    }
    state_.rotation = degrees;
    return *this;
}

Layer& Layer::crop(int x, int y, int width, int height) {
    if (x < 0 || y < 0 || width <= 0 || height <= 0) {
        throw ConfigurationError("crop needs a non-negative origin and a positive size");
    }
    int src_w = state_.source.source_width();
    int src_h = state_.source.source_height();
    if (width > src_w || height > src_h || x > src_w - width || y > src_h - height) {
        throw ConfigurationError("crop " + std::to_string(width) + "x" + std::to_string(height) +
                                 "+" + std::to_string(x) + "+" + std::to_string(y) +
                                 " exceeds source " + std::to_string(src_w) + "x" +
                                 std::to_string(src_h));
    }
    state_.crop = CropRect{x, y, width, height};
    return *this;
}

Layer& Layer::start(double seconds) {
    TimingSpec timing = state_.timing;
    timing.start = seconds;
    apply_timing(timing);
    return *this;
}

Layer& Layer::end(double seconds) {
    TimingSpec timing = state_.timing;
    timing.end = seconds;
    apply_timing(timing);
    return *this;
}

Layer& Layer::duration(double seconds) {
    TimingSpec timing = state_.timing;
    timing.duration = seconds;
    apply_timing(timing);
    return *this;
}

Layer& Layer::subclip(double start, std::optional<double> end) {
    state_.source = state_.source.subclip(start, end);
    return *this;
}

Layer& Layer::audio(bool enabled, double volume) {
    if (!finite_non_negative(volume)) {
        throw ConfigurationError("volume must not be negative");
    }
    state_.audio.enabled = enabled;
    state_.audio.volume = volume;
    return *this;
}

Layer& Layer::alpha(bool enabled) {
    state_.alpha_enabled = enabled;
    return *this;
}

void Layer::apply_timing(const TimingSpec& timing) {
    // Throws on inconsistent or out-of-range values
    compiler::resolve_timing(timing);
    state_.timing = timing;
}

} // namespace scene
} // namespace vcomp
