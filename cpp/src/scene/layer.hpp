#pragma once

#include <string>
#include <optional>
#include <cstdint>

#include "scene/types.hpp"
#include "scene/foreground.hpp"

namespace vcomp {
namespace scene {

using LayerId = uint64_t;

// Anchor plus pixel offset, or a custom overlay expression pair
struct Placement {
    Anchor anchor = Anchor::Center;
    int dx = 0;
    int dy = 0;
    std::string x_expr;
    std::string y_expr;

    bool custom() const { return !x_expr.empty(); }
};

/**
 * Size mode with its parameters
 *
 * Pixels needs width and height; CanvasPercent takes a percentage of the
 * canvas (optionally a separate height percentage); Scale multiplies the
 * source size.
 */
struct SizeSpec {
    SizeMode mode = SizeMode::Contain;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<double> percent;
    std::optional<double> height_percent;
    std::optional<double> factor;
    std::optional<double> factor_y;

    static SizeSpec contain();
    static SizeSpec cover();
    static SizeSpec pixels(int width, int height);
    static SizeSpec canvas_percent(double percent);
    static SizeSpec canvas_percent(double width_percent, double height_percent);
    static SizeSpec scale(double factor);
    static SizeSpec scale(double factor_x, double factor_y);
    static SizeSpec fit_width();
    static SizeSpec fit_height();

    // Throws ConfigurationError when the mode's parameters are missing or out of range
    void validate() const;
};

struct CropRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

// At most two are needed; the third is derived
struct TimingSpec {
    std::optional<double> start;
    std::optional<double> end;
    std::optional<double> duration;
};

struct AudioSettings {
    bool enabled = true;
    double volume = 1.0;
};

// Plain value copy of a layer; what the compiler sees
struct LayerState {
    LayerId id = 0;
    std::string name;
    Foreground source;
    Placement placement;
    SizeSpec size;
    double opacity = 1.0;
    double rotation = 0.0;      // degrees, clockwise
    std::optional<CropRect> crop;
    TimingSpec timing;
    AudioSettings audio;
    bool alpha_enabled = true;

    LayerState(LayerId layer_id, const std::string& layer_name, const Foreground& fg)
        : id(layer_id)
        , name(layer_name)
        , source(fg)
    {
    }
};

/**
 * One foreground layer of a Composition
 *
 * Setters validate immediately and return the layer for chaining.
 * Owned by its Composition; references stay valid until the layer is removed.
 */
class Layer {
public:
    Layer(LayerId id, const std::string& name, const Foreground& source);

    Layer(const Layer&) = delete;
    Layer& operator=(const Layer&) = delete;

    Layer& at(Anchor anchor, int dx = 0, int dy = 0);
    Layer& xy(const std::string& x_expr, const std::string& y_expr);
    Layer& size(const SizeSpec& spec);
    Layer& opacity(double alpha);
    Layer& rotate(double degrees);
    Layer& crop(int x, int y, int width, int height);

    Layer& start(double seconds);
    Layer& end(double seconds);
    Layer& duration(double seconds);

    Layer& subclip(double start, std::optional<double> end = std::nullopt);
    Layer& audio(bool enabled, double volume = 1.0);
    Layer& alpha(bool enabled);

    LayerId id() const { return state_.id; }
    const std::string& name() const { return state_.name; }
    const LayerState& state() const { return state_; }

private:
    void apply_timing(const TimingSpec& timing);

    LayerState state_;
};

} // namespace scene
} // namespace vcomp
