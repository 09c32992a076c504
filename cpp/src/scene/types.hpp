#pragma once

#include <string>
#include <cstdint>

namespace vcomp {
namespace scene {

// Upper bound accepted by FrameRate::from_double
constexpr double kMaxFrameRate = 1000000.0;

/**
 * Frame rate as an exact rational
 */
struct FrameRate {
    int num = 30;
    int den = 1;

    FrameRate() = default;
    FrameRate(int n, int d = 1);

    // 29.97 -> 30000/1001, 25.0 -> 25/1, 12.5 -> 25/2
    static FrameRate from_double(double fps);

    double value() const { return static_cast<double>(num) / den; }
    bool valid() const { return num > 0 && den > 0; }

    // "30" or "30000/1001"
    std::string to_string() const;

    bool operator==(const FrameRate& other) const {
        return static_cast<int64_t>(num) * other.den == static_cast<int64_t>(other.num) * den;
    }
    bool operator!=(const FrameRate& other) const { return !(*this == other); }
};

struct Size {
    double width = 0.0;
    double height = 0.0;
};

struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
};

// Output canvas, fixed for one compilation
struct Canvas {
    int width = 0;
    int height = 0;
    FrameRate fps;

    bool operator==(const Canvas& other) const {
        return width == other.width && height == other.height && fps == other.fps;
    }
    bool operator!=(const Canvas& other) const { return !(*this == other); }
};

enum class Anchor {
    TopLeft,
    TopCenter,
    TopRight,
    CenterLeft,
    Center,
    CenterRight,
    BottomLeft,
    BottomCenter,
    BottomRight
};

enum class SizeMode {
    Contain,
    Cover,
    Pixels,
    CanvasPercent,
    Scale,
    FitWidth,
    FitHeight
};

// Names use dashes: "top-left", "center", "canvas-percent", "fit-width"...
// Underscores are accepted on input.
bool parse_anchor(const std::string& text, Anchor& out);
const char* to_string(Anchor anchor);

bool parse_size_mode(const std::string& text, SizeMode& out);
const char* to_string(SizeMode mode);

} // namespace scene
} // namespace vcomp
