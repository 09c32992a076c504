/**
 * Scene value types
 */

#include "types.hpp"
#include "scene/errors.hpp"

#include <cmath>
#include <numeric>

namespace vcomp {
namespace scene {

namespace {

std::string normalize_name(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        if (c == '_') c = '-';
        else if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

struct AnchorName {
    Anchor anchor;
    const char* name;
};

const AnchorName kAnchorNames[] = {
    {Anchor::TopLeft, "top-left"},
    {Anchor::TopCenter, "top-center"},
    {Anchor::TopRight, "top-right"},
    {Anchor::CenterLeft, "center-left"},
    {Anchor::Center, "center"},
    {Anchor::CenterRight, "center-right"},
    {Anchor::BottomLeft, "bottom-left"},
    {Anchor::BottomCenter, "bottom-center"},
    {Anchor::BottomRight, "bottom-right"},
};

struct SizeModeName {
    SizeMode mode;
    const char* name;
};

const SizeModeName kSizeModeNames[] = {
    {SizeMode::Contain, "contain"},
    {SizeMode::Cover, "cover"},
    {SizeMode::Pixels, "pixels"},
    {SizeMode::CanvasPercent, "canvas-percent"},
    {SizeMode::Scale, "scale"},
    {SizeMode::FitWidth, "fit-width"},
    {SizeMode::FitHeight, "fit-height"},
};

} // namespace

FrameRate::FrameRate(int n, int d)
    : num(n)
    , den(d)
{
    if (num <= 0 || den <= 0) {
        throw ConfigurationError("frame rate must be positive: " +
                                 std::to_string(n) + "/" + std::to_string(d));
    }
    int g = std::gcd(num, den);
    num /= g;
    den /= g;
}

FrameRate FrameRate::from_double(double fps) {
    if (!(fps > 0.0) || !std::isfinite(fps)) {
        throw ConfigurationError("frame rate must be positive");
    }
    // Keeps fps * 1000 inside int
    if (fps > kMaxFrameRate) {
        throw ConfigurationError("frame rate too large: " + std::to_string(fps));
    }

    double rounded = std::round(fps);
    if (std::fabs(fps - rounded) < 1e-6) {
        return FrameRate(static_cast<int>(rounded), 1);
    }

    // NTSC family
    double ntsc = rounded * 1000.0 / 1001.0;
    if (std::fabs(fps - ntsc) < 0.005) {
        return FrameRate(static_cast<int>(rounded) * 1000, 1001);
    }

    return FrameRate(static_cast<int>(std::llround(fps * 1000.0)), 1000);
}

std::string FrameRate::to_string() const {
    if (den == 1) return std::to_string(num);
    return std::to_string(num) + "/" + std::to_string(den);
}

bool parse_anchor(const std::string& text, Anchor& out) {
    std::string name = normalize_name(text);
    if (name == "top") name = "top-center";
    else if (name == "bottom") name = "bottom-center";
    else if (name == "left") name = "center-left";
    else if (name == "right") name = "center-right";

    for (const auto& entry : kAnchorNames) {
        if (name == entry.name) {
            out = entry.anchor;
            return true;
        }
    }
    return false;
}

const char* to_string(Anchor anchor) {
    for (const auto& entry : kAnchorNames) {
        if (entry.anchor == anchor) return entry.name;
    }
    return "center";
}

bool parse_size_mode(const std::string& text, SizeMode& out) {
    std::string name = normalize_name(text);
    if (name == "px") name = "pixels";

    for (const auto& entry : kSizeModeNames) {
        if (name == entry.name) {
            out = entry.mode;
            return true;
        }
    }
    return false;
}

const char* to_string(SizeMode mode) {
    for (const auto& entry : kSizeModeNames) {
        if (entry.mode == mode) return entry.name;
    }
    return "contain";
}

} // namespace scene
} // namespace vcomp
