/**
 * Scene background
 */

#include "background.hpp"
#include "scene/errors.hpp"
#include "utils/format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace vcomp {
namespace scene {

namespace {

bool is_hex(const std::string& text) {
    for (char c : text) {
        bool digit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!digit) return false;
    }
    return !text.empty();
}

bool is_name(const std::string& text) {
    for (char c : text) {
        bool letter = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (!letter) return false;
    }
    return !text.empty();
}

} // namespace

Background::Background(BackgroundSource source)
    : source_(std::move(source))
    , audio_enabled_(true)
    , audio_volume_(1.0)
{
}

Background Background::color(const std::string& color, double alpha) {
    if (!(alpha >= 0.0 && alpha <= 1.0)) {
        throw ConfigurationError("background alpha must be within [0, 1]");
    }

    std::string hex;
    if (!color.empty() && color[0] == '#') hex = color.substr(1);
    else if (color.size() > 2 && color[0] == '0' && (color[1] == 'x' || color[1] == 'X')) hex = color.substr(2);

    ColorFill fill;
    fill.alpha = alpha;
    if (!hex.empty()) {
        if (!is_hex(hex) || (hex.size() != 6 && hex.size() != 8)) {
            throw ConfigurationError("invalid background color: '" + color + "'");
        }
        fill.color = "0x" + utils::to_lower(hex.substr(0, 6));
        if (hex.size() == 8) {
            long aa = std::strtol(hex.substr(6, 2).c_str(), nullptr, 16);
            fill.alpha = alpha * static_cast<double>(aa) / 255.0;
        }
    } else if (is_name(color)) {
        fill.color = utils::to_lower(color);
    } else {
        throw ConfigurationError("invalid background color: '" + color + "'");
    }
    return Background(fill);
}

Background Background::transparent() {
    return Background(ColorFill{"black", 0.0});
}

Background Background::image(const std::string& path, int width, int height) {
    if (path.empty()) {
        throw ConfigurationError("background image path is empty");
    }
    if (width <= 0 || height <= 0) {
        throw ConfigurationError("background image dimensions must be positive");
    }
    return Background(StillImage{path, width, height});
}

Background Background::video(const std::string& path, const MediaInfo& media) {
    if (path.empty()) {
        throw ConfigurationError("background video path is empty");
    }
    if (media.width <= 0 || media.height <= 0 || !media.fps.valid()) {
        throw ConfigurationError("background video needs positive dimensions and frame rate");
    }
    return Background(VideoClip{path, media});
}

Background Background::with_audio(bool enabled, double volume) const {
    if (!std::holds_alternative<VideoClip>(source_)) {
        throw ConfigurationError("only video backgrounds carry audio");
    }
    if (!(volume >= 0.0) || !std::isfinite(volume)) {
        throw ConfigurationError("background volume must not be negative");
    }
    Background copy = *this;
    copy.audio_enabled_ = enabled;
    copy.audio_volume_ = volume;
    return copy;
}

Background Background::subclip(double start, std::optional<double> end) const {
    const auto* clip = std::get_if<VideoClip>(&source_);
    if (!clip) {
        throw ConfigurationError("only video backgrounds can be trimmed");
    }
    if (start < 0.0 || (end && *end <= start)) {
        throw ConfigurationError("background subclip needs 0 <= start < end");
    }
    if (clip->media.duration > 0.0 && start >= clip->media.duration) {
        throw ConfigurationError("background subclip starts past the video end");
    }
    Background copy = *this;
    copy.trim_ = SourceTrim{start, end};
    return copy;
}

bool Background::is_transparent() const {
    const auto* fill = std::get_if<ColorFill>(&source_);
    return fill && fill->alpha < 1.0;
}

bool Background::has_intrinsic_size() const {
    return !std::holds_alternative<ColorFill>(source_);
}

int Background::width() const {
    if (const auto* image = std::get_if<StillImage>(&source_)) return image->width;
    if (const auto* clip = std::get_if<VideoClip>(&source_)) return clip->media.width;
    return 0;
}

int Background::height() const {
    if (const auto* image = std::get_if<StillImage>(&source_)) return image->height;
    if (const auto* clip = std::get_if<VideoClip>(&source_)) return clip->media.height;
    return 0;
}

bool Background::has_audio() const {
    const auto* clip = std::get_if<VideoClip>(&source_);
    return clip && clip->media.has_audio;
}

std::optional<double> Background::duration() const {
    const auto* clip = std::get_if<VideoClip>(&source_);
    if (!clip) return std::nullopt;

    double end = clip->media.duration;
    if (trim_ && trim_->end && (end <= 0.0 || *trim_->end < end)) end = *trim_->end;
    if (end <= 0.0) return std::nullopt;

    double start = trim_ ? trim_->start : 0.0;
    return std::max(0.0, end - start);
}

} // namespace scene
} // namespace vcomp
