#pragma once

#include <string>
#include <optional>
#include <variant>

#include "scene/foreground.hpp"

namespace vcomp {
namespace scene {

struct ColorFill {
    std::string color;      // engine color syntax: 0xRRGGBB or a name
    double alpha = 1.0;
};

struct StillImage {
    std::string path;
    int width = 0;
    int height = 0;
};

struct VideoClip {
    std::string path;
    MediaInfo media;
};

using BackgroundSource = std::variant<ColorFill, StillImage, VideoClip>;

/**
 * Scene background: solid color, looped still image or video
 */
class Background {
public:
    // "#RRGGBB", "#RRGGBBAA", "0xRRGGBB" or a plain color name
    static Background color(const std::string& color, double alpha = 1.0);
    static Background transparent();
    static Background image(const std::string& path, int width, int height);
    static Background video(const std::string& path, const MediaInfo& media);

    // Video backgrounds only
    Background with_audio(bool enabled, double volume = 1.0) const;
    Background subclip(double start, std::optional<double> end = std::nullopt) const;

    const BackgroundSource& source() const { return source_; }

    bool is_transparent() const;
    bool has_intrinsic_size() const;
    int width() const;
    int height() const;

    bool has_audio() const;
    bool audio_enabled() const { return audio_enabled_; }
    double audio_volume() const { return audio_volume_; }

    const std::optional<SourceTrim>& trim() const { return trim_; }

    // Playable length of a video background, nullopt for endless sources
    std::optional<double> duration() const;

private:
    explicit Background(BackgroundSource source);

    BackgroundSource source_;
    bool audio_enabled_;
    double audio_volume_;
    std::optional<SourceTrim> trim_;
};

} // namespace scene
} // namespace vcomp
