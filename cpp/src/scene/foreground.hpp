#pragma once

#include <string>
#include <optional>
#include <variant>

#include "scene/types.hpp"

namespace vcomp {
namespace scene {

/**
 * Intrinsic description of a media file, as probed
 */
struct MediaInfo {
    int width = 0;
    int height = 0;
    FrameRate fps;
    double duration = 0.0;      // seconds, 0 when unknown
    bool has_audio = false;
    bool has_alpha = false;
    std::string codec;
    std::string pix_fmt;
    int rotation = 0;           // display rotation in degrees
};

enum class StackOrientation { SideBySide, TopBottom };
enum class StackOrder { ColorFirst, AlphaFirst };

bool parse_stack_orientation(const std::string& text, StackOrientation& out);
bool parse_stack_order(const std::string& text, StackOrder& out);

// Codec carries the alpha plane (VP9 webm, ProRes 4444 mov)
struct NativeAlpha {
    std::string path;
};

// Color and alpha packed into one carrier frame
struct StackedLayout {
    std::string path;
    StackOrientation orientation;
    StackOrder order;
};

// Color and alpha still images paired by index
struct FrameSequence {
    std::string color_pattern;
    std::string alpha_pattern;
    FrameRate rate;
    int start_number = 0;
};

// Separate color and mask videos, optionally with a separate audio file
struct SplitMask {
    std::string color_path;
    std::string mask_path;
    std::string audio_path;
};

using TransparencyEncoding = std::variant<NativeAlpha, StackedLayout, FrameSequence, SplitMask>;

// Source-side trim in seconds
struct SourceTrim {
    double start = 0.0;
    std::optional<double> end;
};

/**
 * Output record of the background-removal service
 *
 * format: native_alpha | webm_vp9 | mov_prores | stacked | stacked_video |
 *         frame_sequence | png_sequence | split_mask | pro_bundle
 */
struct ForegroundDescriptor {
    std::string format;
    std::string path;           // carrier, color video or color pattern
    std::string mask_path;      // split mask video or alpha pattern
    std::string audio_path;
    std::optional<StackOrientation> orientation;
    std::optional<StackOrder> order;
    int start_number = 0;
    MediaInfo media;
};

/**
 * Foreground source with exactly one transparency encoding
 *
 * The encoding is fixed at creation; trims produce a new value.
 */
class Foreground {
public:
    static Foreground native_alpha(const std::string& path, const MediaInfo& media);
    static Foreground stacked(const std::string& path,
                              StackOrientation orientation,
                              StackOrder order,
                              const MediaInfo& media);
    static Foreground frame_sequence(const std::string& color_pattern,
                                     const std::string& alpha_pattern,
                                     int start_number,
                                     const MediaInfo& media);
    static Foreground split_mask(const std::string& color_path,
                                 const std::string& mask_path,
                                 const std::string& audio_path,
                                 const MediaInfo& media);

    // Throws ConfigurationError for unknown formats or missing stacked parameters
    static Foreground from_descriptor(const ForegroundDescriptor& descriptor);

    const TransparencyEncoding& encoding() const { return encoding_; }
    const MediaInfo& media() const { return media_; }
    const std::optional<SourceTrim>& trim() const { return trim_; }

    // Size of the color picture (half the carrier along the stacking axis)
    int source_width() const;
    int source_height() const;

    bool has_audio() const;

    // Playable length after trimming, 0 when unknown
    double duration() const;

    // Use only [start, end) of the source
    Foreground subclip(double start, std::optional<double> end = std::nullopt) const;

private:
    Foreground(TransparencyEncoding encoding, const MediaInfo& media);

    TransparencyEncoding encoding_;
    MediaInfo media_;
    std::optional<SourceTrim> trim_;
};

} // namespace scene
} // namespace vcomp
