#pragma once

#include <string>
#include <vector>
#include <optional>

#include "scene/types.hpp"
#include "config/defaults.hpp"

namespace vcomp {
namespace compiler {

enum class EncoderKind {
    H264,
    Vp9,
    TransparentWebm,
    ProRes4444,
    PngSequence,
    StackedVideo,       // color over extracted alpha in one opaque frame
    RawVideo            // uncompressed frames for y4m pipes
};

enum class StackLayout { Vertical, Horizontal };

enum class StreamFormat { Y4m, Webm, Matroska, Mp4Fragmented };

enum class Container { Mp4, Mov, Matroska, Webm, ImageSequence, Y4m };

bool parse_encoder_kind(const std::string& text, EncoderKind& out);
const char* to_string(EncoderKind kind);
bool parse_stream_format(const std::string& text, StreamFormat& out);
const char* to_string(StreamFormat format);
const char* to_string(Container container);

/**
 * Where the engine writes: a file path, or stdout in a stream format
 */
struct OutputTarget {
    std::string path;
    std::optional<StreamFormat> stream;

    static OutputTarget file(const std::string& path);
    static OutputTarget pipe(StreamFormat format);

    bool is_pipe() const { return stream.has_value(); }

    // Engine output argument ("pipe:1" for streams)
    std::string url() const;
};

/**
 * Codec, pixel format and quality settings for the output
 *
 * Quality left unset takes the codec's entry in the defaults table.
 */
class EncoderProfile {
public:
    static EncoderProfile h264(std::optional<int> crf = std::nullopt, const std::string& preset = "");
    static EncoderProfile vp9(std::optional<int> crf = std::nullopt);
    static EncoderProfile transparent_webm(std::optional<int> crf = std::nullopt);
    static EncoderProfile prores_4444();
    static EncoderProfile png_sequence(std::optional<scene::FrameRate> rate = std::nullopt);
    static EncoderProfile stacked_video(StackLayout layout = StackLayout::Vertical,
                                        std::optional<int> crf = std::nullopt,
                                        const std::string& preset = "");
    static EncoderProfile raw_video();

    // Target bitrate ("4M"); for VP9 turns constant quality into constrained quality
    EncoderProfile with_bitrate(const std::string& bitrate) const;

    EncoderKind kind() const { return kind_; }
    const std::string& codec() const { return codec_; }
    const std::string& pix_fmt() const { return pix_fmt_; }
    bool alpha_capable() const { return alpha_capable_; }
    const std::optional<int>& crf() const { return crf_; }
    const std::string& preset() const { return preset_; }
    const std::string& bitrate() const { return bitrate_; }
    StackLayout layout() const { return layout_; }
    const std::optional<scene::FrameRate>& rate() const { return rate_; }

private:
    EncoderProfile(EncoderKind kind, const std::string& codec, const std::string& pix_fmt, bool alpha_capable);

    EncoderKind kind_;
    std::string codec_;
    std::string pix_fmt_;
    bool alpha_capable_;
    std::optional<int> crf_;
    std::string preset_;
    std::string bitrate_;
    StackLayout layout_;
    std::optional<scene::FrameRate> rate_;
};

struct EncoderArgs {
    std::vector<std::string> video;
    std::vector<std::string> audio;     // empty when the container takes no audio
    std::vector<std::string> format;    // -f and muxer flags
    bool audio_supported = true;
};

// Container from the stream format or file extension; throws ConfigurationError
Container resolve_container(const OutputTarget& output);

/**
 * Encoder Profile Applier
 *
 * Checks codec/container/alpha compatibility and maps a profile to
 * engine output arguments.
 */
class EncoderProfileApplier {
public:
    explicit EncoderProfileApplier(const config::Defaults& defaults);

    // Container accepts the codec; an alpha scene is never flattened
    void validate(const EncoderProfile& profile, const OutputTarget& output, bool requires_alpha) const;

    // Frame size the encoder will see meets the pixel format's constraints
    void validate_frame(const EncoderProfile& profile, int width, int height) const;

    EncoderArgs apply(const EncoderProfile& profile, const OutputTarget& output) const;

private:
    const config::Defaults& defaults_;
};

} // namespace compiler
} // namespace vcomp
