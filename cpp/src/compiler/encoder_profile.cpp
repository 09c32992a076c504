/**
 * Encoder Profile Applier Implementation
 */

#include "encoder_profile.hpp"
#include "scene/errors.hpp"
#include "utils/format.hpp"

namespace vcomp {
namespace compiler {

namespace {

struct KindName {
    EncoderKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {EncoderKind::H264, "h264"},
    {EncoderKind::Vp9, "vp9"},
    {EncoderKind::TransparentWebm, "transparent_webm"},
    {EncoderKind::ProRes4444, "prores_4444"},
    {EncoderKind::PngSequence, "png_sequence"},
    {EncoderKind::StackedVideo, "stacked_video"},
    {EncoderKind::RawVideo, "raw"},
};

struct StreamName {
    StreamFormat format;
    const char* name;
};

const StreamName kStreamNames[] = {
    {StreamFormat::Y4m, "y4m"},
    {StreamFormat::Webm, "webm"},
    {StreamFormat::Matroska, "matroska"},
    {StreamFormat::Mp4Fragmented, "mp4_fragmented"},
};

std::string normalize(const std::string& text) {
    std::string out = utils::to_lower(text);
    for (char& c : out) {
        if (c == '-') c = '_';
    }
    return out;
}

bool accepts(EncoderKind kind, Container container) {
    switch (kind) {
    case EncoderKind::H264:
    case EncoderKind::StackedVideo:
        return container == Container::Mp4 || container == Container::Mov ||
               container == Container::Matroska;
    case EncoderKind::Vp9:
        return container == Container::Webm || container == Container::Matroska ||
               container == Container::Mp4;
    case EncoderKind::TransparentWebm:
        return container == Container::Webm || container == Container::Matroska;
    case EncoderKind::ProRes4444:
        return container == Container::Mov || container == Container::Matroska;
    case EncoderKind::PngSequence:
        return container == Container::ImageSequence || container == Container::Mov ||
               container == Container::Matroska;
    case EncoderKind::RawVideo:
        return container == Container::Y4m;
    }
    return false;
}

bool chroma_subsampled(const std::string& pix_fmt) {
    return pix_fmt.find("420") != std::string::npos;
}

} // namespace

bool parse_encoder_kind(const std::string& text, EncoderKind& out) {
    std::string name = normalize(text);
    if (name == "prores" || name == "prores4444") name = "prores_4444";
    else if (name == "webm_alpha") name = "transparent_webm";
    else if (name == "rawvideo") name = "raw";

    for (const auto& entry : kKindNames) {
        if (name == entry.name) {
            out = entry.kind;
            return true;
        }
    }
    return false;
}

const char* to_string(EncoderKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "h264";
}

bool parse_stream_format(const std::string& text, StreamFormat& out) {
    std::string name = normalize(text);
    if (name == "mkv") name = "matroska";
    for (const auto& entry : kStreamNames) {
        if (name == entry.name) {
            out = entry.format;
            return true;
        }
    }
    return false;
}

const char* to_string(StreamFormat format) {
    for (const auto& entry : kStreamNames) {
        if (entry.format == format) return entry.name;
    }
    return "matroska";
}

const char* to_string(Container container) {
    switch (container) {
    case Container::Mp4: return "mp4";
    case Container::Mov: return "mov";
    case Container::Matroska: return "matroska";
    case Container::Webm: return "webm";
    case Container::ImageSequence: return "image2";
    case Container::Y4m: return "yuv4mpegpipe";
    }
    return "matroska";
}

OutputTarget OutputTarget::file(const std::string& path) {
    if (path.empty() || path == "-") {
        throw ConfigurationError("output path is empty; use a pipe target for streaming");
    }
    OutputTarget target;
    target.path = path;
    return target;
}

OutputTarget OutputTarget::pipe(StreamFormat format) {
    OutputTarget target;
    target.path = "-";
    target.stream = format;
    return target;
}

std::string OutputTarget::url() const {
    return is_pipe() ? "pipe:1" : path;
}

EncoderProfile::EncoderProfile(EncoderKind kind, const std::string& codec,
                               const std::string& pix_fmt, bool alpha_capable)
    : kind_(kind)
    , codec_(codec)
    , pix_fmt_(pix_fmt)
    , alpha_capable_(alpha_capable)
    , layout_(StackLayout::Vertical)
{
}

EncoderProfile EncoderProfile::h264(std::optional<int> crf, const std::string& preset) {
    EncoderProfile profile(EncoderKind::H264, "libx264", "yuv420p", false);
    profile.crf_ = crf;
    profile.preset_ = preset;
    return profile;
}

EncoderProfile EncoderProfile::vp9(std::optional<int> crf) {
    EncoderProfile profile(EncoderKind::Vp9, "libvpx-vp9", "yuv420p", false);
    profile.crf_ = crf;
    return profile;
}

EncoderProfile EncoderProfile::transparent_webm(std::optional<int> crf) {
    EncoderProfile profile(EncoderKind::TransparentWebm, "libvpx-vp9", "yuva420p", true);
    profile.crf_ = crf;
    return profile;
}

EncoderProfile EncoderProfile::prores_4444() {
    return EncoderProfile(EncoderKind::ProRes4444, "prores_ks", "yuva444p10le", true);
}

EncoderProfile EncoderProfile::png_sequence(std::optional<scene::FrameRate> rate) {
    EncoderProfile profile(EncoderKind::PngSequence, "png", "rgba", true);
    profile.rate_ = rate;
    return profile;
}

EncoderProfile EncoderProfile::stacked_video(StackLayout layout, std::optional<int> crf,
                                             const std::string& preset) {
    EncoderProfile profile(EncoderKind::StackedVideo, "libx264", "yuv420p", true);
    profile.layout_ = layout;
    profile.crf_ = crf;
    profile.preset_ = preset;
    return profile;
}

EncoderProfile EncoderProfile::raw_video() {
    return EncoderProfile(EncoderKind::RawVideo, "wrapped_avframe", "yuv420p", false);
}

EncoderProfile EncoderProfile::with_bitrate(const std::string& bitrate) const {
    if (bitrate.empty()) {
        throw ConfigurationError("bitrate must not be empty");
    }
    EncoderProfile copy = *this;
    copy.bitrate_ = bitrate;
    return copy;
}

Container resolve_container(const OutputTarget& output) {
    if (output.stream) {
        switch (*output.stream) {
        case StreamFormat::Y4m: return Container::Y4m;
        case StreamFormat::Webm: return Container::Webm;
        case StreamFormat::Matroska: return Container::Matroska;
        case StreamFormat::Mp4Fragmented: return Container::Mp4;
        }
    }

    std::string ext = utils::file_extension(output.path);
    if (ext == "mp4" || ext == "m4v") return Container::Mp4;
    if (ext == "mov") return Container::Mov;
    if (ext == "mkv") return Container::Matroska;
    if (ext == "webm") return Container::Webm;
    if (ext == "y4m") return Container::Y4m;
    if (ext == "png") {
        if (output.path.find('%') == std::string::npos) {
            throw ConfigurationError("image sequence output needs a numbering pattern such as "
                                     "frame_%05d.png: '" + output.path + "'");
        }
        return Container::ImageSequence;
    }
    throw ConfigurationError("cannot derive a container from output '" + output.path + "'");
}

EncoderProfileApplier::EncoderProfileApplier(const config::Defaults& defaults)
    : defaults_(defaults)
{
}

void EncoderProfileApplier::validate(const EncoderProfile& profile, const OutputTarget& output,
                                     bool requires_alpha) const {
    Container container = resolve_container(output);
    if (!accepts(profile.kind(), container)) {
        throw ConfigurationError(std::string("encoder profile ") + to_string(profile.kind()) +
                                 " (" + profile.codec() + ") cannot be written to a " +
                                 to_string(container) + " container");
    }
    if (requires_alpha && !profile.alpha_capable()) {
        throw ConfigurationError(std::string("the scene has a transparent background but encoder "
                                             "profile ") + to_string(profile.kind()) +
                                 " cannot carry alpha; use transparent_webm, prores_4444, "
                                 "png_sequence or stacked_video");
    }
}

void EncoderProfileApplier::validate_frame(const EncoderProfile& profile, int width, int height) const {
    if (chroma_subsampled(profile.pix_fmt()) && (width % 2 != 0 || height % 2 != 0)) {
        throw ConfigurationError("pixel format " + profile.pix_fmt() + " needs even dimensions, "
                                 "output frame is " + std::to_string(width) + "x" +
                                 std::to_string(height));
    }
}

EncoderArgs EncoderProfileApplier::apply(const EncoderProfile& profile, const OutputTarget& output) const {
    Container container = resolve_container(output);
    EncoderArgs args;
    std::vector<std::string>& v = args.video;

    v.push_back("-c:v");
    v.push_back(profile.codec());

    switch (profile.kind()) {
    case EncoderKind::H264:
    case EncoderKind::StackedVideo:
        v.push_back("-crf");
        v.push_back(std::to_string(profile.crf().value_or(defaults_.h264_crf)));
        v.push_back("-preset");
        v.push_back(profile.preset().empty() ? defaults_.h264_preset : profile.preset());
        if (!profile.bitrate().empty()) {
            v.push_back("-maxrate");
            v.push_back(profile.bitrate());
            v.push_back("-bufsize");
            v.push_back(profile.bitrate());
        }
        break;
    case EncoderKind::Vp9:
    case EncoderKind::TransparentWebm: {
        int fallback = profile.kind() == EncoderKind::Vp9 ? defaults_.vp9_crf : defaults_.webm_alpha_crf;
        v.push_back("-crf");
        v.push_back(std::to_string(profile.crf().value_or(fallback)));
        v.push_back("-b:v");
        v.push_back(profile.bitrate().empty() ? "0" : profile.bitrate());
        break;
    }
    case EncoderKind::ProRes4444:
        v.push_back("-profile:v");
        v.push_back("4");
        break;
    case EncoderKind::PngSequence:
    case EncoderKind::RawVideo:
        break;
    }

    v.push_back("-pix_fmt");
    v.push_back(profile.pix_fmt());

    // libvpx alt-ref frames discard the alpha plane
    if (profile.kind() == EncoderKind::TransparentWebm) {
        v.push_back("-auto-alt-ref");
        v.push_back("0");
    }
    if (profile.rate()) {
        v.push_back("-r");
        v.push_back(profile.rate()->to_string());
    }

    switch (container) {
    case Container::Mp4:
    case Container::Mov:
    case Container::Matroska:
        args.audio = {"-c:a", "aac", "-b:a", defaults_.audio_bitrate};
        break;
    case Container::Webm:
        args.audio = {"-c:a", "libopus", "-b:a", defaults_.audio_bitrate};
        break;
    case Container::ImageSequence:
    case Container::Y4m:
        args.audio_supported = false;
        break;
    }

    if (output.stream) {
        args.format.push_back("-f");
        args.format.push_back(to_string(container));
        if (*output.stream == StreamFormat::Mp4Fragmented) {
            args.format.push_back("-movflags");
            args.format.push_back("frag_keyframe+empty_moov");
        }
    } else if (container == Container::ImageSequence) {
        args.format = {"-f", "image2"};
    }
    return args;
}

} // namespace compiler
} // namespace vcomp
