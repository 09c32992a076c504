/**
 * Foreground source descriptors
 */

#include "foreground.hpp"
#include "scene/errors.hpp"
#include "utils/format.hpp"

#include <algorithm>
#include <cmath>

namespace vcomp {
namespace scene {

namespace {

void require_path(const std::string& path, const char* what) {
    if (path.empty()) {
        throw ConfigurationError(std::string("foreground ") + what + " path is empty");
    }
}

void require_media(const MediaInfo& media) {
    if (media.width <= 0 || media.height <= 0) {
        throw ConfigurationError("foreground dimensions must be positive, got " +
                                 std::to_string(media.width) + "x" +
                                 std::to_string(media.height));
    }
    if (!media.fps.valid()) {
        throw ConfigurationError("foreground frame rate must be positive");
    }
    if (media.duration < 0.0) {
        throw ConfigurationError("foreground duration must not be negative");
    }
}

std::string normalize(const std::string& text) {
    std::string out = utils::to_lower(text);
    for (char& c : out) {
        if (c == '_') c = '-';
    }
    return out;
}

} // namespace

bool parse_stack_orientation(const std::string& text, StackOrientation& out) {
    std::string name = normalize(text);
    if (name == "side-by-side" || name == "horizontal") {
        out = StackOrientation::SideBySide;
        return true;
    }
    if (name == "top-bottom" || name == "vertical") {
        out = StackOrientation::TopBottom;
        return true;
    }
    return false;
}

bool parse_stack_order(const std::string& text, StackOrder& out) {
    std::string name = normalize(text);
    if (name == "color-first") {
        out = StackOrder::ColorFirst;
        return true;
    }
    if (name == "alpha-first") {
        out = StackOrder::AlphaFirst;
        return true;
    }
    return false;
}

Foreground::Foreground(TransparencyEncoding encoding, const MediaInfo& media)
    : encoding_(std::move(encoding))
    , media_(media)
{
}

Foreground Foreground::native_alpha(const std::string& path, const MediaInfo& media) {
    require_path(path, "video");
    require_media(media);
    return Foreground(NativeAlpha{path}, media);
}

Foreground Foreground::stacked(const std::string& path,
                               StackOrientation orientation,
                               StackOrder order,
                               const MediaInfo& media) {
    require_path(path, "stacked video");
    require_media(media);

    int split_axis = (orientation == StackOrientation::SideBySide) ? media.width : media.height;
    if (split_axis < 2) {
        throw ConfigurationError("stacked carrier too small to split: " +
                                 std::to_string(media.width) + "x" +
                                 std::to_string(media.height));
    }
    return Foreground(StackedLayout{path, orientation, order}, media);
}

Foreground Foreground::frame_sequence(const std::string& color_pattern,
                                      const std::string& alpha_pattern,
                                      int start_number,
                                      const MediaInfo& media) {
    require_path(color_pattern, "color sequence");
    require_path(alpha_pattern, "alpha sequence");
    require_media(media);
    if (start_number < 0) {
        throw ConfigurationError("frame sequence start number must not be negative");
    }

    MediaInfo info = media;
    info.has_audio = false;
    return Foreground(FrameSequence{color_pattern, alpha_pattern, media.fps, start_number}, info);
}

Foreground Foreground::split_mask(const std::string& color_path,
                                  const std::string& mask_path,
                                  const std::string& audio_path,
                                  const MediaInfo& media) {
    require_path(color_path, "color video");
    require_path(mask_path, "mask video");
    require_media(media);
    return Foreground(SplitMask{color_path, mask_path, audio_path}, media);
}

Foreground Foreground::from_descriptor(const ForegroundDescriptor& descriptor) {
    std::string format = normalize(descriptor.format);

    if (format == "native-alpha" || format == "webm-vp9" || format == "mov-prores") {
        return native_alpha(descriptor.path, descriptor.media);
    }
    if (format == "stacked" || format == "stacked-video") {
        if (!descriptor.orientation) {
            throw ConfigurationError("stacked foreground requires an orientation");
        }
        if (!descriptor.order) {
            throw ConfigurationError("stacked foreground requires a color/alpha order");
        }
        return stacked(descriptor.path, *descriptor.orientation, *descriptor.order,
                       descriptor.media);
    }
    if (format == "frame-sequence" || format == "png-sequence") {
        return frame_sequence(descriptor.path, descriptor.mask_path,
                              descriptor.start_number, descriptor.media);
    }
    if (format == "split-mask" || format == "pro-bundle") {
        return split_mask(descriptor.path, descriptor.mask_path,
                          descriptor.audio_path, descriptor.media);
    }
    throw ConfigurationError("unknown foreground format: '" + descriptor.format + "'");
}

int Foreground::source_width() const {
    if (const auto* stacked = std::get_if<StackedLayout>(&encoding_)) {
        if (stacked->orientation == StackOrientation::SideBySide) return media_.width / 2;
    }
    return media_.width;
}

int Foreground::source_height() const {
    if (const auto* stacked = std::get_if<StackedLayout>(&encoding_)) {
        if (stacked->orientation == StackOrientation::TopBottom) return media_.height / 2;
    }
    return media_.height;
}

bool Foreground::has_audio() const {
    if (const auto* split = std::get_if<SplitMask>(&encoding_)) {
        return !split->audio_path.empty() || media_.has_audio;
    }
    return media_.has_audio;
}

double Foreground::duration() const {
    if (!trim_) return media_.duration;

    double end = media_.duration;
    if (trim_->end && (end <= 0.0 || *trim_->end < end)) end = *trim_->end;
    if (end <= 0.0) return 0.0;
    return std::max(0.0, end - trim_->start);
}

Foreground Foreground::subclip(double start, std::optional<double> end) const {
    if (start < 0.0 || !std::isfinite(start)) {
        throw ConfigurationError("subclip start must not be negative");
    }
    if (end && *end <= start) {
        throw ConfigurationError("subclip end must be after its start");
    }
    if (media_.duration > 0.0 && start >= media_.duration) {
        throw ConfigurationError("subclip start " + utils::format_number(start) +
                                 "s is past the source end (" +
                                 utils::format_number(media_.duration) + "s)");
    }

    Foreground copy = *this;
    copy.trim_ = SourceTrim{start, end};
    return copy;
}

} // namespace scene
} // namespace vcomp
