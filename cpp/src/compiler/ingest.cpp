/**
 * Format Ingestion Planner Implementation
 */

#include "ingest.hpp"
#include "utils/format.hpp"

#include <type_traits>

namespace vcomp {
namespace compiler {

namespace {

std::string video_stream(int index) {
    return std::to_string(index) + ":v";
}

std::string audio_stream(int index) {
    return std::to_string(index) + ":a";
}

struct CropPair {
    std::string color;
    std::string alpha;
};

// Crop parameters (w:h:x:y) of both regions of a stacked carrier
CropPair stacked_crops(scene::StackOrientation orientation, scene::StackOrder order) {
    std::string first;
    std::string second;
    if (orientation == scene::StackOrientation::SideBySide) {
        first = "iw/2:ih:0:0";
        second = "iw/2:ih:iw/2:0";
    } else {
        first = "iw:ih/2:0:0";
        second = "iw:ih/2:0:ih/2";
    }
    if (order == scene::StackOrder::ColorFirst) return CropPair{first, second};
    return CropPair{second, first};
}

// Color stream without alpha, re-expanded to opaque RGBA
std::string make_opaque(FilterGraph& graph, const std::string& in, const std::string& prefix) {
    std::string rgb = graph.chain(in, "format", "rgb24", prefix + "_rgb");
    return graph.chain(rgb, "format", "rgba", prefix + "_src");
}

// Grey mask, thresholded, merged as alpha into the color stream
std::string merge_mask(FilterGraph& graph,
                       const std::string& color_in,
                       const std::string& mask_in,
                       const std::string& prefix,
                       const IngestOptions& options) {
    std::string color = graph.chain(color_in, "format", "rgba", prefix + "_color");
    std::string mask = graph.chain(mask_in, "format", "gray", prefix + "_gray");
    if (options.mask_threshold > 0) {
        mask = graph.chain(mask, "geq",
                           "lum='if(gte(lum(X,Y)," + std::to_string(options.mask_threshold) + "),255,0)'",
                           prefix + "_mask");
    }
    std::string out = prefix + "_src";
    graph.add("alphamerge", {color, mask}, {out});
    return out;
}

InputSpec media_input(const std::string& url, const std::optional<scene::SourceTrim>& trim) {
    InputSpec input;
    input.options = trim_options(trim);
    input.url = url;
    return input;
}

InputSpec sequence_input(const std::string& pattern, const scene::FrameSequence& seq,
                         const std::optional<scene::SourceTrim>& trim) {
    InputSpec input;
    input.options = {"-framerate", seq.rate.to_string(),
                     "-start_number", std::to_string(seq.start_number)};
    std::vector<std::string> cut = trim_options(trim);
    input.options.insert(input.options.end(), cut.begin(), cut.end());
    input.url = pattern;
    return input;
}

} // namespace

int InputTable::add(const InputSpec& input) {
    inputs_.push_back(input);
    return static_cast<int>(inputs_.size()) - 1;
}

std::vector<std::string> trim_options(const std::optional<scene::SourceTrim>& trim) {
    std::vector<std::string> out;
    if (!trim) return out;
    if (trim->start > 0.0) {
        out.push_back("-ss");
        out.push_back(utils::format_number(trim->start));
    }
    if (trim->end) {
        out.push_back("-t");
        out.push_back(utils::format_number(*trim->end - trim->start));
    }
    return out;
}

IngestResult plan_ingest(const scene::Foreground& source,
                         bool alpha_enabled,
                         const std::string& prefix,
                         const IngestOptions& options,
                         InputTable& inputs,
                         FilterGraph& graph) {
    const scene::MediaInfo& media = source.media();
    const std::optional<scene::SourceTrim>& trim = source.trim();

    return std::visit([&](const auto& encoding) -> IngestResult {
        using T = std::decay_t<decltype(encoding)>;
        IngestResult result;

        if constexpr (std::is_same_v<T, scene::NativeAlpha>) {
            InputSpec input = media_input(encoding.path, trim);
            // The native VP9 decoder drops the alpha plane
            if (media.codec == "vp9") {
                std::vector<std::string> decoder = {"-c:v", "libvpx-vp9"};
                input.options.insert(input.options.begin(), decoder.begin(), decoder.end());
            }
            int index = inputs.add(input);
            if (alpha_enabled) {
                result.video = graph.chain(video_stream(index), "format", "rgba", prefix + "_src");
            } else {
                result.video = make_opaque(graph, video_stream(index), prefix);
            }
            if (media.has_audio) result.audio = audio_stream(index);
        } else if constexpr (std::is_same_v<T, scene::StackedLayout>) {
            int index = inputs.add(media_input(encoding.path, trim));
            CropPair crops = stacked_crops(encoding.orientation, encoding.order);
            if (alpha_enabled) {
                std::string carrier_color = prefix + "_carrier_color";
                std::string carrier_alpha = prefix + "_carrier_alpha";
                graph.add("split", {video_stream(index)}, {carrier_color, carrier_alpha}, "2");
                std::string color = graph.chain(carrier_color, "crop", crops.color, prefix + "_crop_color");
                std::string alpha = graph.chain(carrier_alpha, "crop", crops.alpha, prefix + "_crop_alpha");
                result.video = merge_mask(graph, color, alpha, prefix, options);
            } else {
                std::string color = graph.chain(video_stream(index), "crop", crops.color, prefix + "_crop_color");
                result.video = make_opaque(graph, color, prefix);
            }
            if (media.has_audio) result.audio = audio_stream(index);
        } else if constexpr (std::is_same_v<T, scene::FrameSequence>) {
            int color_index = inputs.add(sequence_input(encoding.color_pattern, encoding, trim));
            if (alpha_enabled) {
                int alpha_index = inputs.add(sequence_input(encoding.alpha_pattern, encoding, trim));
                result.video = merge_mask(graph, video_stream(color_index), video_stream(alpha_index),
                                          prefix, options);
            } else {
                result.video = make_opaque(graph, video_stream(color_index), prefix);
            }
        } else if constexpr (std::is_same_v<T, scene::SplitMask>) {
            int color_index = inputs.add(media_input(encoding.color_path, trim));
            if (alpha_enabled) {
                int mask_index = inputs.add(media_input(encoding.mask_path, trim));
                result.video = merge_mask(graph, video_stream(color_index), video_stream(mask_index),
                                          prefix, options);
            } else {
                result.video = make_opaque(graph, video_stream(color_index), prefix);
            }
            if (!encoding.audio_path.empty()) {
                int audio_index = inputs.add(media_input(encoding.audio_path, trim));
                result.audio = audio_stream(audio_index);
            } else if (media.has_audio) {
                result.audio = audio_stream(color_index);
            }
        } else {
            static_assert(std::is_same_v<T, void>, "unhandled transparency encoding");
        }
        return result;
    }, source.encoding());
}

} // namespace compiler
} // namespace vcomp
