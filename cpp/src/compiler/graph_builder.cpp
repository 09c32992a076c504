/**
 * Filter Graph Builder Implementation
 */

#include "graph_builder.hpp"
#include "compiler/geometry.hpp"
#include "compiler/timing.hpp"
#include "utils/format.hpp"

#include <cmath>

namespace vcomp {
namespace compiler {

namespace {

bool is_stream_ref(const std::string& label) {
    return label.find(':') != std::string::npos;
}

// Angle normalised to (-360, 360); 0 when the frame stays upright
double effective_rotation(double degrees) {
    double r = std::fmod(degrees, 360.0);
    if (std::fabs(r) < 1e-9) return 0.0;
    return r;
}

std::string color_source(const scene::ColorFill& fill, const scene::Canvas& canvas) {
    std::string color = fill.color;
    if (fill.alpha < 1.0) color += "@" + utils::format_number(fill.alpha);
    return "color=c=" + color + ":size=" + std::to_string(canvas.width) + "x" +
           std::to_string(canvas.height) + ":rate=" + canvas.fps.to_string();
}

struct AudioSource {
    std::string stream;
    int64_t delay_us;
    std::optional<int64_t> end_us;
    double volume;
};

} // namespace

GraphBuilder::GraphBuilder(const scene::Canvas& canvas,
                           const config::Defaults& defaults,
                           Diagnostics& diagnostics)
    : canvas_(canvas)
    , defaults_(defaults)
    , diagnostics_(diagnostics)
{
}

BuildResult GraphBuilder::build(const scene::SceneSnapshot& scene, const BuildOptions& options) {
    BuildResult result;
    std::string composite = add_background(scene.background, options.keep_alpha, result);

    IngestOptions ingest;
    ingest.mask_threshold = defaults_.mask_threshold;

    std::vector<std::optional<std::string>> layer_audio;
    for (size_t i = 0; i < scene.layers.size(); i++) {
        const scene::LayerState& layer = scene.layers[i];
        std::string prefix = "l" + std::to_string(i + 1);

        IngestResult ingested = plan_ingest(layer.source, layer.alpha_enabled, prefix,
                                            ingest, result.inputs, result.graph);
        layer_audio.push_back(ingested.audio);

        std::string stream = add_layer_chain(layer, prefix, ingested.video, result);
        Position pos = resolve_position(layer, canvas_);
        EnablePredicate enable(resolve_timing(layer.timing));

        std::string params = "x='" + pos.x + "':y='" + pos.y + "':eof_action=pass";
        if (!enable.always()) params += ":enable='" + enable.expression() + "'";
        if (options.keep_alpha) params += ":format=rgb";

        std::string out = "ov" + std::to_string(i + 1);
        result.graph.add("overlay", {composite, stream}, {out}, params);
        composite = out;
    }

    if (options.stacked) {
        add_stacked_output(composite, *options.stacked, result);
    } else {
        finish_video(composite, result);
    }

    add_audio(scene, layer_audio, options, result);
    return result;
}

std::string GraphBuilder::add_background(const std::optional<scene::Background>& background,
                                         bool keep_alpha, BuildResult& result) {
    scene::Background bg = background ? *background : scene::Background::transparent();
    const scene::BackgroundSource& source = bg.source();
    std::string base;

    if (const auto* fill = std::get_if<scene::ColorFill>(&source)) {
        InputSpec input;
        input.options = {"-f", "lavfi"};
        input.url = color_source(*fill, canvas_);
        int index = result.inputs.add(input);
        base = std::to_string(index) + ":v";
        if (keep_alpha && fill->alpha < 1.0) {
            base = result.graph.chain(base, "format", "rgba", "bg");
        }
        return base;
    }

    scene::FrameRate source_fps = canvas_.fps;
    if (const auto* image = std::get_if<scene::StillImage>(&source)) {
        InputSpec input;
        input.options = {"-loop", "1", "-framerate", canvas_.fps.to_string()};
        input.url = image->path;
        base = std::to_string(result.inputs.add(input)) + ":v";
    } else if (const auto* clip = std::get_if<scene::VideoClip>(&source)) {
        InputSpec input;
        input.options = trim_options(bg.trim());
        input.url = clip->path;
        base = std::to_string(result.inputs.add(input)) + ":v";
        source_fps = clip->media.fps;
    }

    // Fill the canvas, cropping the overflow around the center
    if (bg.width() != canvas_.width || bg.height() != canvas_.height) {
        std::string w = std::to_string(canvas_.width);
        std::string h = std::to_string(canvas_.height);
        base = result.graph.chain(base, "scale", w + ":" + h + ":force_original_aspect_ratio=increase", "bg_scaled");
        base = result.graph.chain(base, "crop", w + ":" + h, "bg_fit");
    }
    if (source_fps != canvas_.fps) {
        base = result.graph.chain(base, "fps", canvas_.fps.to_string(), "bg_rate");
    }
    return base;
}

std::string GraphBuilder::add_layer_chain(const scene::LayerState& layer, const std::string& prefix,
                                          const std::string& source, BuildResult& result) {
    FilterGraph& graph = result.graph;
    std::string stream = source;

    TimeWindow window = resolve_timing(layer.timing);
    if (window.start_us > 0) {
        stream = graph.chain(stream, "setpts",
                             "PTS-STARTPTS+" + utils::format_seconds(window.start_us) + "/TB",
                             prefix + "_shift");
    }

    if (layer.crop) {
        const scene::CropRect& c = *layer.crop;
        stream = graph.chain(stream, "crop",
                             std::to_string(c.width) + ":" + std::to_string(c.height) + ":" +
                             std::to_string(c.x) + ":" + std::to_string(c.y),
                             prefix + "_crop");
    }

    std::optional<ScaleTarget> scale = resolve_scale(layer.size, canvas_);
    if (scale) {
        stream = graph.chain(stream, "scale", scale->params(), prefix + "_scale");
    }

    double rotation = effective_rotation(layer.rotation);
    if (rotation != 0.0) {
        std::string angle = utils::format_number(rotation) + "*PI/180";
        stream = graph.chain(stream, "rotate",
                             "a=" + angle + ":ow=rotw(" + angle + "):oh=roth(" + angle + "):c=none",
                             prefix + "_rotate");
    }

    // After rotation so the transparent corners stay transparent
    if (layer.opacity < 1.0) {
        stream = graph.chain(stream, "colorchannelmixer", "aa=" + utils::format_number(layer.opacity),
                             prefix + "_fade");
    }
    return stream;
}

void GraphBuilder::add_stacked_output(const std::string& composite, StackLayout layout, BuildResult& result) {
    FilterGraph& graph = result.graph;
    std::string rgba = graph.chain(composite, "format", "rgba", "stack_rgba");
    graph.add("split", {rgba}, {"stack_color_src", "stack_alpha_src"}, "2");
    std::string color = graph.chain("stack_color_src", "format", "rgb24", "stack_color");
    std::string alpha = graph.chain("stack_alpha_src", "alphaextract", "", "stack_alpha_gray");
    alpha = graph.chain(alpha, "format", "rgb24", "stack_alpha");
    graph.add(layout == StackLayout::Vertical ? "vstack" : "hstack", {color, alpha}, {"vout"}, "inputs=2");
    result.video_map = "[vout]";
}

void GraphBuilder::finish_video(const std::string& label, BuildResult& result) {
    if (is_stream_ref(label)) {
        result.video_map = label;
        return;
    }
    result.graph.rename(label, "vout");
    result.video_map = "[vout]";
}

void GraphBuilder::add_audio(const scene::SceneSnapshot& scene,
                             const std::vector<std::optional<std::string>>& layer_audio,
                             const BuildOptions& options, BuildResult& result) {
    std::vector<AudioSource> sources;

    if (scene.background && scene.background->has_audio() && scene.background->audio_enabled()) {
        sources.push_back(AudioSource{"0:a", 0, std::nullopt, scene.background->audio_volume()});
    }
    for (size_t i = 0; i < scene.layers.size(); i++) {
        const scene::LayerState& layer = scene.layers[i];
        if (!layer.audio.enabled || !layer_audio[i]) continue;
        TimeWindow window = resolve_timing(layer.timing);
        sources.push_back(AudioSource{*layer_audio[i], window.start_us, window.end_us, layer.audio.volume});
    }

    if (sources.empty()) {
        diagnostics_.note("Audio", "no audio sources; output has no audio track");
        return;
    }
    if (!options.audio_supported) {
        diagnostics_.warn("Audio", "output container cannot carry audio; dropping " +
                          std::to_string(sources.size()) + " audio source(s)");
        return;
    }

    FilterGraph& graph = result.graph;
    std::vector<std::string> mix_inputs;
    for (size_t i = 0; i < sources.size(); i++) {
        const AudioSource& src = sources[i];
        std::string prefix = "a" + std::to_string(i + 1);
        std::string stream = src.stream;

        if (src.delay_us > 0) {
            stream = graph.chain(stream, "adelay",
                                 utils::format_number(src.delay_us / 1000.0) + ":all=1",
                                 prefix + "_delay");
        }
        if (src.end_us) {
            stream = graph.chain(stream, "atrim", "end=" + utils::format_seconds(*src.end_us),
                                 prefix + "_trim");
        }
        if (src.volume != 1.0) {
            stream = graph.chain(stream, "volume", utils::format_number(src.volume),
                                 prefix + "_gain");
        }
        mix_inputs.push_back(stream);
    }

    if (mix_inputs.size() == 1) {
        if (is_stream_ref(mix_inputs[0])) {
            result.audio_map = mix_inputs[0];
        } else {
            graph.rename(mix_inputs[0], "aout");
            result.audio_map = "[aout]";
        }
        return;
    }

    // Summed, not averaged
    graph.add("amix", mix_inputs, {"aout"},
              "inputs=" + std::to_string(mix_inputs.size()) + ":duration=longest:normalize=0");
    result.audio_map = "[aout]";
}

} // namespace compiler
} // namespace vcomp
