/**
 * Scene Loader Implementation
 */

#include "scene_loader.hpp"
#include "scene/errors.hpp"
#include "config/defaults.hpp"

#include <json/json.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <cstdio>

namespace vcomp {
namespace pipeline {

namespace {

const Json::Value& member(const Json::Value& node, const char* key) {
    static const Json::Value null_value;
    if (!node.isObject() || !node.isMember(key)) return null_value;
    return node[key];
}

bool has(const Json::Value& node, const char* key) {
    return node.isObject() && node.isMember(key) && !node[key].isNull();
}

double get_number(const Json::Value& node, const char* key) {
    const Json::Value& value = member(node, key);
    if (!value.isNumeric()) {
        throw ConfigurationError(std::string("'") + key + "' must be a number");
    }
    return value.asDouble();
}

int get_int(const Json::Value& node, const char* key) {
    const Json::Value& value = member(node, key);
    if (!value.isInt()) {
        throw ConfigurationError(std::string("'") + key + "' must be an integer");
    }
    return value.asInt();
}

std::string get_string(const Json::Value& node, const char* key) {
    const Json::Value& value = member(node, key);
    if (!value.isString()) {
        throw ConfigurationError(std::string("'") + key + "' must be a string");
    }
    return value.asString();
}

bool get_bool(const Json::Value& node, const char* key) {
    const Json::Value& value = member(node, key);
    if (!value.isBool()) {
        throw ConfigurationError(std::string("'") + key + "' must be true or false");
    }
    return value.asBool();
}

std::optional<double> optional_number(const Json::Value& node, const char* key) {
    if (!has(node, key)) return std::nullopt;
    return get_number(node, key);
}

void parse_subclip(const Json::Value& node, double* start, std::optional<double>* end) {
    *start = has(node, "start") ? get_number(node, "start") : 0.0;
    *end = optional_number(node, "end");
}

} // namespace

SceneLoader::SceneLoader(ProbeFunction probe)
    : probe_(probe)
{
}

SceneFile SceneLoader::load_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        fprintf(stderr, "[Scene] Failed to open: %s\n", path.c_str());
        throw ConfigurationError("cannot open scene file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    fprintf(stderr, "[Scene] Loading: %s\n", path.c_str());
    return load_string(buffer.str());
}

SceneFile SceneLoader::load_string(const std::string& text) const {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ConfigurationError("scene is not valid JSON: " + errors);
    }
    return load(root);
}

SceneFile SceneLoader::load(const Json::Value& root) const {
    if (!root.isObject()) {
        throw ConfigurationError("scene document must be a JSON object");
    }

    scene::Composition composition;
    if (has(root, "background")) {
        composition.set_background(parse_background(root["background"]));
    }

    if (has(root, "canvas")) {
        const Json::Value& canvas = root["canvas"];
        scene::FrameRate fps = has(canvas, "fps")
            ? scene::FrameRate::from_double(get_number(canvas, "fps"))
            : config::current().fps;
        composition.set_canvas(get_int(canvas, "width"), get_int(canvas, "height"), fps);
    }

    if (has(root, "duration")) {
        composition.set_duration(get_number(root, "duration"));
    }

    const Json::Value& layers = member(root, "layers");
    if (!layers.isNull() && !layers.isArray()) {
        throw ConfigurationError("'layers' must be an array");
    }
    for (Json::ArrayIndex i = 0; i < layers.size(); i++) {
        parse_layer(layers[i], composition);
    }

    compiler::EncoderProfile profile = has(root, "encoder")
        ? parse_encoder(root["encoder"])
        : compiler::EncoderProfile::h264();
    compiler::OutputTarget output = has(root, "output")
        ? parse_output(root["output"])
        : compiler::OutputTarget();

    fprintf(stderr, "[Scene] %zu layer(s), encoder %s\n", composition.layer_count(),
            compiler::to_string(profile.kind()));
    return SceneFile{std::move(composition), profile, output};
}

scene::MediaInfo SceneLoader::media_for(const Json::Value& source, const std::string& path) const {
    scene::MediaInfo info;
    if (has(source, "width") && has(source, "height")) {
        info.width = get_int(source, "width");
        info.height = get_int(source, "height");
        if (has(source, "fps")) info.fps = scene::FrameRate::from_double(get_number(source, "fps"));
        if (has(source, "duration")) info.duration = get_number(source, "duration");
        if (has(source, "has_audio")) info.has_audio = get_bool(source, "has_audio");
        if (has(source, "codec")) info.codec = get_string(source, "codec");
        return info;
    }

    if (!probe_ || !probe_(path, info)) {
        throw ConfigurationError("no dimensions given and cannot probe: " + path);
    }
    // Explicit values still win over probed ones
    if (has(source, "fps")) info.fps = scene::FrameRate::from_double(get_number(source, "fps"));
    if (has(source, "has_audio")) info.has_audio = get_bool(source, "has_audio");
    return info;
}

scene::Foreground SceneLoader::parse_foreground(const Json::Value& source) const {
    if (!source.isObject()) {
        throw ConfigurationError("layer 'source' must be an object");
    }

    scene::ForegroundDescriptor descriptor;
    descriptor.format = get_string(source, "format");
    descriptor.path = get_string(source, "path");
    if (has(source, "mask")) descriptor.mask_path = get_string(source, "mask");
    if (has(source, "audio")) descriptor.audio_path = get_string(source, "audio");
    if (has(source, "start_number")) descriptor.start_number = get_int(source, "start_number");

    if (has(source, "orientation")) {
        scene::StackOrientation orientation;
        if (!scene::parse_stack_orientation(get_string(source, "orientation"), orientation)) {
            throw ConfigurationError("unknown stack orientation: " + get_string(source, "orientation"));
        }
        descriptor.orientation = orientation;
    }
    if (has(source, "order")) {
        scene::StackOrder order;
        if (!scene::parse_stack_order(get_string(source, "order"), order)) {
            throw ConfigurationError("unknown stack order: " + get_string(source, "order"));
        }
        descriptor.order = order;
    }

    descriptor.media = media_for(source, descriptor.path);
    return scene::Foreground::from_descriptor(descriptor);
}

scene::Background SceneLoader::parse_background(const Json::Value& node) const {
    std::string type = get_string(node, "type");

    if (type == "transparent") {
        return scene::Background::transparent();
    }
    if (type == "color") {
        double alpha = has(node, "alpha") ? get_number(node, "alpha") : 1.0;
        return scene::Background::color(get_string(node, "color"), alpha);
    }

    std::string path = get_string(node, "path");
    scene::MediaInfo info = media_for(node, path);
    if (type == "image") {
        return scene::Background::image(path, info.width, info.height);
    }
    if (type == "video") {
        scene::Background bg = scene::Background::video(path, info);
        if (has(node, "subclip")) {
            double start = 0.0;
            std::optional<double> end;
            parse_subclip(node["subclip"], &start, &end);
            bg = bg.subclip(start, end);
        }
        if (has(node, "audio")) {
            const Json::Value& audio = node["audio"];
            if (audio.isBool()) {
                bg = bg.with_audio(audio.asBool());
            } else {
                bool enabled = has(audio, "enabled") ? get_bool(audio, "enabled") : true;
                double volume = has(audio, "volume") ? get_number(audio, "volume") : 1.0;
                bg = bg.with_audio(enabled, volume);
            }
        }
        return bg;
    }
    throw ConfigurationError("unknown background type: '" + type + "'");
}

void SceneLoader::parse_layer(const Json::Value& node, scene::Composition& composition) const {
    if (!node.isObject()) {
        throw ConfigurationError("each layer must be an object");
    }

    std::string name = has(node, "name") ? get_string(node, "name") : "";
    scene::Layer& layer = composition.add(parse_foreground(member(node, "source")), name);

    if (has(node, "x") || has(node, "y")) {
        layer.xy(get_string(node, "x"), get_string(node, "y"));
    } else if (has(node, "anchor") || has(node, "dx") || has(node, "dy")) {
        scene::Anchor anchor = scene::Anchor::Center;
        if (has(node, "anchor") && !scene::parse_anchor(get_string(node, "anchor"), anchor)) {
            throw ConfigurationError("unknown anchor: " + get_string(node, "anchor"));
        }
        int dx = has(node, "dx") ? get_int(node, "dx") : 0;
        int dy = has(node, "dy") ? get_int(node, "dy") : 0;
        layer.at(anchor, dx, dy);
    }

    if (has(node, "size")) {
        const Json::Value& size = node["size"];
        scene::SizeSpec spec;
        if (!scene::parse_size_mode(get_string(size, "mode"), spec.mode)) {
            throw ConfigurationError("unknown size mode: " + get_string(size, "mode"));
        }
        if (has(size, "width")) spec.width = get_int(size, "width");
        if (has(size, "height")) spec.height = get_int(size, "height");
        if (has(size, "percent")) spec.percent = get_number(size, "percent");
        if (has(size, "height_percent")) spec.height_percent = get_number(size, "height_percent");
        if (has(size, "factor")) spec.factor = get_number(size, "factor");
        if (has(size, "factor_y")) spec.factor_y = get_number(size, "factor_y");
        layer.size(spec);
    }

    if (has(node, "crop")) {
        const Json::Value& crop = node["crop"];
        layer.crop(get_int(crop, "x"), get_int(crop, "y"),
                   get_int(crop, "width"), get_int(crop, "height"));
    }
    if (has(node, "opacity")) layer.opacity(get_number(node, "opacity"));
    if (has(node, "rotate")) layer.rotate(get_number(node, "rotate"));
    if (has(node, "start")) layer.start(get_number(node, "start"));
    if (has(node, "end")) layer.end(get_number(node, "end"));
    if (has(node, "duration")) layer.duration(get_number(node, "duration"));

    if (has(node, "subclip")) {
        double start = 0.0;
        std::optional<double> end;
        parse_subclip(node["subclip"], &start, &end);
        layer.subclip(start, end);
    }

    if (has(node, "audio")) {
        const Json::Value& audio = node["audio"];
        if (audio.isBool()) {
            layer.audio(audio.asBool());
        } else {
            bool enabled = has(audio, "enabled") ? get_bool(audio, "enabled") : true;
            double volume = has(audio, "volume") ? get_number(audio, "volume") : 1.0;
            layer.audio(enabled, volume);
        }
    }
    if (has(node, "alpha")) layer.alpha(get_bool(node, "alpha"));
}

compiler::EncoderProfile SceneLoader::parse_encoder(const Json::Value& node) const {
    compiler::EncoderKind kind;
    std::string name = get_string(node, "kind");
    if (!compiler::parse_encoder_kind(name, kind)) {
        throw ConfigurationError("unknown encoder kind: '" + name + "'");
    }

    std::optional<int> crf;
    if (has(node, "crf")) crf = get_int(node, "crf");
    std::string preset = has(node, "preset") ? get_string(node, "preset") : "";

    compiler::EncoderProfile profile = compiler::EncoderProfile::h264();
    switch (kind) {
    case compiler::EncoderKind::H264:
        profile = compiler::EncoderProfile::h264(crf, preset);
        break;
    case compiler::EncoderKind::Vp9:
        profile = compiler::EncoderProfile::vp9(crf);
        break;
    case compiler::EncoderKind::TransparentWebm:
        profile = compiler::EncoderProfile::transparent_webm(crf);
        break;
    case compiler::EncoderKind::ProRes4444:
        profile = compiler::EncoderProfile::prores_4444();
        break;
    case compiler::EncoderKind::PngSequence: {
        std::optional<scene::FrameRate> rate;
        if (has(node, "fps")) rate = scene::FrameRate::from_double(get_number(node, "fps"));
        profile = compiler::EncoderProfile::png_sequence(rate);
        break;
    }
    case compiler::EncoderKind::StackedVideo: {
        compiler::StackLayout layout = compiler::StackLayout::Vertical;
        if (has(node, "layout")) {
            std::string text = get_string(node, "layout");
            if (text == "horizontal") layout = compiler::StackLayout::Horizontal;
            else if (text != "vertical") throw ConfigurationError("unknown stacked layout: " + text);
        }
        profile = compiler::EncoderProfile::stacked_video(layout, crf, preset);
        break;
    }
    case compiler::EncoderKind::RawVideo:
        profile = compiler::EncoderProfile::raw_video();
        break;
    }

    if (has(node, "bitrate")) profile = profile.with_bitrate(get_string(node, "bitrate"));
    return profile;
}

compiler::OutputTarget SceneLoader::parse_output(const Json::Value& node) const {
    if (has(node, "stream")) {
        compiler::StreamFormat format;
        std::string name = get_string(node, "stream");
        if (!compiler::parse_stream_format(name, format)) {
            throw ConfigurationError("unknown stream format: '" + name + "'");
        }
        return compiler::OutputTarget::pipe(format);
    }
    return compiler::OutputTarget::file(get_string(node, "path"));
}

} // namespace pipeline
} // namespace vcomp
