/**
 * Program Emitter Implementation
 */

#include "program.hpp"
#include "utils/format.hpp"

#include <json/json.h>

namespace vcomp {
namespace compiler {

CompiledProgram::CompiledProgram(Parts parts)
    : parts_(std::move(parts))
{
}

std::vector<FilterNode> CompiledProgram::nodes_named(const std::string& operation) const {
    std::vector<FilterNode> out;
    for (const auto& node : parts_.nodes) {
        if (node.operation == operation) out.push_back(node);
    }
    return out;
}

std::string CompiledProgram::filter_graph() const {
    return FilterGraph::serialize(parts_.nodes);
}

std::vector<std::string> CompiledProgram::arguments() const {
    std::vector<std::string> args;
    args.push_back("-y");

    for (const auto& input : parts_.inputs) {
        args.insert(args.end(), input.options.begin(), input.options.end());
        args.push_back("-i");
        args.push_back(input.url);
    }

    if (!parts_.nodes.empty()) {
        args.push_back("-filter_complex");
        args.push_back(filter_graph());
    }

    args.push_back("-map");
    args.push_back(parts_.video_map);
    if (parts_.audio_map) {
        args.push_back("-map");
        args.push_back(*parts_.audio_map);
    } else {
        args.push_back("-an");
    }

    if (parts_.duration) {
        args.push_back("-t");
        args.push_back(utils::format_number(*parts_.duration));
    }

    const EncoderArgs& enc = parts_.encoder;
    args.insert(args.end(), enc.video.begin(), enc.video.end());
    if (parts_.audio_map) {
        args.insert(args.end(), enc.audio.begin(), enc.audio.end());
    }
    args.insert(args.end(), enc.format.begin(), enc.format.end());

    args.push_back(parts_.output.url());
    return args;
}

std::vector<std::string> CompiledProgram::argv(const std::string& engine) const {
    std::vector<std::string> out;
    out.push_back(engine);
    std::vector<std::string> args = arguments();
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

std::string CompiledProgram::command_line(const std::string& engine) const {
    std::vector<std::string> quoted;
    for (const auto& arg : argv(engine)) {
        quoted.push_back(utils::shell_quote(arg));
    }
    return utils::join(quoted, " ");
}

void CompiledProgram::json_summary(Json::Value& root) const {
    root["canvas"]["width"] = parts_.canvas.width;
    root["canvas"]["height"] = parts_.canvas.height;
    root["canvas"]["fps"] = parts_.canvas.fps.to_string();
    if (parts_.duration) root["duration"] = *parts_.duration;
    root["requires_alpha"] = parts_.requires_alpha;

    Json::Value inputs(Json::arrayValue);
    for (const auto& input : parts_.inputs) {
        Json::Value entry;
        entry["url"] = input.url;
        Json::Value options(Json::arrayValue);
        for (const auto& opt : input.options) options.append(opt);
        entry["options"] = options;
        inputs.append(entry);
    }
    root["inputs"] = inputs;

    Json::Value nodes(Json::arrayValue);
    for (const auto& node : parts_.nodes) {
        Json::Value entry;
        entry["operation"] = node.operation;
        entry["params"] = node.params;
        Json::Value ins(Json::arrayValue);
        for (const auto& label : node.inputs) ins.append(label);
        Json::Value outs(Json::arrayValue);
        for (const auto& label : node.outputs) outs.append(label);
        entry["inputs"] = ins;
        entry["outputs"] = outs;
        nodes.append(entry);
    }
    root["nodes"] = nodes;
    root["filter_graph"] = filter_graph();

    root["map"]["video"] = parts_.video_map;
    if (parts_.audio_map) root["map"]["audio"] = *parts_.audio_map;

    Json::Value encoder(Json::arrayValue);
    for (const auto& arg : parts_.encoder.video) encoder.append(arg);
    root["encoder"] = encoder;
    root["output"] = parts_.output.url();

    Json::Value diagnostics(Json::arrayValue);
    for (const auto& diag : parts_.diagnostics) {
        Json::Value entry;
        entry["level"] = to_string(diag.level);
        entry["stage"] = diag.stage;
        entry["message"] = diag.message;
        diagnostics.append(entry);
    }
    root["diagnostics"] = diagnostics;
}

bool CompiledProgram::operator==(const CompiledProgram& other) const {
    return parts_.canvas == other.parts_.canvas &&
           parts_.inputs == other.parts_.inputs &&
           parts_.nodes == other.parts_.nodes &&
           parts_.video_map == other.parts_.video_map &&
           parts_.audio_map == other.parts_.audio_map &&
           parts_.duration == other.parts_.duration &&
           arguments() == other.arguments() &&
           parts_.requires_alpha == other.parts_.requires_alpha &&
           parts_.diagnostics == other.parts_.diagnostics;
}

} // namespace compiler
} // namespace vcomp
