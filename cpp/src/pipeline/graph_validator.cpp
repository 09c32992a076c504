/**
 * Graph Validator Implementation
 */

#include "graph_validator.hpp"

extern "C" {
#include <libavfilter/avfilter.h>
#include <libavutil/error.h>
}

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <set>

namespace vcomp {
namespace pipeline {

namespace {

struct GraphDeleter {
    void operator()(AVFilterGraph* graph) const { avfilter_graph_free(&graph); }
};

struct InOutDeleter {
    void operator()(AVFilterInOut* inout) const { avfilter_inout_free(&inout); }
};

using GraphPtr = std::unique_ptr<AVFilterGraph, GraphDeleter>;
using InOutPtr = std::unique_ptr<AVFilterInOut, InOutDeleter>;

// "3:v" -> 3, -1 when the label is not an input stream reference
int stream_index(const std::string& label) {
    size_t colon = label.find(':');
    if (colon == std::string::npos || colon == 0) return -1;
    std::string digits = label.substr(0, colon);
    for (char c : digits) {
        if (c < '0' || c > '9') return -1;
    }
    std::string kind = label.substr(colon + 1);
    if (kind != "v" && kind != "a") return -1;
    return std::atoi(digits.c_str());
}

std::string strip_brackets(const std::string& label) {
    if (label.size() >= 2 && label.front() == '[' && label.back() == ']') {
        return label.substr(1, label.size() - 2);
    }
    return label;
}

void set_error(std::string* error, const std::string& message) {
    if (error) *error = message;
}

} // namespace

bool GraphValidator::validate(const compiler::CompiledProgram& program, std::string* error) const {
    std::string description = program.filter_graph();
    if (description.empty()) return true;

    GraphPtr graph(avfilter_graph_alloc());
    if (!graph) {
        set_error(error, "failed to allocate filter graph");
        return false;
    }

    AVFilterInOut* raw_inputs = nullptr;
    AVFilterInOut* raw_outputs = nullptr;
    int ret = avfilter_graph_parse2(graph.get(), description.c_str(), &raw_inputs, &raw_outputs);
    InOutPtr open_inputs(raw_inputs);
    InOutPtr open_outputs(raw_outputs);
    if (ret < 0) {
        char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(ret, buf, sizeof(buf));
        set_error(error, std::string("filter graph does not parse: ") + buf);
        fprintf(stderr, "[Validate] Parse failed: %s\n", buf);
        return false;
    }

    int input_count = static_cast<int>(program.inputs().size());
    for (AVFilterInOut* pad = open_inputs.get(); pad; pad = pad->next) {
        std::string name = pad->name ? pad->name : "";
        int index = stream_index(name);
        if (index < 0 || index >= input_count) {
            set_error(error, "unconnected filter input [" + name + "]");
            return false;
        }
    }

    std::set<std::string> mapped;
    mapped.insert(strip_brackets(program.video_map()));
    if (program.audio_map()) mapped.insert(strip_brackets(*program.audio_map()));

    for (AVFilterInOut* pad = open_outputs.get(); pad; pad = pad->next) {
        std::string name = pad->name ? pad->name : "";
        if (mapped.count(name) == 0) {
            set_error(error, "filter output [" + name + "] is never mapped");
            return false;
        }
    }

    fprintf(stderr, "[Validate] Graph OK: %u filters\n", graph->nb_filters);
    return true;
}

} // namespace pipeline
} // namespace vcomp
