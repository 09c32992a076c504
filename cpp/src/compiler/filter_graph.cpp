/**
 * Filter graph serialization
 */

#include "filter_graph.hpp"

#include <map>

namespace vcomp {
namespace compiler {

namespace {

std::string pads(const std::vector<std::string>& labels) {
    std::string out;
    for (const auto& label : labels) {
        out += "[" + label + "]";
    }
    return out;
}

} // namespace

std::string FilterNode::body() const {
    if (params.empty()) return operation;
    return operation + "=" + params;
}

const FilterNode& FilterGraph::add(const std::string& operation,
                                   const std::vector<std::string>& inputs,
                                   const std::vector<std::string>& outputs,
                                   const std::string& params) {
    nodes_.push_back(FilterNode{operation, inputs, outputs, params});
    return nodes_.back();
}

std::string FilterGraph::chain(const std::string& input, const std::string& operation,
                               const std::string& params, const std::string& output) {
    add(operation, {input}, {output}, params);
    return output;
}

void FilterGraph::rename(const std::string& from, const std::string& to) {
    for (auto& node : nodes_) {
        for (auto& in : node.inputs) {
            if (in == from) in = to;
        }
        for (auto& out : node.outputs) {
            if (out == from) out = to;
        }
    }
}

std::string FilterGraph::serialize() const {
    return serialize(nodes_);
}

std::string FilterGraph::serialize(const std::vector<FilterNode>& nodes) {
    std::map<std::string, int> uses;
    for (const auto& node : nodes) {
        for (const auto& in : node.inputs) uses[in]++;
    }

    std::string out;
    for (size_t i = 0; i < nodes.size(); i++) {
        const FilterNode& node = nodes[i];

        // Continue the previous chain when it hands its only output straight to us
        bool joined = false;
        if (i > 0) {
            const FilterNode& prev = nodes[i - 1];
            joined = prev.outputs.size() == 1 && node.inputs.size() == 1 &&
                     node.inputs[0] == prev.outputs[0] && uses[node.inputs[0]] == 1;
        }

        if (i > 0) out += joined ? "," : ";";
        if (!joined) out += pads(node.inputs);
        out += node.body();

        bool continues = false;
        if (i + 1 < nodes.size()) {
            const FilterNode& next = nodes[i + 1];
            continues = node.outputs.size() == 1 && next.inputs.size() == 1 &&
                        next.inputs[0] == node.outputs[0] && uses[node.outputs[0]] == 1;
        }
        if (!continues) out += pads(node.outputs);
    }
    return out;
}

} // namespace compiler
} // namespace vcomp
