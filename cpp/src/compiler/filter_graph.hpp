#pragma once

#include <string>
#include <vector>

namespace vcomp {
namespace compiler {

/**
 * One filter invocation: [in...]operation=params[out...]
 *
 * Labels are pad names; engine stream references ("0:v", "2:a") are
 * valid inputs.
 */
struct FilterNode {
    std::string operation;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::string params;

    // "operation=params" without pad labels
    std::string body() const;

    bool operator==(const FilterNode& other) const {
        return operation == other.operation && inputs == other.inputs &&
               outputs == other.outputs && params == other.params;
    }
};

// One media input of the engine with the options placed before its -i
struct InputSpec {
    std::vector<std::string> options;
    std::string url;

    bool operator==(const InputSpec& other) const {
        return options == other.options && url == other.url;
    }
};

/**
 * Ordered filter node list with label allocation
 */
class FilterGraph {
public:
    FilterGraph() = default;

    const FilterNode& add(const std::string& operation,
                          const std::vector<std::string>& inputs,
                          const std::vector<std::string>& outputs,
                          const std::string& params = "");

    // Single input, single fresh output; returns the output label
    std::string chain(const std::string& input, const std::string& operation,
                      const std::string& params, const std::string& output);

    // Rename a pad everywhere it appears
    void rename(const std::string& from, const std::string& to);

    const std::vector<FilterNode>& nodes() const { return nodes_; }
    bool empty() const { return nodes_.empty(); }

    // Engine filter-graph text: linear runs joined with ',', chains with ';'
    std::string serialize() const;

    static std::string serialize(const std::vector<FilterNode>& nodes);

private:
    std::vector<FilterNode> nodes_;
};

} // namespace compiler
} // namespace vcomp
