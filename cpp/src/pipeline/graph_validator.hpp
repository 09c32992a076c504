#pragma once

#include <string>

#include "compiler/program.hpp"

namespace vcomp {
namespace pipeline {

/**
 * Graph Validator
 *
 * Parses a program's filter graph with libavfilter without running it
 * and checks that every open pad is an input stream or a mapped output.
 */
class GraphValidator {
public:
    GraphValidator() = default;

    // False with a reason in *error on the first problem found
    bool validate(const compiler::CompiledProgram& program, std::string* error) const;
};

} // namespace pipeline
} // namespace vcomp
