#pragma once

#include "compiler/program.hpp"
#include "compiler/encoder_profile.hpp"
#include "config/defaults.hpp"
#include "scene/composition.hpp"

namespace vcomp {
namespace compiler {

/**
 * Composition Compiler
 *
 * Turns a scene snapshot plus an encoder profile and output target into
 * a CompiledProgram. Pure apart from diagnostics; the same snapshot always
 * yields the same program.
 */
class CompositionCompiler {
public:
    explicit CompositionCompiler(const config::Defaults& defaults = config::current());

    CompiledProgram compile(const scene::SceneSnapshot& scene,
                            const EncoderProfile& profile,
                            const OutputTarget& output) const;

    CompiledProgram compile(const scene::Composition& composition,
                            const EncoderProfile& profile,
                            const OutputTarget& output) const;

    // Scene needs an alpha-preserving output (transparent or absent background)
    static bool requires_alpha(const scene::SceneSnapshot& scene);

private:
    config::Defaults defaults_;
};

} // namespace compiler
} // namespace vcomp
