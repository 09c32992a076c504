#pragma once

#include <string>
#include <functional>

#include "scene/composition.hpp"
#include "compiler/encoder_profile.hpp"

namespace Json {
class Value;
}

namespace vcomp {
namespace pipeline {

// Fills MediaInfo for a path; false when the file cannot be read
using ProbeFunction = std::function<bool(const std::string&, scene::MediaInfo&)>;

struct SceneFile {
    scene::Composition composition;
    compiler::EncoderProfile profile;
    compiler::OutputTarget output;
};

/**
 * Scene Loader
 *
 * Builds a Composition, encoder profile and output target from a JSON
 * scene description. Sources without explicit dimensions are probed.
 * Throws ConfigurationError on malformed documents.
 */
class SceneLoader {
public:
    explicit SceneLoader(ProbeFunction probe);

    SceneFile load_file(const std::string& path) const;
    SceneFile load_string(const std::string& text) const;
    SceneFile load(const Json::Value& root) const;

private:
    scene::MediaInfo media_for(const Json::Value& source, const std::string& path) const;
    scene::Foreground parse_foreground(const Json::Value& source) const;
    scene::Background parse_background(const Json::Value& node) const;
    void parse_layer(const Json::Value& node, scene::Composition& composition) const;
    compiler::EncoderProfile parse_encoder(const Json::Value& node) const;
    compiler::OutputTarget parse_output(const Json::Value& node) const;

    ProbeFunction probe_;
};

} // namespace pipeline
} // namespace vcomp
