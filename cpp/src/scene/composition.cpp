/**
 * Composition Implementation
 */

#include "composition.hpp"
#include "scene/errors.hpp"

#include <cmath>

namespace vcomp {
namespace scene {

Composition::Composition()
    : next_id_(1)
{
}

Composition::Composition(const Background& background)
    : background_(background)
    , next_id_(1)
{
}

Composition Composition::with_canvas(int width, int height, FrameRate fps) {
    Composition composition(Background::transparent());
    composition.set_canvas(width, height, fps);
    return composition;
}

Composition& Composition::set_background(const Background& background) {
    background_ = background;
    return *this;
}

Composition& Composition::set_canvas(int width, int height, FrameRate fps) {
    if (width <= 0 || height <= 0) {
        throw ConfigurationError("canvas dimensions must be positive, got " +
                                 std::to_string(width) + "x" + std::to_string(height));
    }
    if (!fps.valid()) {
        throw ConfigurationError("canvas frame rate must be positive");
    }
    canvas_ = Canvas{width, height, fps};
    return *this;
}

Composition& Composition::set_duration(double seconds) {
    if (!(std::isfinite(seconds) && seconds > 0.0)) {
        throw ConfigurationError("composition duration must be positive");
    }
    duration_ = seconds;
    return *this;
}

Layer& Composition::add(const Foreground& source, const std::string& name) {
    LayerId id = next_id_++;
    std::string layer_name = name.empty() ? "layer" + std::to_string(id) : name;
    layers_.push_back(std::make_unique<Layer>(id, layer_name, source));
    return *layers_.back();
}

size_t Composition::index_of(LayerId id) const {
    for (size_t i = 0; i < layers_.size(); i++) {
        if (layers_[i]->id() == id) return i;
    }
    throw ConfigurationError("no layer with id " + std::to_string(id));
}

Layer& Composition::layer(LayerId id) {
    return *layers_[index_of(id)];
}

const Layer& Composition::layer(LayerId id) const {
    return *layers_[index_of(id)];
}

void Composition::remove(LayerId id) {
    layers_.erase(layers_.begin() + static_cast<std::ptrdiff_t>(index_of(id)));
}

void Composition::move(LayerId id, size_t index) {
    size_t from = index_of(id);
    if (index >= layers_.size()) {
        throw ConfigurationError("layer index " + std::to_string(index) + " out of range");
    }
    std::unique_ptr<Layer> moved = std::move(layers_[from]);
    layers_.erase(layers_.begin() + static_cast<std::ptrdiff_t>(from));
    layers_.insert(layers_.begin() + static_cast<std::ptrdiff_t>(index), std::move(moved));
}

SceneSnapshot Composition::snapshot() const {
    SceneSnapshot snap;
    snap.canvas = canvas_;
    snap.background = background_;
    snap.duration = duration_;
    snap.layers.reserve(layers_.size());
    for (const auto& layer : layers_) {
        snap.layers.push_back(layer->state());
    }
    return snap;
}

} // namespace scene
} // namespace vcomp
