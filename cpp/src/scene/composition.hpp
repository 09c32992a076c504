#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include "scene/types.hpp"
#include "scene/background.hpp"
#include "scene/layer.hpp"

namespace vcomp {
namespace scene {

/**
 * Immutable value copy of a Composition at one point in time
 *
 * Layers are ordered bottom to top.
 */
struct SceneSnapshot {
    std::optional<Canvas> canvas;
    std::optional<Background> background;
    std::vector<LayerState> layers;
    std::optional<double> duration;
};

/**
 * Layered scene: background plus an ordered stack of layers
 *
 * The first layer is the lowest. Compilation works on snapshot(), so
 * later edits never reach an already compiled program.
 */
class Composition {
public:
    Composition();
    explicit Composition(const Background& background);

    Composition(Composition&&) = default;
    Composition& operator=(Composition&&) = default;

    // Transparent background with an explicit canvas
    static Composition with_canvas(int width, int height, FrameRate fps);

    Composition& set_background(const Background& background);
    Composition& set_canvas(int width, int height, FrameRate fps);
    Composition& set_duration(double seconds);

    // Append on top of the stack
    Layer& add(const Foreground& source, const std::string& name = "");

    // Throws ConfigurationError for unknown ids
    Layer& layer(LayerId id);
    const Layer& layer(LayerId id) const;
    void remove(LayerId id);
    void move(LayerId id, size_t index);

    size_t layer_count() const { return layers_.size(); }
    const std::optional<Background>& background() const { return background_; }
    const std::optional<Canvas>& canvas() const { return canvas_; }

    SceneSnapshot snapshot() const;

private:
    size_t index_of(LayerId id) const;

    std::optional<Background> background_;
    std::optional<Canvas> canvas_;
    std::optional<double> duration_;
    std::vector<std::unique_ptr<Layer>> layers_;
    LayerId next_id_;
};

} // namespace scene
} // namespace vcomp
