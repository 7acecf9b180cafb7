#ifndef QUATERNET_LAYERS_LAYER_HPP
#define QUATERNET_LAYERS_LAYER_HPP

#include "../core/Tensor.hpp"
#include <string>
#include <vector>

namespace quaternet {
namespace layers {

template <typename T>
class Layer {
public:
    virtual ~Layer() = default;

    // Forward pass: Input -> Output
    virtual Tensor<T> forward(const Tensor<T>& input) = 0;

    // Backward pass for the most recent forward call: Gradient of Output -> Gradient of Input.
    // Parameter gradients are accumulated into gradients().
    virtual Tensor<T> backward(const Tensor<T>& grad_output) = 0;

    // Parameters (weights, biases) for an external optimizer, in the same order as gradients()
    virtual std::vector<Tensor<T>*> parameters() { return {}; }

    virtual std::vector<Tensor<T>*> gradients() { return {}; }

    void zero_grad() {
        for (auto* g : gradients()) g->fill(0);
    }

    virtual std::string name() const = 0;
};

} // namespace layers
} // namespace quaternet

#endif // QUATERNET_LAYERS_LAYER_HPP
