#ifndef QUATERNET_LAYERS_LINEAR_HPP
#define QUATERNET_LAYERS_LINEAR_HPP

#include "Layer.hpp"
#include "../functional/Linear.hpp"
#include "../core/Random.hpp"
#include <cmath>
#include <cstdint>

namespace quaternet {
namespace layers {

// Real-valued baseline with the same calling convention as QuaternionLinear.
template <typename T>
class Linear : public Layer<T> {
public:
    Linear(size_t in_features, size_t out_features, bool bias = true, uint32_t seed = 1337)
        : in_features_(in_features), out_features_(out_features),
          weight_({out_features, in_features}), grad_weight_({out_features, in_features})
    {
        // Xavier/Glorot Initialization (Uniform)
        // bound = sqrt(6 / (in + out))
        const T bound = static_cast<T>(std::sqrt(6.0 / (in_features + out_features)));
        Random rng(seed);
        std::vector<T> w = rng.uniform<T>(-bound, bound, weight_.size());
        std::copy(w.begin(), w.end(), weight_.data());

        if (bias) {
            bias_ = Tensor<T>({out_features});
            grad_bias_ = Tensor<T>({out_features});
        }
    }

    Tensor<T> forward(const Tensor<T>& input, autograd::Context<T>& ctx) const {
        ctx.set_needs_input_grad({requires_input_grad_, true, bias_.defined()});
        return autograd::apply<functional::LinearFunction<T>>(ctx, input, weight_, bias_);
    }

    Tensor<T> backward(autograd::Context<T>& ctx, const Tensor<T>& grad_output) {
        autograd::Gradients<T> grads = autograd::run_backward<functional::LinearFunction<T>>(ctx, grad_output);
        if (grads[1]) grad_weight_ += *grads[1];
        if (grads[2]) grad_bias_ += *grads[2];
        return grads[0] ? *grads[0] : Tensor<T>();
    }

    Tensor<T> forward(const Tensor<T>& input) override {
        context_ = autograd::Context<T>();
        return forward(input, context_);
    }

    Tensor<T> backward(const Tensor<T>& grad_output) override {
        return backward(context_, grad_output);
    }

    std::vector<Tensor<T>*> parameters() override {
        if (bias_.defined()) return {&weight_, &bias_};
        return {&weight_};
    }

    std::vector<Tensor<T>*> gradients() override {
        if (bias_.defined()) return {&grad_weight_, &grad_bias_};
        return {&grad_weight_};
    }

    std::string name() const override { return "Linear"; }

    void set_requires_input_grad(bool value) { requires_input_grad_ = value; }

    Tensor<T>& weight() { return weight_; }
    Tensor<T>& bias() { return bias_; }

    size_t in_features() const { return in_features_; }
    size_t out_features() const { return out_features_; }

private:
    size_t in_features_;
    size_t out_features_;
    bool requires_input_grad_ = true;

    Tensor<T> weight_;
    Tensor<T> bias_;

    Tensor<T> grad_weight_;
    Tensor<T> grad_bias_;

    autograd::Context<T> context_;
};

} // namespace layers
} // namespace quaternet

#endif // QUATERNET_LAYERS_LINEAR_HPP
