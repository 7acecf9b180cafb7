#ifndef QUATERNET_LAYERS_QUATERNIONLINEAR_HPP
#define QUATERNET_LAYERS_QUATERNIONLINEAR_HPP

#include "Layer.hpp"
#include "../functional/QuaternionLinear.hpp"
#include "../init/QuaternionInit.hpp"
#include "../core/Log.hpp"
#include <cstdint>
#include <string>

namespace quaternet {
namespace layers {

/**
 * @brief Fully connected layer over quaternion features.
 *
 * in_features and out_features are real widths (multiples of 4). The layer
 * owns four [in/4, out/4] weight blocks and an optional [out] bias, filled by
 * affect_init with the chosen scheme ("quaternion", "unitary" or "random").
 *
 * forward(input, ctx) / backward(ctx, grad) keep all per-call state in ctx and
 * may be used from several threads as long as each call has its own context
 * (backward accumulating into the layer gradients must still be serialized).
 * The Layer overrides keep one internal context for sequential use.
 */
template <typename T>
class QuaternionLinear : public Layer<T> {
public:
    QuaternionLinear(size_t in_features, size_t out_features, bool bias = true,
                     const std::string& init_criterion = "glorot",
                     const std::string& weight_init = "quaternion",
                     uint32_t seed = 1337)
        : in_features_(in_features), out_features_(out_features),
          init_criterion_(init_criterion), weight_init_(weight_init)
    {
        if (in_features == 0 || out_features == 0 || in_features % 4 != 0 || out_features % 4 != 0) {
            throw ShapeError("QuaternionLinear features must be positive multiples of 4. Found in_features = " +
                             std::to_string(in_features) + ", out_features = " + std::to_string(out_features));
        }
        const std::vector<size_t> block_shape = {in_features / 4, out_features / 4};
        r_weight_ = Tensor<T>(block_shape);
        i_weight_ = Tensor<T>(block_shape);
        j_weight_ = Tensor<T>(block_shape);
        k_weight_ = Tensor<T>(block_shape);
        grad_r_ = Tensor<T>(block_shape);
        grad_i_ = Tensor<T>(block_shape);
        grad_j_ = Tensor<T>(block_shape);
        grad_k_ = Tensor<T>(block_shape);

        Random rng(seed);
        init::affect_init(r_weight_, i_weight_, j_weight_, k_weight_,
                          init::init_function<T>(weight_init), rng, init_criterion);

        if (bias) {
            bias_ = Tensor<T>({out_features});
            grad_bias_ = Tensor<T>({out_features});
        }

        QUATERNET_LOG_WARN("QuaternionLinear(" << in_features << " -> " << out_features << ") init=" << weight_init
                           << " criterion=" << init_criterion << " seed=" << seed);
    }

    Tensor<T> forward(const Tensor<T>& input, autograd::Context<T>& ctx) const {
        ctx.set_needs_input_grad({requires_input_grad_, true, true, true, true, bias_.defined()});
        return autograd::apply<functional::QuaternionLinearFunction<T>>(
            ctx, input, r_weight_, i_weight_, j_weight_, k_weight_, bias_);
    }

    // Gradients of one forward call without touching the layer's buffers.
    autograd::Gradients<T> compute_gradients(autograd::Context<T>& ctx, const Tensor<T>& grad_output) const {
        return autograd::run_backward<functional::QuaternionLinearFunction<T>>(ctx, grad_output);
    }

    Tensor<T> backward(autograd::Context<T>& ctx, const Tensor<T>& grad_output) {
        autograd::Gradients<T> grads = compute_gradients(ctx, grad_output);
        if (grads[1]) grad_r_ += *grads[1];
        if (grads[2]) grad_i_ += *grads[2];
        if (grads[3]) grad_j_ += *grads[3];
        if (grads[4]) grad_k_ += *grads[4];
        if (grads[5]) grad_bias_ += *grads[5];
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
        if (bias_.defined()) return {&r_weight_, &i_weight_, &j_weight_, &k_weight_, &bias_};
        return {&r_weight_, &i_weight_, &j_weight_, &k_weight_};
    }

    std::vector<Tensor<T>*> gradients() override {
        if (bias_.defined()) return {&grad_r_, &grad_i_, &grad_j_, &grad_k_, &grad_bias_};
        return {&grad_r_, &grad_i_, &grad_j_, &grad_k_};
    }

    std::string name() const override { return "QuaternionLinear"; }

    // When false, backward does not compute the input gradient (first layer of a network).
    void set_requires_input_grad(bool value) { requires_input_grad_ = value; }

    Tensor<T>& r_weight() { return r_weight_; }
    Tensor<T>& i_weight() { return i_weight_; }
    Tensor<T>& j_weight() { return j_weight_; }
    Tensor<T>& k_weight() { return k_weight_; }
    Tensor<T>& bias() { return bias_; }

    size_t in_features() const { return in_features_; }
    size_t out_features() const { return out_features_; }
    const std::string& init_criterion() const { return init_criterion_; }
    const std::string& weight_init() const { return weight_init_; }

private:
    size_t in_features_;
    size_t out_features_;
    std::string init_criterion_;
    std::string weight_init_;
    bool requires_input_grad_ = true;

    Tensor<T> r_weight_, i_weight_, j_weight_, k_weight_;
    Tensor<T> bias_;

    Tensor<T> grad_r_, grad_i_, grad_j_, grad_k_;
    Tensor<T> grad_bias_;

    autograd::Context<T> context_;
};

} // namespace layers
} // namespace quaternet

#endif // QUATERNET_LAYERS_QUATERNIONLINEAR_HPP
