#ifndef QUATERNET_FUNCTIONAL_LINEAR_HPP
#define QUATERNET_FUNCTIONAL_LINEAR_HPP

#include "../autograd/Function.hpp"
#include <string>
#include <vector>

namespace quaternet {
namespace functional {

// y = x W^T + b for x [batch, in] or [batch, seq, in], W [out, in], b [out] or undefined.
template <typename T>
Tensor<T> linear(const Tensor<T>& input, const Tensor<T>& weight, const Tensor<T>& bias = Tensor<T>()) {
    if (input.dim() != 2 && input.dim() != 3) {
        throw std::invalid_argument("linear accepts only input of dimension 2 or 3. input.dim = " +
                                    std::to_string(input.dim()));
    }
    Tensor<T> output = input.matmul(weight.transpose());
    if (bias.defined()) {
        output = output + bias;
    }
    return output;
}

// Real-valued counterpart of QuaternionLinearFunction. Slots: input, weight, bias.
template <typename T>
struct LinearFunction {
    static Tensor<T> forward(autograd::Context<T>& ctx, const Tensor<T>& input,
                             const Tensor<T>& weight, const Tensor<T>& bias = Tensor<T>()) {
        Tensor<T> output = linear(input, weight, bias);
        ctx.save_for_backward({input, weight, bias});
        return output;
    }

    static autograd::Gradients<T> backward(const autograd::Context<T>& ctx, const Tensor<T>& grad_output) {
        const auto& saved = ctx.saved_tensors();
        const Tensor<T>& input = saved[0];
        const Tensor<T>& weight = saved[1];
        const Tensor<T>& bias = saved[2];

        std::vector<size_t> expected = input.shape();
        expected.back() = weight.shape()[0];
        if (grad_output.shape() != expected) {
            throw std::invalid_argument("grad_output shape " + shape_to_string(grad_output.shape()) +
                                        " does not match forward output " + shape_to_string(expected) + ".");
        }

        autograd::Gradients<T> grads(3);

        if (input.dim() == 3) {
            if (ctx.needs_input_grad(0)) {
                grads[0] = grad_output.matmul(weight);
            }
            if (ctx.needs_input_grad(1)) {
                grads[1] = grad_output.permute(0, 2, 1).matmul(input).sum(0);
            }
            if (bias.defined() && ctx.needs_input_grad(2)) {
                grads[2] = grad_output.sum(1).sum(0);
            }
        } else {
            if (ctx.needs_input_grad(0)) {
                grads[0] = grad_output.matmul(weight);
            }
            if (ctx.needs_input_grad(1)) {
                grads[1] = grad_output.transpose().matmul(input);
            }
            if (bias.defined() && ctx.needs_input_grad(2)) {
                grads[2] = grad_output.sum(0);
            }
        }
        return grads;
    }
};

} // namespace functional
} // namespace quaternet

#endif // QUATERNET_FUNCTIONAL_LINEAR_HPP
