#ifndef QUATERNET_FUNCTIONAL_QUATERNIONLINEAR_HPP
#define QUATERNET_FUNCTIONAL_QUATERNIONLINEAR_HPP

#include "../quaternion/Quaternion.hpp"
#include "../autograd/Function.hpp"
#include <array>
#include <vector>

namespace quaternet {
namespace functional {

struct EncodingEntry {
    int component; // 0..3 -> r, i, j, k
    int sign;      // +1 or -1
};

// pattern[row][col]: which block, with which sign, sits at position col of row.
using EncodingPattern = std::array<std::array<EncodingEntry, 4>, 4>;

// Real-matrix form of quaternion multiplication by the weights.
//   row_r = [ r, -i, -j, -k]
//   row_i = [ i,  r, -k,  j]
//   row_j = [ j,  k,  r, -i]
//   row_k = [ k, -j,  i,  r]
constexpr EncodingPattern kKernelEncoding = {{
    {{ {0, 1}, {1, -1}, {2, -1}, {3, -1} }},
    {{ {1, 1}, {0,  1}, {3, -1}, {2,  1} }},
    {{ {2, 1}, {3,  1}, {0,  1}, {1, -1} }},
    {{ {3, 1}, {2, -1}, {1,  1}, {0,  1} }},
}};

// Layout of grad_output used for the weight gradient.
//   row_r = [ r,  i,  j,  k]
//   row_i = [-i,  r,  k, -j]
//   row_j = [-j, -k,  r,  i]
//   row_k = [-k,  j, -i,  r]
constexpr EncodingPattern kGradEncoding = {{
    {{ {0,  1}, {1,  1}, {2,  1}, {3, 1} }},
    {{ {1, -1}, {0,  1}, {3,  1}, {2, -1} }},
    {{ {2, -1}, {3, -1}, {0,  1}, {1, 1} }},
    {{ {3, -1}, {2,  1}, {1, -1}, {0, 1} }},
}};

/**
 * @brief Assembles a 4x4 block matrix from four equally shaped blocks.
 *
 * The four entries of each pattern row are concatenated along row_axis, then
 * the four rows are concatenated along the other axis. With [F, G] blocks and
 * row_axis = 0 the result is [4F, 4G]. Built fresh on every call.
 */
template <typename T>
Tensor<T> build_encoding(const std::array<Tensor<T>, 4>& blocks, const EncodingPattern& pattern, int row_axis) {
    std::vector<Tensor<T>> rows;
    rows.reserve(4);
    for (const auto& row : pattern) {
        std::vector<Tensor<T>> entries;
        entries.reserve(4);
        for (const auto& e : row) {
            entries.push_back(e.sign > 0 ? blocks[e.component] : -blocks[e.component]);
        }
        rows.push_back(Tensor<T>::cat(entries, row_axis));
    }
    return Tensor<T>::cat(rows, row_axis == 0 ? 1 : 0);
}

/**
 * @brief Quaternion linear transform without saving anything for backward.
 *
 * Input:  [batch, 4F] or [batch, seq, 4F]
 * Weights: four [F, G] blocks (shape agreement is the caller's responsibility,
 *          see check_weights)
 * Bias:   [4G] or undefined (any other shape is a SizeMismatchError)
 * Output: [batch, 4G] or [batch, seq, 4G]
 */
template <typename T>
Tensor<T> quaternion_linear(const Tensor<T>& input,
                            const Tensor<T>& r_weight, const Tensor<T>& i_weight,
                            const Tensor<T>& j_weight, const Tensor<T>& k_weight,
                            const Tensor<T>& bias = Tensor<T>()) {
    check_input(input);
    if (bias.defined() && (bias.dim() != 1 || bias.size() != 4 * r_weight.shape()[1])) {
        throw SizeMismatchError("Quaternion bias must have shape [" + std::to_string(4 * r_weight.shape()[1]) +
                                "], got " + shape_to_string(bias.shape()));
    }

    Tensor<T> kernel = build_encoding<T>({r_weight, i_weight, j_weight, k_weight}, kKernelEncoding, 0);
    Tensor<T> output = input.matmul(kernel);
    if (bias.defined()) {
        output = output + bias;
    }
    return output;
}

/**
 * @brief Differentiable quaternion linear operator.
 *
 * Inputs, in gradient-slot order: input, r_weight, i_weight, j_weight,
 * k_weight, bias. backward returns one slot per input; slots whose input does
 * not need a gradient are left empty.
 */
template <typename T>
struct QuaternionLinearFunction {
    static Tensor<T> forward(autograd::Context<T>& ctx, const Tensor<T>& input,
                             const Tensor<T>& r_weight, const Tensor<T>& i_weight,
                             const Tensor<T>& j_weight, const Tensor<T>& k_weight,
                             const Tensor<T>& bias = Tensor<T>()) {
        Tensor<T> output = quaternion_linear(input, r_weight, i_weight, j_weight, k_weight, bias);
        ctx.save_for_backward({input, r_weight, i_weight, j_weight, k_weight, bias});
        return output;
    }

    static autograd::Gradients<T> backward(const autograd::Context<T>& ctx, const Tensor<T>& grad_output) {
        const auto& saved = ctx.saved_tensors();
        const Tensor<T>& input = saved[0];
        const std::array<Tensor<T>, 4> weights = {saved[1], saved[2], saved[3], saved[4]};
        const Tensor<T>& bias = saved[5];

        const size_t in_units = weights[0].shape()[0];
        const size_t out_units = weights[0].shape()[1];

        std::vector<size_t> expected = input.shape();
        expected.back() = 4 * out_units;
        if (grad_output.shape() != expected) {
            throw std::invalid_argument("grad_output shape " + shape_to_string(grad_output.shape()) +
                                        " does not match forward output " + shape_to_string(expected) + ".");
        }

        // Sequence inputs are handled as one long batch.
        size_t rows = 1;
        for (size_t d = 0; d + 1 < input.dim(); ++d) rows *= input.shape()[d];
        const Tensor<T> input_2d = input.reshape({rows, 4 * in_units});
        const Tensor<T> grad_2d = grad_output.reshape({rows, 4 * out_units});

        autograd::Gradients<T> grads(6);

        if (ctx.needs_input_grad(0)) {
            Tensor<T> kernel_t = build_encoding(weights, kKernelEncoding, 0).transpose();
            grads[0] = grad_2d.matmul(kernel_t).reshape(input.shape());
        }

        if (ctx.needs_input_grad(1) || ctx.needs_input_grad(2) ||
            ctx.needs_input_grad(3) || ctx.needs_input_grad(4)) {
            Tensor<T> input_mat = build_encoding(split_components(input_2d), kKernelEncoding, 0); // [4N, 4F]
            Tensor<T> grad_mat = build_encoding(split_components(grad_2d), kGradEncoding, 1);     // [4N, 4G]
            Tensor<T> grad_weight = grad_mat.transpose().matmul(input_mat).transpose();           // [4F, 4G]

            // The first block row already carries all four weight gradients.
            Tensor<T> top = grad_weight.narrow(0, 0, in_units);
            for (size_t c = 0; c < 4; ++c) {
                if (ctx.needs_input_grad(1 + c)) {
                    grads[1 + c] = top.narrow(1, c * out_units, out_units);
                }
            }
        }

        if (bias.defined() && ctx.needs_input_grad(5)) {
            grads[5] = grad_2d.sum(0);
        }

        return grads;
    }
};

} // namespace functional
} // namespace quaternet

#endif // QUATERNET_FUNCTIONAL_QUATERNIONLINEAR_HPP
