#ifndef QUATERNET_QUATERNION_QUATERNION_HPP
#define QUATERNET_QUATERNION_QUATERNION_HPP

#include "../core/Tensor.hpp"
#include "../core/Errors.hpp"
#include <array>
#include <string>

namespace quaternet {

// Position of a component inside the last axis: [r | i | j | k].
enum class Component { R = 0, I = 1, J = 2, K = 3 };

/**
 * @brief Validates a quaternion tensor.
 *
 * Throws ShapeError unless the tensor is rank 2 ([batch, 4H]) or rank 3
 * ([batch, seq, 4H]) and its last axis is a non-zero multiple of 4.
 */
template <typename T>
void check_input(const Tensor<T>& input) {
    if (input.dim() != 2 && input.dim() != 3) {
        throw ShapeError("quaternion linear accepts only input of dimension 2 or 3."
                         " input.dim = " + std::to_string(input.dim()));
    }
    const size_t nb_hidden = input.shape().back();
    if (nb_hidden == 0 || nb_hidden % 4 != 0) {
        throw ShapeError("Quaternion Tensors must be divisible by 4."
                         " input.size(-1) = " + std::to_string(nb_hidden));
    }
}

/**
 * @brief Validates the four weight blocks of a quaternion matrix.
 *
 * Throws SizeMismatchError if the shapes disagree and ShapeError if they are
 * not matrices.
 */
template <typename T>
void check_weights(const Tensor<T>& r_weight, const Tensor<T>& i_weight,
                   const Tensor<T>& j_weight, const Tensor<T>& k_weight) {
    if (r_weight.shape() != i_weight.shape() || r_weight.shape() != j_weight.shape() ||
        r_weight.shape() != k_weight.shape()) {
        throw SizeMismatchError("The real and imaginary weights should have the same size. Found: r:" +
                                shape_to_string(r_weight.shape()) + " i:" + shape_to_string(i_weight.shape()) +
                                " j:" + shape_to_string(j_weight.shape()) + " k:" +
                                shape_to_string(k_weight.shape()));
    }
    if (r_weight.dim() != 2) {
        throw ShapeError("Quaternion weights must be matrices. Found dimension = " +
                         std::to_string(r_weight.dim()));
    }
}

// Slice of width H = last/4 at offset index*H. No validation.
template <typename T>
Tensor<T> component_slice(const Tensor<T>& input, size_t index) {
    const size_t width = input.shape().back() / 4;
    return input.narrow(-1, index * width, width);
}

template <typename T>
Tensor<T> get_component(const Tensor<T>& input, Component which) {
    check_input(input);
    return component_slice(input, static_cast<size_t>(which));
}

template <typename T>
Tensor<T> get_r(const Tensor<T>& input) { return get_component(input, Component::R); }

template <typename T>
Tensor<T> get_i(const Tensor<T>& input) { return get_component(input, Component::I); }

template <typename T>
Tensor<T> get_j(const Tensor<T>& input) { return get_component(input, Component::J); }

template <typename T>
Tensor<T> get_k(const Tensor<T>& input) { return get_component(input, Component::K); }

// All four components in r, i, j, k order.
template <typename T>
std::array<Tensor<T>, 4> split_components(const Tensor<T>& input) {
    check_input(input);
    return {component_slice(input, 0), component_slice(input, 1),
            component_slice(input, 2), component_slice(input, 3)};
}

/**
 * @brief Quaternion modulus sqrt(r^2 + i^2 + j^2 + k^2).
 *
 * vector_form = true: elementwise, shape [..., H].
 * vector_form = false: squares are summed over axis 0 (the batch) before the
 * square root, so a [B, 4H] input gives [H] and [B, S, 4H] gives [S, H].
 */
template <typename T>
Tensor<T> get_modulus(const Tensor<T>& input, bool vector_form = false) {
    auto q = split_components(input);
    Tensor<T> squared = q[0] * q[0] + q[1] * q[1] + q[2] * q[2] + q[3] * q[3];
    if (vector_form) {
        return squared.sqrt();
    }
    return squared.sum(0).sqrt();
}

// input / (batch modulus repeated over the four components + eps)
template <typename T>
Tensor<T> get_normalized(const Tensor<T>& input, T eps = static_cast<T>(0.0001)) {
    Tensor<T> modulus = get_modulus(input);
    Tensor<T> repeated = Tensor<T>::cat({modulus, modulus, modulus, modulus}, -1);
    return input / (repeated + eps);
}

} // namespace quaternet

#endif // QUATERNET_QUATERNION_QUATERNION_HPP
