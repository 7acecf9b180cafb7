#ifndef QUATERNET_QUATERNION_DROPOUT_HPP
#define QUATERNET_QUATERNION_DROPOUT_HPP

#include "Quaternion.hpp"
#include "../core/Random.hpp"
#include <string>
#include <vector>

namespace quaternet {

/**
 * @brief Bernoulli(1 - p) keep-mask of the given shape.
 *
 * Only operation == "linear" is supported.
 */
template <typename T>
Tensor<T> create_dropout_mask(T dropout_p, const std::vector<size_t>& shape, Random& rng,
                              const std::string& operation = "linear") {
    if (operation != "linear") {
        throw InvalidOperationArgument("create_dropout_mask accepts only 'linear'. Found operation = " +
                                       operation);
    }
    Tensor<T> mask(shape);
    std::vector<int> draws = rng.binomial(1, 1.0 - static_cast<double>(dropout_p), mask.size());
    for (size_t n = 0; n < draws.size(); ++n) {
        mask[n] = static_cast<T>(draws[n]);
    }
    return mask;
}

// "quaternion": one mask entry per quaternion, shared by r, i, j and k.
// "regular":    the mask has the input's shape and is applied elementwise.
template <typename T>
Tensor<T> apply_quaternion_mask(const Tensor<T>& input, const Tensor<T>& mask,
                                const std::string& dropout_type = "quaternion") {
    if (dropout_type == "quaternion") {
        auto q = split_components(input);
        return Tensor<T>::cat({q[0] * mask, q[1] * mask, q[2] * mask, q[3] * mask}, -1);
    } else if (dropout_type == "regular") {
        return input * mask;
    }
    throw InvalidOperationArgument("dropout_type accepts only 'quaternion' or 'regular'. Found dropout_type = " +
                                   dropout_type);
}

/**
 * @brief Inverted dropout on a quaternion tensor.
 *
 * Kept entries are scaled by 1 / (1 - p) so the expectation is unchanged.
 * With do_dropout == false the input is returned as is.
 */
template <typename T>
Tensor<T> apply_quaternion_dropout(const Tensor<T>& input, T dropout_p, Random& rng,
                                   bool do_dropout = true,
                                   const std::string& dropout_type = "quaternion",
                                   const std::string& operation = "linear") {
    if (dropout_type != "quaternion" && dropout_type != "regular") {
        throw InvalidOperationArgument("dropout_type accepts only 'quaternion' or 'regular'. Found dropout_type = " +
                                       dropout_type);
    }
    if (!(dropout_p >= 0 && dropout_p < 1)) {
        throw std::invalid_argument("dropout_p must be in [0, 1), got " + std::to_string(dropout_p));
    }
    if (!do_dropout) return input;

    std::vector<size_t> mask_shape = input.shape();
    if (dropout_type == "quaternion") {
        check_input(input);
        mask_shape.back() /= 4;
    }
    Tensor<T> mask = create_dropout_mask(dropout_p, mask_shape, rng, operation);
    return apply_quaternion_mask(input, mask, dropout_type) * (static_cast<T>(1) / (1 - dropout_p));
}

} // namespace quaternet

#endif // QUATERNET_QUATERNION_DROPOUT_HPP
