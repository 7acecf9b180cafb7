#ifndef QUATERNET_QUATERNION_HAMILTON_HPP
#define QUATERNET_QUATERNION_HAMILTON_HPP

#include "Quaternion.hpp"
#include <array>

namespace quaternet {

namespace detail {

// For output channel c, q1 is re-ordered by kHamiltonPermutation[c] before the
// elementwise product with q0, then the four slices are combined with
// kHamiltonSigns[c]:
//   r = r0*r1 - i0*i1 - j0*j1 - k0*k1
//   i = r0*i1 + i0*r1 + j0*k1 - k0*j1
//   j = r0*j1 - i0*k1 + j0*r1 + k0*i1
//   k = r0*k1 + i0*j1 - j0*i1 + k0*r1
constexpr std::array<std::array<int, 4>, 4> kHamiltonPermutation = {{
    {{0, 1, 2, 3}},
    {{1, 0, 3, 2}},
    {{2, 3, 0, 1}},
    {{3, 2, 1, 0}},
}};

constexpr std::array<std::array<int, 4>, 4> kHamiltonSigns = {{
    {{1, -1, -1, -1}},
    {{1,  1,  1, -1}},
    {{1, -1,  1,  1}},
    {{1,  1, -1,  1}},
}};

} // namespace detail

/**
 * @brief Hamilton product q0 * q1 over the last axis.
 *
 * q0 and q1 must have the same shape with a last axis divisible by 4; the
 * rank is not validated. The product is not commutative.
 */
template <typename T>
Tensor<T> hamilton_product(const Tensor<T>& q0, const Tensor<T>& q1) {
    const std::array<Tensor<T>, 4> q1_parts = {component_slice(q1, 0), component_slice(q1, 1),
                                               component_slice(q1, 2), component_slice(q1, 3)};

    std::vector<Tensor<T>> out;
    out.reserve(4);
    for (size_t c = 0; c < 4; ++c) {
        const auto& perm = detail::kHamiltonPermutation[c];
        const auto& sign = detail::kHamiltonSigns[c];

        Tensor<T> base = q0 * Tensor<T>::cat({q1_parts[perm[0]], q1_parts[perm[1]],
                                              q1_parts[perm[2]], q1_parts[perm[3]]}, -1);

        Tensor<T> channel = component_slice(base, 0);
        for (size_t m = 1; m < 4; ++m) {
            channel = sign[m] > 0 ? channel + component_slice(base, m)
                                  : channel - component_slice(base, m);
        }
        out.push_back(channel);
    }
    return Tensor<T>::cat(out, -1);
}

} // namespace quaternet

#endif // QUATERNET_QUATERNION_HAMILTON_HPP
