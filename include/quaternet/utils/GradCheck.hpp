#ifndef QUATERNET_UTILS_GRADCHECK_HPP
#define QUATERNET_UTILS_GRADCHECK_HPP

#include "../core/Tensor.hpp"

namespace quaternet {
namespace utils {

/**
 * @brief Central finite-difference gradient of sum(f(x)) with respect to x.
 *
 * f is any callable Tensor<T>(const Tensor<T>&). Costs two evaluations of f
 * per element of x, so keep x small. Use double for tolerances below 1e-3.
 */
template <typename T, typename Func>
Tensor<T> numerical_gradient(Func f, const Tensor<T>& x, T eps = static_cast<T>(1e-6)) {
    Tensor<T> grad(x.shape());
    Tensor<T> probe = x;
    for (size_t n = 0; n < x.size(); ++n) {
        const T orig = probe[n];
        probe[n] = orig + eps;
        const T plus = f(probe).sum();
        probe[n] = orig - eps;
        const T minus = f(probe).sum();
        probe[n] = orig;
        grad[n] = (plus - minus) / (2 * eps);
    }
    return grad;
}

} // namespace utils
} // namespace quaternet

#endif // QUATERNET_UTILS_GRADCHECK_HPP
