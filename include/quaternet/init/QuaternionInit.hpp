#ifndef QUATERNET_INIT_QUATERNIONINIT_HPP
#define QUATERNET_INIT_QUATERNIONINIT_HPP

#include "../quaternion/Quaternion.hpp"
#include "../core/Random.hpp"
#include "../core/Errors.hpp"
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace quaternet {
namespace init {

enum class InitCriterion { Glorot, He };

inline InitCriterion parse_criterion(const std::string& criterion) {
    if (criterion == "glorot") return InitCriterion::Glorot;
    if (criterion == "he") return InitCriterion::He;
    throw InvalidCriterion("Invalid criterion: " + criterion);
}

// glorot: 1 / sqrt(2 (in + out)), he: 1 / sqrt(2 in)
template <typename T>
T criterion_scale(size_t in_features, size_t out_features, InitCriterion criterion) {
    if (criterion == InitCriterion::Glorot) {
        return static_cast<T>(1.0 / std::sqrt(2.0 * (in_features + out_features)));
    }
    return static_cast<T>(1.0 / std::sqrt(2.0 * in_features));
}

// The four [in_features, out_features] blocks of one quaternion weight matrix.
template <typename T>
struct WeightBlocks {
    Tensor<T> r;
    Tensor<T> i;
    Tensor<T> j;
    Tensor<T> k;
};

/**
 * @brief Unit quaternions scaled by the criterion.
 *
 * Four U(0, 1) draws per weight (all r first, then i, j, k) are divided by
 * their norm + 1e-4 and multiplied by the shared scale.
 */
template <typename T>
WeightBlocks<T> unitary_init(size_t in_features, size_t out_features, Random& rng, InitCriterion criterion) {
    const T s = criterion_scale<T>(in_features, out_features, criterion);
    const size_t n = in_features * out_features;

    std::vector<T> v_r = rng.uniform<T>(0, 1, n);
    std::vector<T> v_i = rng.uniform<T>(0, 1, n);
    std::vector<T> v_j = rng.uniform<T>(0, 1, n);
    std::vector<T> v_k = rng.uniform<T>(0, 1, n);

    WeightBlocks<T> w{Tensor<T>({in_features, out_features}), Tensor<T>({in_features, out_features}),
                      Tensor<T>({in_features, out_features}), Tensor<T>({in_features, out_features})};
    for (size_t idx = 0; idx < n; ++idx) {
        T norm = std::sqrt(v_r[idx] * v_r[idx] + v_i[idx] * v_i[idx] +
                           v_j[idx] * v_j[idx] + v_k[idx] * v_k[idx]) + static_cast<T>(0.0001);
        w.r[idx] = v_r[idx] / norm * s;
        w.i[idx] = v_i[idx] / norm * s;
        w.j[idx] = v_j[idx] / norm * s;
        w.k[idx] = v_k[idx] / norm * s;
    }
    return w;
}

/**
 * @brief Polar quaternion initialization.
 *
 * A random unit pure quaternion (i, j, k) sets the axis; modulus ~ U(-s, s)
 * and phase ~ U(-pi, pi) give
 *   r = modulus * cos(phase),  (i, j, k) = modulus * axis * sin(phase).
 * Every draw comes from rng, in the order axis, modulus, phase.
 */
template <typename T>
WeightBlocks<T> quaternion_init(size_t in_features, size_t out_features, Random& rng, InitCriterion criterion) {
    const T s = criterion_scale<T>(in_features, out_features, criterion);
    const size_t n = in_features * out_features;
    const T pi = static_cast<T>(std::acos(-1.0));

    std::vector<T> v_i = rng.uniform<T>(0, 1, n);
    std::vector<T> v_j = rng.uniform<T>(0, 1, n);
    std::vector<T> v_k = rng.uniform<T>(0, 1, n);
    std::vector<T> modulus = rng.uniform<T>(-s, s, n);
    std::vector<T> phase = rng.uniform<T>(-pi, pi, n);

    WeightBlocks<T> w{Tensor<T>({in_features, out_features}), Tensor<T>({in_features, out_features}),
                      Tensor<T>({in_features, out_features}), Tensor<T>({in_features, out_features})};
    for (size_t idx = 0; idx < n; ++idx) {
        T norm = std::sqrt(v_i[idx] * v_i[idx] + v_j[idx] * v_j[idx] + v_k[idx] * v_k[idx]) +
                 static_cast<T>(0.0001);
        T sin_phase = std::sin(phase[idx]);
        w.r[idx] = modulus[idx] * std::cos(phase[idx]);
        w.i[idx] = modulus[idx] * (v_i[idx] / norm) * sin_phase;
        w.j[idx] = modulus[idx] * (v_j[idx] / norm) * sin_phase;
        w.k[idx] = modulus[idx] * (v_k[idx] / norm) * sin_phase;
    }
    return w;
}

// Independent U(-1, 1) blocks scaled by the criterion.
template <typename T>
WeightBlocks<T> random_init(size_t in_features, size_t out_features, Random& rng, InitCriterion criterion) {
    const T s = criterion_scale<T>(in_features, out_features, criterion);
    const size_t n = in_features * out_features;

    WeightBlocks<T> w{Tensor<T>({in_features, out_features}), Tensor<T>({in_features, out_features}),
                      Tensor<T>({in_features, out_features}), Tensor<T>({in_features, out_features})};
    Tensor<T>* blocks[4] = {&w.r, &w.i, &w.j, &w.k};
    for (Tensor<T>* block : blocks) {
        std::vector<T> v = rng.uniform<T>(-1, 1, n);
        for (size_t idx = 0; idx < n; ++idx) (*block)[idx] = v[idx] * s;
    }
    return w;
}

// Seed + criterion string entry points. The criterion is parsed before any sampling.
template <typename T>
WeightBlocks<T> unitary_init(size_t in_features, size_t out_features, uint32_t seed,
                             const std::string& criterion = "glorot") {
    InitCriterion c = parse_criterion(criterion);
    Random rng(seed);
    return unitary_init<T>(in_features, out_features, rng, c);
}

template <typename T>
WeightBlocks<T> quaternion_init(size_t in_features, size_t out_features, uint32_t seed,
                                const std::string& criterion = "glorot") {
    InitCriterion c = parse_criterion(criterion);
    Random rng(seed);
    return quaternion_init<T>(in_features, out_features, rng, c);
}

template <typename T>
WeightBlocks<T> random_init(size_t in_features, size_t out_features, uint32_t seed,
                            const std::string& criterion = "glorot") {
    InitCriterion c = parse_criterion(criterion);
    Random rng(seed);
    return random_init<T>(in_features, out_features, rng, c);
}

template <typename T>
using InitFunction = WeightBlocks<T> (*)(size_t, size_t, Random&, InitCriterion);

// "quaternion" (polar), "unitary" or "random"
template <typename T>
InitFunction<T> init_function(const std::string& weight_init) {
    if (weight_init == "quaternion") return &quaternion_init<T>;
    if (weight_init == "unitary") return &unitary_init<T>;
    if (weight_init == "random") return &random_init<T>;
    throw InvalidOperationArgument("weight_init accepts only 'quaternion', 'unitary' or 'random'. Found weight_init = " +
                                   weight_init);
}

/**
 * @brief Overwrites four existing weight blocks with a fresh initialization.
 *
 * The blocks are validated (SizeMismatchError / ShapeError) and the criterion
 * parsed (InvalidCriterion) before anything is drawn from rng.
 */
template <typename T>
void affect_init(Tensor<T>& r_weight, Tensor<T>& i_weight, Tensor<T>& j_weight, Tensor<T>& k_weight,
                 InitFunction<T> init_func, Random& rng, const std::string& init_criterion) {
    check_weights(r_weight, i_weight, j_weight, k_weight);
    InitCriterion criterion = parse_criterion(init_criterion);

    WeightBlocks<T> w = init_func(r_weight.shape()[0], r_weight.shape()[1], rng, criterion);
    r_weight = w.r;
    i_weight = w.i;
    j_weight = w.j;
    k_weight = w.k;
}

} // namespace init
} // namespace quaternet

#endif // QUATERNET_INIT_QUATERNIONINIT_HPP
