#ifndef QUATERNET_CORE_RANDOM_HPP
#define QUATERNET_CORE_RANDOM_HPP

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace quaternet {

/**
 * @brief Seedable random source for initializers and dropout masks.
 *
 * Two instances built from the same seed produce the same stream, so
 * initialization is reproducible. Not thread safe; give each thread its own.
 */
class Random {
public:
    explicit Random(uint32_t seed = 1337) : seed_(seed), gen_(seed) {}

    uint32_t seed() const { return seed_; }

    // n draws from U[low, high)
    template <typename T>
    std::vector<T> uniform(T low, T high, size_t n) {
        std::uniform_real_distribution<T> d(low, high);
        std::vector<T> out(n);
        for (auto& v : out) v = d(gen_);
        return out;
    }

    // count draws of the number of successes in n_trials Bernoulli(p) trials
    std::vector<int> binomial(int n_trials, double p, size_t count) {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw std::invalid_argument("binomial: p must be in [0, 1], got " + std::to_string(p));
        }
        std::binomial_distribution<int> d(n_trials, p);
        std::vector<int> out(count);
        for (auto& v : out) v = d(gen_);
        return out;
    }

private:
    uint32_t seed_;
    std::mt19937 gen_;
};

} // namespace quaternet

#endif // QUATERNET_CORE_RANDOM_HPP
