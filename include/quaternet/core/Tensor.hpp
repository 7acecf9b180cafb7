#ifndef QUATERNET_CORE_TENSOR_HPP
#define QUATERNET_CORE_TENSOR_HPP

#include <vector>
#include <initializer_list>
#include <iostream>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <numeric>
#include <string>
#include <sstream>
#include "Allocator.hpp"

// Check for OpenMP support
#if defined(_OPENMP)
#include <omp.h>
#define QUATERNET_SIMD_LOOP _Pragma("omp simd")
#define QUATERNET_PARALLEL_LOOP _Pragma("omp parallel for")
#else
#define QUATERNET_SIMD_LOOP
#define QUATERNET_PARALLEL_LOOP
#endif

namespace quaternet {

inline std::string shape_to_string(const std::vector<size_t>& shape) {
    std::ostringstream os;
    os << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) os << ", ";
        os << shape[i];
    }
    os << "]";
    return os.str();
}

/**
 * @brief Dense row-major tensor.
 *
 * Owns its storage. All operations return new tensors; slicing with narrow()
 * copies. A default-constructed tensor is "undefined" (rank 0, no storage),
 * which is how optional tensors (bias, absent gradients) are passed around.
 */
template <typename T>
class Tensor {
public:
    Tensor() = default;

    // Constructor with shape, zero filled
    Tensor(const std::vector<size_t>& shape) : shape_(shape) {
        data_.resize(numel(shape));
    }

    // Constructor with shape and initial data
    Tensor(const std::vector<size_t>& shape, const std::vector<T>& data) : shape_(shape) {
        if (data.size() != numel(shape)) {
            throw std::invalid_argument("Data size " + std::to_string(data.size()) +
                                        " does not match shape " + shape_to_string(shape) + ".");
        }
        data_.assign(data.begin(), data.end());
    }

    // Accessors
    const std::vector<size_t>& shape() const { return shape_; }
    size_t dim() const { return shape_.size(); }
    size_t size() const { return data_.size(); }
    size_t size(int axis) const { return shape_[axis_index(axis)]; }
    bool defined() const { return !shape_.empty(); }

    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }

    T& operator[](size_t index) { return data_[index]; }
    const T& operator[](size_t index) const { return data_[index]; }

    T& at(size_t i, size_t j) { return data_[i * shape_[1] + j]; }
    const T& at(size_t i, size_t j) const { return data_[i * shape_[1] + j]; }
    T& at(size_t b, size_t i, size_t j) { return data_[(b * shape_[1] + i) * shape_[2] + j]; }
    const T& at(size_t b, size_t i, size_t j) const { return data_[(b * shape_[1] + i) * shape_[2] + j]; }

    void fill(T value) {
        std::fill(data_.begin(), data_.end(), value);
    }

    // Resolves a possibly negative axis against the rank.
    size_t axis_index(int axis) const {
        int rank = static_cast<int>(shape_.size());
        int a = axis < 0 ? axis + rank : axis;
        if (a < 0 || a >= rank) {
            throw std::out_of_range("Axis " + std::to_string(axis) + " out of range for rank " +
                                    std::to_string(rank) + ".");
        }
        return static_cast<size_t>(a);
    }

    // Element-wise operations.
    // Shapes must match exactly, or 'other' must match the trailing dimensions
    // of 'this' (leading 1s ignored), in which case it is broadcast.
    Tensor<T> operator+(const Tensor<T>& other) const {
        return binary_op(other, "addition", [](T a, T b) { return a + b; });
    }

    Tensor<T> operator-(const Tensor<T>& other) const {
        return binary_op(other, "subtraction", [](T a, T b) { return a - b; });
    }

    Tensor<T> operator*(const Tensor<T>& other) const {
        return binary_op(other, "element-wise multiplication", [](T a, T b) { return a * b; });
    }

    Tensor<T> operator/(const Tensor<T>& other) const {
        return binary_op(other, "division", [](T a, T b) { return a / b; });
    }

    Tensor<T> operator*(T scalar) const {
        Tensor<T> result(this->shape_);
        size_t n = this->data_.size();
        QUATERNET_SIMD_LOOP
        for (size_t i = 0; i < n; ++i) {
            result.data_[i] = this->data_[i] * scalar;
        }
        return result;
    }

    Tensor<T> operator+(T scalar) const {
        Tensor<T> result(this->shape_);
        size_t n = this->data_.size();
        QUATERNET_SIMD_LOOP
        for (size_t i = 0; i < n; ++i) {
            result.data_[i] = this->data_[i] + scalar;
        }
        return result;
    }

    Tensor<T> operator-() const {
        return (*this) * static_cast<T>(-1);
    }

    Tensor<T>& operator+=(const Tensor<T>& other) {
        *this = *this + other;
        return *this;
    }

    /**
     * @brief Copy of the slice [offset, offset + length) along one axis.
     */
    Tensor<T> narrow(int axis, size_t offset, size_t length) const {
        size_t ax = axis_index(axis);
        if (offset + length > shape_[ax]) {
            throw std::out_of_range("narrow(" + std::to_string(axis) + ", " + std::to_string(offset) +
                                    ", " + std::to_string(length) + ") exceeds shape " +
                                    shape_to_string(shape_) + ".");
        }
        size_t outer = 1, inner = 1;
        for (size_t d = 0; d < ax; ++d) outer *= shape_[d];
        for (size_t d = ax + 1; d < shape_.size(); ++d) inner *= shape_[d];

        std::vector<size_t> out_shape = shape_;
        out_shape[ax] = length;
        Tensor<T> result(out_shape);

        const size_t src_stride = shape_[ax] * inner;
        const size_t dst_stride = length * inner;
        for (size_t o = 0; o < outer; ++o) {
            std::copy(data_.begin() + o * src_stride + offset * inner,
                      data_.begin() + o * src_stride + (offset + length) * inner,
                      result.data_.begin() + o * dst_stride);
        }
        return result;
    }

    /**
     * @brief Concatenates tensors along an axis. All other dimensions must agree.
     */
    static Tensor<T> cat(const std::vector<Tensor<T>>& parts, int axis) {
        if (parts.empty()) throw std::invalid_argument("cat needs at least one tensor.");
        const Tensor<T>& first = parts.front();
        size_t ax = first.axis_index(axis);

        std::vector<size_t> out_shape = first.shape_;
        out_shape[ax] = 0;
        for (const auto& p : parts) {
            if (p.shape_.size() != first.shape_.size()) {
                throw std::invalid_argument("cat: rank mismatch " + shape_to_string(p.shape_) +
                                            " vs " + shape_to_string(first.shape_) + ".");
            }
            for (size_t d = 0; d < p.shape_.size(); ++d) {
                if (d != ax && p.shape_[d] != first.shape_[d]) {
                    throw std::invalid_argument("cat: shape mismatch " + shape_to_string(p.shape_) +
                                                " vs " + shape_to_string(first.shape_) + ".");
                }
            }
            out_shape[ax] += p.shape_[ax];
        }

        size_t outer = 1, inner = 1;
        for (size_t d = 0; d < ax; ++d) outer *= out_shape[d];
        for (size_t d = ax + 1; d < out_shape.size(); ++d) inner *= out_shape[d];

        Tensor<T> result(out_shape);
        const size_t dst_stride = out_shape[ax] * inner;
        size_t col = 0;
        for (const auto& p : parts) {
            const size_t chunk = p.shape_[ax] * inner;
            for (size_t o = 0; o < outer; ++o) {
                std::copy(p.data_.begin() + o * chunk,
                          p.data_.begin() + (o + 1) * chunk,
                          result.data_.begin() + o * dst_stride + col);
            }
            col += chunk;
        }
        return result;
    }

    // Matrix Multiplication
    // (M, K) x (K, N)       -> (M, N)
    // (B, M, K) x (K, N)    -> (B, M, N)   same matrix for every batch entry
    // (B, M, K) x (B, K, N) -> (B, M, N)
    Tensor<T> matmul(const Tensor<T>& other) const {
        const size_t ra = this->shape_.size();
        const size_t rb = other.shape_.size();

        if (ra == 2 && rb == 2) {
            check_inner(this->shape_[1], other.shape_[0]);
            Tensor<T> result({this->shape_[0], other.shape_[1]});
            gemm(this->data(), other.data(), result.data(), this->shape_[0], this->shape_[1], other.shape_[1]);
            return result;
        }
        if (ra == 3 && rb == 2) {
            check_inner(this->shape_[2], other.shape_[0]);
            Tensor<T> result({this->shape_[0], this->shape_[1], other.shape_[1]});
            gemm(this->data(), other.data(), result.data(),
                 this->shape_[0] * this->shape_[1], this->shape_[2], other.shape_[1]);
            return result;
        }
        if (ra == 3 && rb == 3) {
            if (this->shape_[0] != other.shape_[0]) {
                throw std::invalid_argument("Batch dimensions must match for batched matmul.");
            }
            check_inner(this->shape_[2], other.shape_[1]);
            const size_t B = this->shape_[0], M = this->shape_[1], K = this->shape_[2], N = other.shape_[2];
            Tensor<T> result({B, M, N});
            for (size_t b = 0; b < B; ++b) {
                gemm(this->data() + b * M * K, other.data() + b * K * N, result.data() + b * M * N, M, K, N);
            }
            return result;
        }
        throw std::invalid_argument("Matmul does not support shapes " + shape_to_string(this->shape_) +
                                    " x " + shape_to_string(other.shape_) + ".");
    }

    Tensor<T> transpose() const {
        if (this->shape_.size() != 2) {
            throw std::invalid_argument("Transpose only supports 2D tensors.");
        }
        size_t R = this->shape_[0];
        size_t C = this->shape_[1];
        Tensor<T> result({C, R});

        for (size_t i = 0; i < R; ++i) {
            for (size_t j = 0; j < C; ++j) {
                result.data_[j * R + i] = this->data_[i * C + j];
            }
        }
        return result;
    }

    // Rank-3 axis permutation, e.g. permute(0, 2, 1) swaps the two inner axes.
    Tensor<T> permute(size_t a0, size_t a1, size_t a2) const {
        if (this->shape_.size() != 3) {
            throw std::invalid_argument("Permute only supports 3D tensors.");
        }
        const size_t axes[3] = {a0, a1, a2};
        bool seen[3] = {false, false, false};
        for (size_t a : axes) {
            if (a > 2 || seen[a]) throw std::invalid_argument("Invalid permutation.");
            seen[a] = true;
        }
        std::vector<size_t> out_shape = {shape_[a0], shape_[a1], shape_[a2]};
        const size_t strides[3] = {shape_[1] * shape_[2], shape_[2], 1};
        Tensor<T> result(out_shape);

        size_t idx = 0;
        for (size_t x = 0; x < out_shape[0]; ++x) {
            for (size_t y = 0; y < out_shape[1]; ++y) {
                for (size_t z = 0; z < out_shape[2]; ++z) {
                    result.data_[idx++] = data_[x * strides[a0] + y * strides[a1] + z * strides[a2]];
                }
            }
        }
        return result;
    }

    Tensor<T> reshape(const std::vector<size_t>& new_shape) const {
        if (numel(new_shape) != data_.size()) {
            throw std::invalid_argument("Cannot reshape " + shape_to_string(shape_) + " to " +
                                        shape_to_string(new_shape) + ".");
        }
        Tensor<T> result = *this;
        result.shape_ = new_shape;
        return result;
    }

    // Sum over one axis; the axis is removed from the shape (rank-1 input yields shape {1}).
    Tensor<T> sum(int axis) const {
        size_t ax = axis_index(axis);
        size_t outer = 1, inner = 1;
        for (size_t d = 0; d < ax; ++d) outer *= shape_[d];
        for (size_t d = ax + 1; d < shape_.size(); ++d) inner *= shape_[d];
        const size_t n = shape_[ax];

        std::vector<size_t> out_shape;
        for (size_t d = 0; d < shape_.size(); ++d) {
            if (d != ax) out_shape.push_back(shape_[d]);
        }
        if (out_shape.empty()) out_shape.push_back(1);

        Tensor<T> result(out_shape);
        for (size_t o = 0; o < outer; ++o) {
            T* dst = result.data_.data() + o * inner;
            for (size_t r = 0; r < n; ++r) {
                const T* src = data_.data() + (o * n + r) * inner;
                QUATERNET_SIMD_LOOP
                for (size_t j = 0; j < inner; ++j) {
                    dst[j] += src[j];
                }
            }
        }
        return result;
    }

    // Sum of all elements.
    T sum() const {
        return std::accumulate(data_.begin(), data_.end(), static_cast<T>(0));
    }

    Tensor<T> sqrt() const {
        return apply([](T v) { return std::sqrt(v); });
    }

    template <typename Func>
    Tensor<T> apply(Func func) const {
        Tensor<T> result(this->shape_);
        size_t n = this->data_.size();
        for (size_t i = 0; i < n; ++i) {
            result.data_[i] = func(this->data_[i]);
        }
        return result;
    }

    T max_abs_diff(const Tensor<T>& other) const {
        if (shape_ != other.shape_) {
            throw std::invalid_argument("Shapes must match for comparison.");
        }
        T m = 0;
        for (size_t i = 0; i < data_.size(); ++i) {
            m = std::max(m, static_cast<T>(std::abs(data_[i] - other.data_[i])));
        }
        return m;
    }

    bool allclose(const Tensor<T>& other, T atol) const {
        return shape_ == other.shape_ && max_abs_diff(other) <= atol;
    }

private:
    static size_t numel(const std::vector<size_t>& shape) {
        size_t total_size = 1;
        for (size_t s : shape) total_size *= s;
        return total_size;
    }

    static void check_inner(size_t k, size_t k2) {
        if (k != k2) {
            throw std::invalid_argument("Inner dimensions must match for matmul (" +
                                        std::to_string(k) + " vs " + std::to_string(k2) + ").");
        }
    }

    // C[M,N] = A[M,K] * B[K,N], IKJ order so the inner loop is contiguous.
    static void gemm(const T* a, const T* b, T* c, size_t M, size_t K, size_t N) {
        QUATERNET_PARALLEL_LOOP
        for (long i = 0; i < (long)M; ++i) {
            T* c_row = c + i * N;
            for (size_t k = 0; k < K; ++k) {
                const T a_val = a[i * K + k];
                const T* b_row = b + k * N;
                QUATERNET_SIMD_LOOP
                for (size_t j = 0; j < N; ++j) {
                    c_row[j] += a_val * b_row[j];
                }
            }
        }
    }

    // True if 'other' (leading 1s stripped) equals the trailing dims of this.
    bool broadcasts_from(const Tensor<T>& other) const {
        size_t lead = 0;
        while (lead + 1 < other.shape_.size() && other.shape_[lead] == 1) ++lead;
        const size_t tail = other.shape_.size() - lead;
        if (tail > shape_.size()) return false;
        for (size_t d = 0; d < tail; ++d) {
            if (other.shape_[lead + d] != shape_[shape_.size() - tail + d]) return false;
        }
        return true;
    }

    template <typename Op>
    Tensor<T> binary_op(const Tensor<T>& other, const char* what, Op op) const {
        Tensor<T> result(this->shape_);
        const size_t n = this->data_.size();

        // Case 1: Shapes match exactly
        if (this->shape_ == other.shape_) {
            QUATERNET_SIMD_LOOP
            for (size_t i = 0; i < n; ++i) {
                result.data_[i] = op(this->data_[i], other.data_[i]);
            }
            return result;
        }

        // Case 2: Broadcasting over the leading dimensions
        if (!other.shape_.empty() && broadcasts_from(other)) {
            const size_t inner = other.data_.size();
            if (inner == 0) return result;
            const size_t outer = n / inner;
            QUATERNET_PARALLEL_LOOP
            for (long o = 0; o < (long)outer; ++o) {
                const size_t offset = o * inner;
                for (size_t j = 0; j < inner; ++j) {
                    result.data_[offset + j] = op(this->data_[offset + j], other.data_[j]);
                }
            }
            return result;
        }

        throw std::invalid_argument(std::string("Shapes incompatible for ") + what + ": " +
                                    shape_to_string(this->shape_) + " and " +
                                    shape_to_string(other.shape_) + ".");
    }

    std::vector<size_t> shape_;
    core::AlignedBuffer<T> data_;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Tensor<T>& t) {
    os << "Tensor" << shape_to_string(t.shape()) << " {";
    const size_t n = std::min<size_t>(t.size(), 16);
    for (size_t i = 0; i < n; ++i) {
        if (i) os << ", ";
        os << t[i];
    }
    if (t.size() > n) os << ", ...";
    return os << "}";
}

} // namespace quaternet

#endif // QUATERNET_CORE_TENSOR_HPP
