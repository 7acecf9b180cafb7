#ifndef QUATERNET_AUTOGRAD_FUNCTION_HPP
#define QUATERNET_AUTOGRAD_FUNCTION_HPP

#include "../core/Tensor.hpp"
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace quaternet {
namespace autograd {

// One slot per forward input; an empty slot means no gradient was requested.
template <typename T>
using Gradients = std::vector<std::optional<Tensor<T>>>;

/**
 * @brief Per-invocation state handed from a forward call to its backward call.
 *
 * Each forward call gets its own Context, so concurrent forward/backward pairs
 * on the same weights never share saved state. The caller sets which inputs
 * need a gradient; forward saves what backward needs; run_backward releases it.
 */
template <typename T>
class Context {
public:
    Context() = default;
    explicit Context(std::vector<bool> needs_input_grad)
        : needs_input_grad_(std::move(needs_input_grad)) {}

    void save_for_backward(std::vector<Tensor<T>> tensors) {
        saved_ = std::move(tensors);
        saved_set_ = true;
        released_ = false;
    }

    const std::vector<Tensor<T>>& saved_tensors() const {
        if (released_) {
            throw std::logic_error("Trying to backward through a context whose saved tensors were already released.");
        }
        if (!saved_set_) {
            throw std::logic_error("backward called before forward saved its tensors.");
        }
        return saved_;
    }

    // Inputs past the end of the flag list do not need a gradient.
    bool needs_input_grad(size_t index) const {
        return index < needs_input_grad_.size() && needs_input_grad_[index];
    }

    void set_needs_input_grad(std::vector<bool> flags) { needs_input_grad_ = std::move(flags); }

    void release() {
        saved_.clear();
        saved_.shrink_to_fit();
        released_ = true;
    }

    bool released() const { return released_; }

private:
    std::vector<bool> needs_input_grad_;
    std::vector<Tensor<T>> saved_;
    bool saved_set_ = false;
    bool released_ = false;
};

// Function is any type with static forward(Context&, ...) and backward(const Context&, grad_output).
template <typename Function, typename T, typename... Args>
Tensor<T> apply(Context<T>& ctx, Args&&... args) {
    return Function::forward(ctx, std::forward<Args>(args)...);
}

template <typename Function, typename T>
Gradients<T> run_backward(Context<T>& ctx, const Tensor<T>& grad_output) {
    Gradients<T> grads = Function::backward(ctx, grad_output);
    ctx.release();
    return grads;
}

} // namespace autograd
} // namespace quaternet

#endif // QUATERNET_AUTOGRAD_FUNCTION_HPP
