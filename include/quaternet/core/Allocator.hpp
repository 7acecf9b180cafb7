#ifndef QUATERNET_CORE_ALLOCATOR_HPP
#define QUATERNET_CORE_ALLOCATOR_HPP

#include <cstdlib>
#include <cstddef>
#include <limits>
#include <new>
#include <vector>

#ifndef QUATERNET_ALIGNMENT
#define QUATERNET_ALIGNMENT 64
#endif

namespace quaternet {
namespace core {

// Cache-line aligned storage for tensor buffers so SIMD loops see aligned rows.
template <typename T, std::size_t Alignment = QUATERNET_ALIGNMENT>
class AlignedAllocator {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    template <typename U>
    struct rebind {
        using other = AlignedAllocator<U, Alignment>;
    };

    AlignedAllocator() noexcept = default;

    template <typename U>
    AlignedAllocator(const AlignedAllocator<U, Alignment>&) noexcept {}

    static_assert(Alignment >= alignof(T) && (Alignment & (Alignment - 1)) == 0,
                  "QUATERNET_ALIGNMENT must be a power of two no smaller than alignof(T)");

    T* allocate(size_type n) {
        if (n > (std::numeric_limits<size_type>::max() - Alignment) / sizeof(T)) {
            throw std::bad_alloc();
        }
        const size_type blocks = (n * sizeof(T) + Alignment - 1) / Alignment;
        void* p = std::aligned_alloc(Alignment, (blocks == 0 ? 1 : blocks) * Alignment);
        if (p == nullptr) {
            throw std::bad_alloc();
        }
        return static_cast<T*>(p);
    }

    void deallocate(T* p, size_type) noexcept {
        std::free(p);
    }
};

template <typename T, typename U, std::size_t A>
bool operator==(const AlignedAllocator<T, A>&, const AlignedAllocator<U, A>&) noexcept { return true; }

template <typename T, typename U, std::size_t A>
bool operator!=(const AlignedAllocator<T, A>&, const AlignedAllocator<U, A>&) noexcept { return false; }

// Storage type of every Tensor.
template <typename T>
using AlignedBuffer = std::vector<T, AlignedAllocator<T>>;

} // namespace core
} // namespace quaternet

#endif // QUATERNET_CORE_ALLOCATOR_HPP
