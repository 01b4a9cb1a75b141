/*
 * lseq_alloc.hpp
 *
 * Created on: 14 Oct. 2026
 *
 * Stateless allocators for lseq::append_buffer.
 *   - basic_allocator<T>            : plain new/delete, switches to aligned new
 *                                     when alignof(T) exceeds the default new alignment.
 *   - aligned_allocator<T, Align>   : every block aligned to max(Align, alignof(T)).
 *
 * Failure reporting: allocate() throws std::bad_alloc (size overflow included).
 */

#ifndef LSEQ_ALLOC_HPP_
#define LSEQ_ALLOC_HPP_

#include <cstddef>     // std::size_t, std::byte, std::max_align_t, std::ptrdiff_t
#include <limits>      // std::numeric_limits
#include <new>         // std::bad_alloc, std::align_val_t
#include <type_traits> // std::true_type

#include "lseq_tools.hpp"

namespace lseq::alloc {

namespace detail {

#if defined(__STDCPP_DEFAULT_NEW_ALIGNMENT__)
inline constexpr std::size_t kDefaultNewAlign = __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
inline constexpr std::size_t kDefaultNewAlign = alignof(std::max_align_t);
#endif

constexpr bool is_pow2(const std::size_t x) noexcept {
    return (x != 0u) && ((x & (x - 1u)) == 0u);
}

constexpr std::size_t max_sz(const std::size_t a, const std::size_t b) noexcept {
    return (a > b) ? a : b;
}

template<class T>
[[nodiscard]] inline std::size_t checked_bytes(const std::size_t n) {
    if (RB_UNLIKELY(n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))) {
        throw std::bad_alloc{};
    }
    return n * sizeof(T);
}

template<std::size_t Align>
[[nodiscard]] inline void* allocate_bytes(const std::size_t bytes) {
    if constexpr (Align <= kDefaultNewAlign) {
        return ::operator new(bytes);
    } else {
        return ::operator new(bytes, std::align_val_t(Align));
    }
}

template<std::size_t Align>
inline void deallocate_bytes(void* p) noexcept {
    if constexpr (Align <= kDefaultNewAlign) {
        ::operator delete(p);
    } else {
        ::operator delete(p, std::align_val_t(Align));
    }
}

} // namespace detail

// ============================================================================
// aligned_allocator<T, Alignment>
// ============================================================================

template<class T, std::size_t Alignment>
class aligned_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal                        = std::true_type;

    static_assert(Alignment != 0u, "aligned_allocator: Alignment must be non-zero");
    static_assert(detail::is_pow2(Alignment), "aligned_allocator: Alignment must be pow2");

    static constexpr std::size_t kEffAlign = detail::max_sz(Alignment, alignof(T));

    aligned_allocator() noexcept = default;

    template<class U>
    aligned_allocator(const aligned_allocator<U, Alignment>&) noexcept {}

    [[nodiscard]] T* allocate(size_type n) {
        if (RB_UNLIKELY(n == 0u)) {
            return nullptr;
        }
        return static_cast<T*>(detail::allocate_bytes<kEffAlign>(detail::checked_bytes<T>(n)));
    }

    void deallocate(T* p, size_type /*n*/) noexcept {
        if (RB_UNLIKELY(!p)) {
            return;
        }
        detail::deallocate_bytes<kEffAlign>(p);
    }

    template<class U>
    struct rebind {
        using other = aligned_allocator<U, Alignment>;
    };
};

template<class T1, std::size_t A1, class T2, std::size_t A2>
inline bool operator==(const aligned_allocator<T1, A1>&,
                       const aligned_allocator<T2, A2>&) noexcept
{
    return A1 == A2;
}

template<class T1, std::size_t A1, class T2, std::size_t A2>
inline bool operator!=(const aligned_allocator<T1, A1>& a,
                       const aligned_allocator<T2, A2>& b) noexcept
{
    return !(a == b);
}

// ============================================================================
// basic_allocator<T>
// ============================================================================

template<class T>
class basic_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal                        = std::true_type;

    basic_allocator() noexcept = default;

    template<class U>
    basic_allocator(const basic_allocator<U>&) noexcept {}

    [[nodiscard]] T* allocate(size_type n) {
        if (RB_UNLIKELY(n == 0u)) {
            return nullptr;
        }
        return static_cast<T*>(detail::allocate_bytes<alignof(T)>(detail::checked_bytes<T>(n)));
    }

    void deallocate(T* p, size_type /*n*/) noexcept {
        if (RB_UNLIKELY(!p)) {
            return;
        }
        detail::deallocate_bytes<alignof(T)>(p);
    }

    template<class U>
    struct rebind {
        using other = basic_allocator<U>;
    };
};

template<class T1, class T2>
inline bool operator==(const basic_allocator<T1>&, const basic_allocator<T2>&) noexcept {
    return true;
}

template<class T1, class T2>
inline bool operator!=(const basic_allocator<T1>&, const basic_allocator<T2>&) noexcept {
    return false;
}

// ============================================================================
// Default allocator aliases
// ============================================================================

using default_alloc = basic_allocator<std::byte>;

template<std::size_t Alignment>
using align_alloc = aligned_allocator<std::byte, Alignment>;

} // namespace lseq::alloc

#endif /* LSEQ_ALLOC_HPP_ */
