/*
 * append_buffer.hpp
 *
 * Append-only contiguous buffer, the item cache behind storage::chunked in
 * lseq::lazy_sequence.
 *
 * Model:
 * - Backed by allocator-managed raw storage.
 * - "Lazy" construction model: only [0..size) slots hold live objects,
 *   [size..capacity) is raw memory. T needs no default constructor.
 * - push_back()/emplace_back() construct in place; growth is +50% + pad.
 * - No erase, no pop: contents only grow, order never changes.
 * - Exposes only what the cache contract needs: push_back(), size() and
 *   operator[], plus reserve().
 *
 * Invalidation:
 * - Growth relocates the elements, so references/pointers/iterators into the
 *   buffer are invalidated by any append that exceeds capacity().
 *
 * Concurrency:
 * - Not thread-safe. Designed to be owned by lseq::detail::shared_source.
 */

#ifndef LSEQ_APPEND_BUFFER_HPP_
#define LSEQ_APPEND_BUFFER_HPP_

#include <cstddef>      // std::ptrdiff_t
#include <limits>       // std::numeric_limits
#include <memory>       // std::allocator_traits, std::destroy_n
#include <new>          // std::bad_alloc
#include <type_traits>
#include <utility>      // std::move, std::forward

#include "basic_types.h"        // reg
#include "base/lseq_alloc.hpp"
#include "base/lseq_tools.hpp"  // RB_FORCEINLINE, LSEQ_ASSERT, macros

namespace lseq {

/* =======================================================================
 * append_buffer<T, Alloc>
 *
 * Invariant: [0..len_) are constructed objects, [len_..cap_) is raw storage.
 * ======================================================================= */
template<class T, typename Alloc = ::lseq::alloc::default_alloc>
class append_buffer
{
public:
    using value_type             = T;
    using size_type              = reg;
    using difference_type        = std::ptrdiff_t;
    using reference              = value_type&;
    using const_reference        = const value_type&;
    using pointer                = value_type*;
    using const_pointer          = const value_type*;

    using base_allocator_type    = Alloc;
    using allocator_type         = typename std::allocator_traits<base_allocator_type>
        ::template rebind_alloc<value_type>;
    using alloc_traits           = std::allocator_traits<allocator_type>;
    using alloc_pointer          = typename alloc_traits::pointer;

private:
    pointer   storage_ = nullptr;
    size_type len_     = 0;
    size_type cap_     = 0;

public:
    // --------------------------------------------------------------------------
    // Static Assertions
    // --------------------------------------------------------------------------
    static_assert(alloc_traits::is_always_equal::value,
                  "[lseq::append_buffer]: requires stateless allocator.");
    static_assert(std::is_same_v<alloc_pointer, pointer>,
                  "[lseq::append_buffer]: allocator must return raw pointers (T*).");
    static_assert(!std::is_const_v<T> && !std::is_reference_v<T>,
                  "[lseq::append_buffer]: T must be a non-const object type.");
    static_assert(std::is_move_constructible_v<T> || std::is_copy_constructible_v<T>,
                  "[lseq::append_buffer]: T must be move- or copy-constructible (relocation on growth).");

    // --------------------------------------------------------------------------
    // Ctors / Assignment
    // --------------------------------------------------------------------------
    append_buffer() noexcept = default;

    ~append_buffer() noexcept {
        release_storage(storage_, len_, cap_);
    }

    // Owned by exactly one shared_source, never copied or moved.
    append_buffer(const append_buffer&)            = delete;
    append_buffer& operator=(const append_buffer&) = delete;

    // --------------------------------------------------------------------------
    // Capacity & State
    // --------------------------------------------------------------------------
    [[nodiscard]] RB_FORCEINLINE bool empty() const noexcept { return len_ == 0; }
    [[nodiscard]] RB_FORCEINLINE size_type size() const noexcept { return len_; }
    [[nodiscard]] RB_FORCEINLINE size_type capacity() const noexcept { return cap_; }

    [[nodiscard]] static constexpr size_type max_size() noexcept {
        return static_cast<size_type>(std::numeric_limits<size_type>::max() / sizeof(value_type));
    }

    // Ensures capacity >= new_cap. Strong guarantee: on throw the buffer is unchanged.
    void reserve(const size_type new_cap) {
        if (new_cap <= cap_) { return; }
        if (RB_UNLIKELY(new_cap > max_size())) { throw std::bad_alloc{}; }

        allocator_type alloc{};
        pointer new_storage = alloc_traits::allocate(alloc, new_cap);

        size_type moved = 0;
        try {
            for (; moved < len_; ++moved) {
                alloc_traits::construct(alloc, new_storage + moved, std::move_if_noexcept(storage_[moved]));
            }
        } catch (...) {
            if constexpr (!std::is_trivially_destructible_v<T>) {
                std::destroy_n(new_storage, moved);
            }
            alloc_traits::deallocate(alloc, new_storage, new_cap);
            throw;
        }

        release_storage(storage_, len_, cap_);
        storage_ = new_storage;
        cap_     = new_cap;
    }

    // --------------------------------------------------------------------------
    // Data Access
    // --------------------------------------------------------------------------
    [[nodiscard]] RB_FORCEINLINE reference operator[](const size_type i) noexcept {
        LSEQ_ASSERT(i < len_);
        return storage_[i];
    }
    [[nodiscard]] RB_FORCEINLINE const_reference operator[](const size_type i) const noexcept {
        LSEQ_ASSERT(i < len_);
        return storage_[i];
    }

    // --------------------------------------------------------------------------
    // Producer Interface
    // --------------------------------------------------------------------------
    template<class... Args>
    reference emplace_back(Args&&... args) {
        if (RB_LIKELY(len_ < cap_)) {
            allocator_type alloc{};
            alloc_traits::construct(alloc, storage_ + len_, std::forward<Args>(args)...);
        } else {
            // Args may alias an element of this buffer: materialize before relocating.
            value_type tmp(std::forward<Args>(args)...);
            grow(static_cast<size_type>(len_ + 1u));
            allocator_type alloc{};
            alloc_traits::construct(alloc, storage_ + len_, std::move(tmp));
        }
        ++len_;
        return storage_[len_ - 1];
    }

    void push_back(const value_type& v) { (void)emplace_back(v); }
    void push_back(value_type&& v) { (void)emplace_back(std::move(v)); }

private:
    void grow(const size_type need) {
        if (RB_UNLIKELY(need > max_size())) { throw std::bad_alloc{}; }

        size_type grow_cap = static_cast<size_type>(LSEQ_BUFFER_INITIAL_CAPACITY);
        if (cap_ != 0u) {
            // Heuristic: +50% + small padding, saturated at max_size().
            const size_type half = static_cast<size_type>(need >> 1);
            const size_type pad  = static_cast<size_type>(LSEQ_BUFFER_GROWTH_PAD);
            grow_cap = (need > max_size() - half - pad)
                ? max_size()
                : static_cast<size_type>(need + half + pad);
        }
        if (grow_cap < need) {
            grow_cap = need;
        }
        reserve(grow_cap);
    }

    static void release_storage(pointer p, size_type len, size_type cap) noexcept {
        if (p && cap) {
            if constexpr (!std::is_trivially_destructible_v<T>) {
                std::destroy_n(p, len);
            }
            allocator_type alloc{};
            alloc_traits::deallocate(alloc, p, cap);
        }
    }
};

} // namespace lseq

#endif /* LSEQ_APPEND_BUFFER_HPP_ */
