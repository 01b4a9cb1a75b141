/*
 * lseq_policy.hpp
 *
 * Created on: 14 Oct. 2026
 *
 *
 * Zero-runtime storage policies for the lazy_sequence item cache.
 *
 * Purpose:
 *   - Provide a single place where lazy_sequence learns which container keeps
 *     the items pulled from the producer.
 *
 * Design:
 *   - Purely compile-time, zero data, zero runtime.
 *   - A policy exposes one alias template:
 *         template<class T> using buffer = <container of T>;
 *   - The container must be "cache-like":
 *         void push_back(T&&)
 *         size()                 (convertible to reg)
 *         operator[](reg) const  (yields const T&)
 *     Contents are only ever appended; nothing is erased or reordered.
 *
 * Ready-made policies:
 *   - chunked      : lseq::append_buffer<T, default_alloc> (contiguous, amortized growth)
 *   - aligned<N>   : lseq::append_buffer<T, align_alloc<N>>
 *   - deque        : std::deque<T> (element references survive growth)
 *   - vector       : std::vector<T>
 *   - default_storage:
 *        LSEQ_DEFAULT_STORAGE_DEQUE == 1 → deque (default)
 *        LSEQ_DEFAULT_STORAGE_DEQUE == 0 → chunked
 *
 * Usage examples:
 *
 *   lseq::lazy_sequence<int>                          s1(...); // default_storage
 *   lseq::lazy_sequence<int, lseq::storage::deque>    s2(...);
 *   lseq::lazy_sequence<Big, lseq::storage::aligned<64>> s3(...);
 */

#ifndef LSEQ_POLICY_HPP_
#define LSEQ_POLICY_HPP_

#include <cstddef>
#include <deque>
#include <type_traits>
#include <utility>   // std::declval
#include <vector>

#include "basic_types.h"      // reg
#include "lseq_alloc.hpp"
#include "lseq_tools.hpp"
#include "../append_buffer.hpp"

namespace lseq::storage {

namespace detail {

/* Helper trait: detect a "cache-like" container.
 * Requirements:
 *   - C has:  push_back(value_type&&)
 *   - C has:  size() convertible to reg
 *   - C has:  operator[](reg) const  convertible to const value_type&
 */
template <typename C, typename T, typename = void>
struct is_cache_like : std::false_type {};

template <typename C, typename T>
struct is_cache_like<
    C, T, std::void_t<decltype(std::declval<C &>().push_back(std::declval<T &&>())),
                      decltype(std::declval<const C &>().size()),
                      decltype(std::declval<const C &>()[std::declval<reg>()])>>
    : std::bool_constant<
          std::is_convertible_v<decltype(std::declval<const C &>().size()), reg> &&
          std::is_convertible_v<decltype(std::declval<const C &>()[std::declval<reg>()]), const T &>> {};

template <typename C, typename T>
inline constexpr bool is_cache_like_v = is_cache_like<C, T>::value;

} // namespace detail

/* ------------------------------ Storage --------------------------------
 * Base policy: wraps an alias template `Buffer<T>`.
 * --------------------------------------------------------------------- */

template <template <class> class Buffer>
struct Storage {
    template <class T>
    using buffer = Buffer<T>;
};

namespace detail {

template <class T>
using chunked_buffer = ::lseq::append_buffer<T, ::lseq::alloc::default_alloc>;

template <std::size_t Align>
struct aligned_buffer {
    template <class T>
    using type = ::lseq::append_buffer<T, ::lseq::alloc::align_alloc<Align>>;
};

template <class T>
using deque_buffer = std::deque<T>;

template <class T>
using vector_buffer = std::vector<T>;

} // namespace detail

/* --------------------------- Ready-made aliases --------------------------- */
using chunked = Storage<detail::chunked_buffer>;

template <std::size_t Align>
using aligned = Storage<detail::aligned_buffer<Align>::template type>;

using deque = Storage<detail::deque_buffer>;
using vector = Storage<detail::vector_buffer>;

/* Default storage: compile-time switchable without editing callers. */
using default_storage = std::conditional_t<(LSEQ_DEFAULT_STORAGE_DEQUE != 0), deque, chunked>;

/* Resolve and validate the buffer a policy produces for T. */
template <class Policy, class T>
struct buffer_for {
    using type = typename Policy::template buffer<T>;

    static_assert(detail::is_cache_like_v<type, T>,
                  "[lseq::storage]: buffer must implement push_back(T&&), size() and "
                  "operator[](reg) const");
};

template <class Policy, class T>
using buffer_for_t = typename buffer_for<Policy, T>::type;

} // namespace lseq::storage

#endif /* LSEQ_POLICY_HPP_ */
