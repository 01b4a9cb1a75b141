/*
 * lseq_producer.hpp
 *
 *  Created on: 14 Oct. 2026
 *
 * One-pass, forward-only item sources.
 *
 *  - producer<T>                    : abstract source, next() yields items until nullopt.
 *  - iterator_producer<It, Sent, T> : walks [first, last) once.
 *  - range_producer<Range, T>       : owns a container/range and walks it once.
 *  - generator_producer<F, T>       : calls F until it returns nullopt.
 *
 * Exhaustion is sticky: once next() returned nullopt it keeps doing so, and
 * the underlying generator is not called again.
 */

#ifndef LSEQ_PRODUCER_HPP_
#define LSEQ_PRODUCER_HPP_

#include <iterator>     // std::begin, std::end
#include <optional>
#include <type_traits>
#include <utility>      // std::move, std::forward, std::declval

#include "lseq_tools.hpp"

namespace lseq {

template<class T>
class producer
{
public:
    using value_type = T;

    producer() = default;
    virtual ~producer() = default;

    producer(const producer&)            = delete;
    producer& operator=(const producer&) = delete;

    // Next item in source order, nullopt once exhausted.
    [[nodiscard]] virtual std::optional<T> next() = 0;
};

namespace detail {

template<class R, class = void>
struct is_iterable : std::false_type {};

template<class R>
struct is_iterable<R, std::void_t<decltype(std::begin(std::declval<R&>())),
                                  decltype(std::end(std::declval<R&>()))>>
    : std::true_type {};

template<class R>
inline constexpr bool is_iterable_v = is_iterable<R>::value;

template<class It, class Sent, class = void>
struct is_iterator_pair : std::false_type {};

template<class It, class Sent>
struct is_iterator_pair<It, Sent, std::void_t<decltype(*std::declval<It&>()),
                                              decltype(++std::declval<It&>()),
                                              decltype(std::declval<const It&>() != std::declval<const Sent&>())>>
    : std::true_type {};

template<class It, class Sent>
inline constexpr bool is_iterator_pair_v = is_iterator_pair<It, Sent>::value;

template<class R>
using range_value_t = std::remove_cv_t<std::remove_reference_t<decltype(*std::begin(std::declval<R&>()))>>;

template<class It>
using iterator_value_t = std::remove_cv_t<std::remove_reference_t<decltype(*std::declval<It&>())>>;

template<class O>
struct optional_value {};

template<class U>
struct optional_value<std::optional<U>> {
    using type = U;
};

template<class F>
using generated_value_t = typename optional_value<std::remove_cv_t<std::invoke_result_t<F&>>>::type;

} // namespace detail

// ============================================================================
// iterator_producer<It, Sent, T>
// ============================================================================

template<class It, class Sent = It, class T = detail::iterator_value_t<It>>
class iterator_producer final : public producer<T>
{
    static_assert(detail::is_iterator_pair_v<It, Sent>,
                  "[lseq::iterator_producer]: It must be dereferenceable, incrementable and comparable to Sent");

public:
    iterator_producer(It first, Sent last)
        : first_(std::move(first))
        , last_(std::move(last))
    {}

    [[nodiscard]] std::optional<T> next() override {
        if (!(first_ != last_)) {
            return std::nullopt;
        }
        std::optional<T> item(std::in_place, *first_);
        ++first_;
        return item;
    }

private:
    It   first_;
    Sent last_;
};

// ============================================================================
// range_producer<Range, T>
// ============================================================================

template<class Range, class T = detail::range_value_t<Range>>
class range_producer final : public producer<T>
{
    static_assert(detail::is_iterable_v<Range>,
                  "[lseq::range_producer]: Range must provide begin()/end()");

    using iterator_type = decltype(std::begin(std::declval<Range&>()));
    using sentinel_type = decltype(std::end(std::declval<Range&>()));

public:
    // The range is stored first, iterators are taken from the stored copy.
    explicit range_producer(Range range)
        : range_(std::move(range))
        , cur_(std::begin(range_))
        , end_(std::end(range_))
    {}

    [[nodiscard]] std::optional<T> next() override {
        if (!(cur_ != end_)) {
            return std::nullopt;
        }
        std::optional<T> item(std::in_place, *cur_);
        ++cur_;
        return item;
    }

private:
    Range         range_;
    iterator_type cur_;
    sentinel_type end_;
};

// ============================================================================
// generator_producer<F, T>
// ============================================================================

template<class F, class T = detail::generated_value_t<F>>
class generator_producer final : public producer<T>
{
    static_assert(std::is_invocable_v<F&>,
                  "[lseq::generator_producer]: F must be callable without arguments");
    static_assert(std::is_convertible_v<std::invoke_result_t<F&>, std::optional<T>>,
                  "[lseq::generator_producer]: F must return std::optional<T>");

public:
    explicit generator_producer(F fn)
        : fn_(std::move(fn))
    {}

    [[nodiscard]] std::optional<T> next() override {
        if (done_) {
            return std::nullopt;
        }
        std::optional<T> item = fn_();
        if (!item) {
            done_ = true;
        }
        return item;
    }

private:
    F    fn_;
    bool done_ = false;
};

} // namespace lseq

#endif /* LSEQ_PRODUCER_HPP_ */
