/*
 * lazy_sequence.hpp
 *
 * Random-access sequence view over a one-pass producer.
 *
 * Model:
 * - A root lazy_sequence owns (through a shared handle) the producer and the
 *   cache of items pulled so far. Every slice taken from it shares the same
 *   handle; nothing is copied, nothing is re-requested from the producer.
 * - Each view carries one flat slice_desc in absolute producer positions.
 *   Slicing a view composes descriptors, it never wraps a view in a view.
 * - Forward slices with non-negative bounds pull lazily, only as far as the
 *   requested position. size(), negative indices/bounds and negative steps
 *   drain the producer first.
 *
 * Invalidation:
 * - References returned by at()/operator[]/iterators point into the cache.
 *   storage::deque (the default) keeps them valid while the cache grows,
 *   including pulls made through other views or iterators of the same source.
 *   With contiguous storage (storage::chunked, storage::vector) they are
 *   invalidated by the next pull that grows the cache.
 *
 * Release:
 * - release() walks the view while pulling straight from the producer
 *   without caching new items. Afterwards neither this view nor any view
 *   sharing its source may be used again.
 *
 * Concurrency:
 * - Not thread-safe. Interleaving several iterators of views sharing one
 *   source on a single thread is supported.
 */

#ifndef LSEQ_LAZY_SEQUENCE_HPP_
#define LSEQ_LAZY_SEQUENCE_HPP_

#include <cstddef>          // std::ptrdiff_t
#include <initializer_list>
#include <iterator>         // std::input_iterator_tag
#include <memory>           // std::shared_ptr, std::make_shared, std::unique_ptr
#include <optional>
#include <type_traits>
#include <utility>          // std::move, std::forward
#include <vector>

#include "basic_types.h"            // reg, sreg
#include "slice_desc.hpp"
#include "base/lseq_arith.hpp"
#include "base/lseq_errors.hpp"
#include "base/lseq_policy.hpp"     // ::lseq::storage::default_storage
#include "base/lseq_producer.hpp"
#include "base/lseq_source.hpp"
#include "base/lseq_tools.hpp"

namespace lseq {

template<class T, class StoragePolicy = ::lseq::storage::default_storage>
class lazy_sequence;

namespace detail {

template<class X>
struct is_lazy_sequence : std::false_type {};

template<class T, class P>
struct is_lazy_sequence<::lseq::lazy_sequence<T, P>> : std::true_type {};

} // namespace detail

/* =======================================================================
 * lazy_sequence<T, StoragePolicy>
 * ======================================================================= */
template<class T, class StoragePolicy>
class lazy_sequence
{
public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using value_type      = T;
    using size_type       = reg;
    using index_type      = sreg;
    using difference_type = std::ptrdiff_t;
    using const_reference = const value_type&;
    using const_pointer   = const value_type*;
    using bound_type      = slice_desc::bound_type;

    using policy_type     = StoragePolicy;
    using buffer_type     = ::lseq::storage::buffer_for_t<StoragePolicy, T>;
    using producer_type   = ::lseq::producer<T>;
    using source_type     = ::lseq::detail::shared_source<T, buffer_type>;

    static_assert(!std::is_const_v<value_type> && !std::is_reference_v<value_type>,
                  "[lseq::lazy_sequence]: T must be a non-const object type.");
    static_assert(std::is_move_constructible_v<value_type>,
                  "[lseq::lazy_sequence]: T must be move-constructible (pulled items move into the cache).");

    class iterator;
    class release_iterator;
    class release_range;

    using const_iterator = iterator;

    // ------------------------------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------------------------------

    // A null producer behaves as an empty one.
    explicit lazy_sequence(std::unique_ptr<producer_type> producer, const slice_desc indices = {})
        : source_(std::make_shared<source_type>(std::move(producer)))
        , indices_(indices)
    {}

    // Takes the range by value (lvalues are copied) and walks it once.
    template<class Range, typename = std::enable_if_t<
                 detail::is_iterable_v<std::remove_reference_t<Range>> &&
                 !detail::is_lazy_sequence<std::decay_t<Range>>::value>>
    explicit lazy_sequence(Range&& range, const slice_desc indices = {})
        : lazy_sequence(std::make_unique<range_producer<std::decay_t<Range>, T>>(
              std::forward<Range>(range)), indices)
    {}

    template<class It, class Sent, typename = std::enable_if_t<detail::is_iterator_pair_v<It, Sent>>>
    lazy_sequence(It first, Sent last, const slice_desc indices = {})
        : lazy_sequence(std::make_unique<iterator_producer<It, Sent, T>>(
              std::move(first), std::move(last)), indices)
    {}

    lazy_sequence(std::initializer_list<T> items, const slice_desc indices = {})
        : lazy_sequence(std::vector<T>(items), indices)
    {}

    // fn() returns std::optional<T>; std::nullopt ends the sequence.
    template<class F>
    [[nodiscard]] static lazy_sequence generate(F&& fn, const slice_desc indices = {}) {
        return lazy_sequence(std::make_unique<generator_producer<std::decay_t<F>, T>>(
            std::forward<F>(fn)), indices);
    }

    // Copies are further views of the same source.
    lazy_sequence(const lazy_sequence&)            = default;
    lazy_sequence& operator=(const lazy_sequence&) = default;
    lazy_sequence(lazy_sequence&&) noexcept            = default;
    lazy_sequence& operator=(lazy_sequence&&) noexcept = default;
    ~lazy_sequence() = default;

    // ------------------------------------------------------------------------------------------
    // Observers
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] const slice_desc& indices() const noexcept { return indices_; }

    // Items pulled into the shared cache so far.
    [[nodiscard]] size_type cached() const noexcept { return source_->cached(); }
    [[nodiscard]] bool exhausted() const noexcept { return source_->exhausted(); }

    [[nodiscard]] bool shares_source_with(const lazy_sequence& other) const noexcept {
        return source_ == other.source_;
    }

    // ------------------------------------------------------------------------------------------
    // Sequence operations
    // ------------------------------------------------------------------------------------------

    // Pulls at most up to the first selected item of a forward slice.
    [[nodiscard]] bool empty() const {
        return begin() == end();
    }

    explicit operator bool() const {
        return !empty();
    }

    // Drains the producer.
    [[nodiscard]] size_type size() const {
        return indices_.length(source_->total());
    }

    // nullptr when out of range. Producer exceptions still propagate.
    [[nodiscard]] const_pointer try_at(index_type index) const {
        if (index < 0) {
            index = detail::sat_add(index, detail::to_sreg(size()));
            if (index < 0) {
                return nullptr;
            }
        }

        const std::optional<index_type> pos = indices_.try_resolve_index(index, total_fn());
        if (!pos || !source_->ensure(static_cast<size_type>(*pos))) {
            return nullptr;
        }
        return &source_->cache()[static_cast<size_type>(*pos)];
    }

    [[nodiscard]] const_reference at(const index_type index) const {
        const_pointer item = try_at(index);
        if (RB_UNLIKELY(item == nullptr)) {
            detail::throw_index_out_of_range();
        }
        return *item;
    }

    [[nodiscard]] const_reference operator[](const index_type index) const {
        return at(index);
    }

    // New view on the same source selecting child (relative to this view).
    [[nodiscard]] lazy_sequence slice(const slice_desc& child) const {
        return lazy_sequence(source_, indices_.compose(child, total_fn()));
    }

    // Throws invalid_step for step == 0.
    [[nodiscard]] lazy_sequence slice(const bound_type start, const bound_type stop,
                                      const bound_type step = std::nullopt) const {
        return slice(slice_desc(start, stop, step));
    }

    [[nodiscard]] std::optional<lazy_sequence> try_slice(const bound_type start, const bound_type stop,
                                                         const bound_type step = std::nullopt) const {
        const std::optional<slice_desc> child = slice_desc::try_make(start, stop, step);
        if (!child) {
            return std::nullopt;
        }
        return slice(*child);
    }

    [[nodiscard]] lazy_sequence operator()(const slice_desc& child) const {
        return slice(child);
    }

    // Each call starts a fresh traversal from the first selected item.
    [[nodiscard]] iterator begin() const {
        const walk w = plan();
        return iterator(source_, w);
    }

    [[nodiscard]] iterator end() const noexcept {
        return iterator{};
    }

    // Terminal traversal, see the header notes.
    [[nodiscard]] release_range release() const {
        return release_range(*this);
    }

    // ------------------------------------------------------------------------------------------
    // iterator: single-pass, reads through the shared cache
    // ------------------------------------------------------------------------------------------
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using reference         = const T&;
        using pointer           = const T*;

        iterator() noexcept = default;

        reference operator*() const {
            LSEQ_ASSERT(!done_);
            return source_->cache()[position()];
        }

        pointer operator->() const {
            return &**this;
        }

        iterator& operator++() {
            LSEQ_ASSERT(!done_);
            walk_.pos = detail::sat_add(walk_.pos, walk_.step);
            settle();
            return *this;
        }

        iterator operator++(int) {
            iterator tmp(*this);
            ++(*this);
            return tmp;
        }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            if (a.done_ || b.done_) {
                return a.done_ == b.done_;
            }
            return a.source_ == b.source_ && a.walk_.pos == b.walk_.pos;
        }

        friend bool operator!=(const iterator& a, const iterator& b) noexcept {
            return !(a == b);
        }

    private:
        friend class lazy_sequence;

        struct walk_state {
            index_type                pos  = 0;
            index_type                step = 1;
            std::optional<index_type> stop{};
            std::optional<size_type>  mirror{};
        };

        template<class W>
        iterator(std::shared_ptr<source_type> source, const W& w)
            : source_(std::move(source))
            , walk_{w.pos, w.step, w.stop, w.mirror}
            , done_(false)
        {
            settle();
        }

        [[nodiscard]] size_type position() const noexcept {
            const size_type r = static_cast<size_type>(walk_.pos);
            return walk_.mirror ? static_cast<size_type>(*walk_.mirror - 1u - r) : r;
        }

        void settle() {
            if (walk_.stop && walk_.pos >= *walk_.stop) {
                done_ = true;
                return;
            }
            if (!source_->ensure(static_cast<size_type>(walk_.pos))) {
                done_ = true;
            }
        }

        std::shared_ptr<source_type> source_{};
        walk_state                   walk_{};
        bool                         done_ = true;
    };

    // ------------------------------------------------------------------------------------------
    // release_iterator: reads the cache, then the producer directly
    // ------------------------------------------------------------------------------------------
    class release_iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using reference         = const T&;
        using pointer           = const T*;

        release_iterator() noexcept = default;

        reference operator*() const {
            LSEQ_ASSERT(!done_);
            if (current_) {
                return *current_;
            }
            return source_->cache()[position()];
        }

        pointer operator->() const {
            return &**this;
        }

        release_iterator& operator++() {
            LSEQ_ASSERT(!done_);
            pos_ = detail::sat_add(pos_, step_);
            settle();
            return *this;
        }

        release_iterator operator++(int) {
            release_iterator tmp(*this);
            ++(*this);
            return tmp;
        }

        friend bool operator==(const release_iterator& a, const release_iterator& b) noexcept {
            if (a.done_ || b.done_) {
                return a.done_ == b.done_;
            }
            return a.source_ == b.source_ && a.pos_ == b.pos_;
        }

        friend bool operator!=(const release_iterator& a, const release_iterator& b) noexcept {
            return !(a == b);
        }

    private:
        friend class lazy_sequence;

        template<class W>
        release_iterator(std::shared_ptr<source_type> source, const W& w)
            : source_(std::move(source))
            , pos_(w.pos)
            , step_(w.step)
            , stop_(w.stop)
            , mirror_(w.mirror)
            , done_(false)
        {
            settle();
        }

        [[nodiscard]] size_type position() const noexcept {
            const size_type r = static_cast<size_type>(pos_);
            return mirror_ ? static_cast<size_type>(*mirror_ - 1u - r) : r;
        }

        void settle() {
            current_.reset();
            if (stop_ && pos_ >= *stop_) {
                done_ = true;
                return;
            }

            const size_type target = static_cast<size_type>(pos_);
            if (mirror_ || target < source_->cached()) {
                // Downward walks run over the drained cache.
                done_ = !(target < source_->cached());
                return;
            }

            // Skip the items between the previous slot and the target.
            LSEQ_ASSERT(source_->next_position() <= target);
            while (source_->next_position() < target) {
                if (!source_->pull_uncached()) {
                    done_ = true;
                    return;
                }
            }
            current_ = source_->pull_uncached();
            done_    = !current_;
        }

        std::shared_ptr<source_type> source_{};
        index_type                   pos_  = 0;
        index_type                   step_ = 1;
        std::optional<index_type>    stop_{};
        std::optional<size_type>     mirror_{};
        std::optional<T>             current_{};
        bool                         done_ = true;
    };

    class release_range
    {
    public:
        [[nodiscard]] release_iterator begin() const {
            const walk w = seq_.plan();
            return release_iterator(seq_.source_, w);
        }

        [[nodiscard]] release_iterator end() const noexcept {
            return release_iterator{};
        }

    private:
        friend class lazy_sequence;

        explicit release_range(const lazy_sequence& seq)
            : seq_(seq)
        {}

        lazy_sequence seq_;
    };

private:
    // Forward walk over producer positions (or, with mirror = N, over the
    // reversed drained cache: position = N - 1 - pos).
    struct walk {
        index_type                pos  = 0;
        index_type                step = 1;
        std::optional<index_type> stop{};
        std::optional<size_type>  mirror{};
    };

    lazy_sequence(std::shared_ptr<source_type> source, const slice_desc indices) noexcept
        : source_(std::move(source))
        , indices_(indices)
    {}

    [[nodiscard]] auto total_fn() const {
        source_type* source = source_.get();
        return [source]() { return source->total(); };
    }

    [[nodiscard]] walk plan() const {
        walk w{};
        if (indices_.step() > 0) {
            const slice_desc fwd = indices_.has_negative_bounds()
                ? indices_.positive(source_->total())
                : indices_;
            w.pos  = fwd.start().value_or(0);
            w.step = fwd.step();
            w.stop = fwd.stop();
            return w;
        }

        // A downward walk needs the full extent.
        const size_type  n   = source_->total();
        const slice_desc fwd = indices_.reverse(n);
        w.pos    = fwd.start().value_or(0);
        w.step   = fwd.step();
        w.stop   = fwd.stop();
        w.mirror = n;
        return w;
    }

    std::shared_ptr<source_type> source_;
    slice_desc                   indices_;
};

// ============================================================================
// Factories (element type deduced from the source)
// ============================================================================

template<class StoragePolicy = ::lseq::storage::default_storage, class Range,
         typename = std::enable_if_t<detail::is_iterable_v<std::remove_reference_t<Range>>>>
[[nodiscard]] auto make_lazy_sequence(Range&& range, const slice_desc indices = {}) {
    using value_type = detail::range_value_t<std::remove_reference_t<Range>>;
    return lazy_sequence<value_type, StoragePolicy>(std::forward<Range>(range), indices);
}

template<class StoragePolicy = ::lseq::storage::default_storage, class It, class Sent,
         typename = std::enable_if_t<detail::is_iterator_pair_v<It, Sent>>>
[[nodiscard]] auto make_lazy_sequence(It first, Sent last, const slice_desc indices = {}) {
    using value_type = detail::iterator_value_t<It>;
    return lazy_sequence<value_type, StoragePolicy>(std::move(first), std::move(last), indices);
}

template<class StoragePolicy = ::lseq::storage::default_storage, class F>
[[nodiscard]] auto make_generated_sequence(F&& fn, const slice_desc indices = {}) {
    using value_type = detail::generated_value_t<std::decay_t<F>>;
    return lazy_sequence<value_type, StoragePolicy>::generate(std::forward<F>(fn), indices);
}

} // namespace lseq

#endif /* LSEQ_LAZY_SEQUENCE_HPP_ */
