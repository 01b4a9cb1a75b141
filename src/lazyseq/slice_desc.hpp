/*
 * slice_desc.hpp
 *
 * Immutable (start, stop, step) slice descriptor with dynamic-array slicing
 * semantics: negative bounds count from the end, omitted bounds default by
 * step direction, out-of-range bounds clamp, step may be negative.
 *
 * A descriptor never touches a producer. Operations that need the total
 * size take it either as a number or as a callable returning it; the
 * callable is invoked only when the answer really depends on the size, so a
 * forward slice with non-negative bounds never forces a drain.
 *
 * Coordinates: every descriptor held by a lazy_sequence is absolute, i.e.
 * position 0 is the first item the producer ever yielded. compose() folds a
 * child slice (relative to the view) into one absolute descriptor.
 */

#ifndef LSEQ_SLICE_DESC_HPP_
#define LSEQ_SLICE_DESC_HPP_

#include <optional>
#include <type_traits>
#include <utility>      // std::forward

#include "basic_types.h"            // reg, sreg
#include "base/lseq_arith.hpp"      // sat_add, sat_mul, magnitude
#include "base/lseq_errors.hpp"     // invalid_step, index_out_of_range
#include "base/lseq_tools.hpp"

namespace lseq {

class slice_desc
{
public:
    using index_type = sreg;
    using size_type  = reg;
    using bound_type = std::optional<index_type>;

    // Resolved form against a known size: positions first, first+step, ...
    // (count of them). first is meaningless when count == 0.
    struct progression {
        index_type first = 0;
        index_type step  = 1;
        size_type  count = 0;
    };

    // Identity slice [::].
    slice_desc() noexcept = default;

    // Throws invalid_step when step == 0. Omitted step means 1.
    slice_desc(const bound_type start, const bound_type stop, const bound_type step = std::nullopt)
        : start_(start)
        , stop_(stop)
        , step_(normalize_step(step.value_or(1)))
    {
        if (RB_UNLIKELY(step_ == 0)) {
            detail::throw_invalid_step();
        }
    }

    [[nodiscard]] static std::optional<slice_desc> try_make(const bound_type start,
                                                            const bound_type stop,
                                                            const bound_type step = std::nullopt) noexcept {
        if (step && *step == 0) {
            return std::nullopt;
        }
        return slice_desc(unchecked_tag{}, start, stop, normalize_step(step.value_or(1)));
    }

    // Flat descriptor selecting exactly p (first, step, count) when applied
    // to any sequence that contains all of those positions.
    [[nodiscard]] static slice_desc from_progression(const progression& p) noexcept {
        const index_type step = normalize_step(p.step);
        if (p.count == 0u) {
            return slice_desc(unchecked_tag{}, index_type{0}, index_type{0}, step);
        }
        const index_type last = detail::sat_add(p.first,
            detail::sat_mul(detail::to_sreg(static_cast<size_type>(p.count - 1u)), step));

        if (step > 0) {
            return slice_desc(unchecked_tag{}, p.first, detail::sat_add(last, 1), step);
        }
        // Stop is exclusive going down; below position 0 it becomes "unbounded".
        const bound_type stop = (last >= 1) ? bound_type(last - 1) : bound_type(std::nullopt);
        return slice_desc(unchecked_tag{}, p.first, stop, step);
    }

    // --------------------------------------------------------------------------
    // Observers
    // --------------------------------------------------------------------------
    [[nodiscard]] const bound_type& start() const noexcept { return start_; }
    [[nodiscard]] const bound_type& stop() const noexcept { return stop_; }
    [[nodiscard]] index_type step() const noexcept { return step_; }

    [[nodiscard]] bool is_identity() const noexcept {
        return !start_ && !stop_ && step_ == 1;
    }

    // True if start or stop counts from the end (needs the size to resolve).
    [[nodiscard]] bool has_negative_bounds() const noexcept {
        return (start_ && *start_ < 0) || (stop_ && *stop_ < 0);
    }

    // True if the slice can be answered without knowing the total size.
    [[nodiscard]] bool is_lazy() const noexcept {
        return step_ > 0 && !has_negative_bounds();
    }

    friend bool operator==(const slice_desc& a, const slice_desc& b) noexcept {
        return a.start_ == b.start_ && a.stop_ == b.stop_ && a.step_ == b.step_;
    }

    friend bool operator!=(const slice_desc& a, const slice_desc& b) noexcept {
        return !(a == b);
    }

    // --------------------------------------------------------------------------
    // Arithmetic against a known size
    // --------------------------------------------------------------------------

    // Negative start/stop rewritten as absolute positions. A negative stop that
    // lands before position 0 becomes 0 going up and "unbounded" going down;
    // a negative start before position 0 on a downward slice empties it.
    [[nodiscard]] slice_desc positive(const size_type size) const noexcept {
        const index_type n = detail::to_sreg(size);

        bound_type start = start_;
        if (start && *start < 0) {
            const index_type s = *start + n;
            if (s < 0) {
                if (step_ < 0) {
                    return slice_desc(unchecked_tag{}, index_type{0}, index_type{0}, step_);
                }
                start = index_type{0};
            } else {
                start = s;
            }
        }

        bound_type stop = stop_;
        if (stop && *stop < 0) {
            const index_type e = *stop + n;
            if (e >= 0) {
                stop = e;
            } else if (step_ > 0) {
                stop = index_type{0};
            } else {
                stop = std::nullopt;
            }
        }

        return slice_desc(unchecked_tag{}, start, stop, step_);
    }

    [[nodiscard]] progression resolve(const size_type size) const noexcept {
        const index_type n     = detail::to_sreg(size);
        const index_type lower = (step_ > 0) ? 0 : -1;
        const index_type upper = (step_ > 0) ? n : n - 1;

        const index_type first = adjust(start_, (step_ > 0) ? lower : upper, n, lower, upper);
        const index_type last  = adjust(stop_,  (step_ > 0) ? upper : lower, n, lower, upper);

        progression p{};
        p.first = first;
        p.step  = step_;
        if (step_ > 0 && first < last) {
            p.count = static_cast<size_type>(
                static_cast<reg>(last - first - 1) / detail::magnitude(step_) + 1u);
        } else if (step_ < 0 && last < first) {
            p.count = static_cast<size_type>(
                static_cast<reg>(first - last - 1) / detail::magnitude(step_) + 1u);
        }
        return p;
    }

    // Number of selected items; downward slices are measured through reverse().
    [[nodiscard]] size_type length(const size_type size) const noexcept {
        const slice_desc fwd = (step_ < 0) ? reverse(size) : positive(size);

        reg remaining = size;
        if (fwd.stop_) {
            const reg stop = static_cast<reg>(*fwd.stop_);
            remaining = (stop < remaining) ? stop : remaining;
        }
        if (fwd.start_) {
            const reg start = static_cast<reg>(*fwd.start_);
            remaining = (remaining > start) ? static_cast<reg>(remaining - start) : reg{0};
        }
        if (remaining == 0u) {
            return 0u;
        }
        // ceil(remaining / step) without floating point.
        return static_cast<size_type>(1u + (remaining - 1u) / detail::magnitude(fwd.step_));
    }

    // Forward descriptor that, applied to the reversed sequence, selects the
    // same items in the same order as this downward descriptor.
    [[nodiscard]] slice_desc reverse(const size_type size) const noexcept {
        LSEQ_ASSERT(step_ < 0);
        const progression p = resolve(size);
        const index_type  n = detail::to_sreg(size);
        const index_type  up = -step_;

        if (p.count == 0u) {
            return slice_desc(unchecked_tag{}, index_type{0}, index_type{0}, up);
        }
        const index_type last = p.first + detail::sat_mul(detail::to_sreg(static_cast<size_type>(p.count - 1u)), step_);
        const index_type rfirst = (n - 1) - p.first;
        const index_type rlast  = (n - 1) - last;
        return slice_desc(unchecked_tag{}, rfirst, rlast + 1, up);
    }

    // --------------------------------------------------------------------------
    // Index resolution
    // --------------------------------------------------------------------------

    // Absolute position of logical index (>= 0) inside this slice. A forward
    // slice without negative bounds does not consult size and does not check
    // the position against the producer end; the caller does that by pulling.
    // strict == false clamps to the nearest valid slot instead of failing.
    template<class SizeFn, typename = std::enable_if_t<std::is_invocable_r_v<size_type, SizeFn&>>>
    [[nodiscard]] std::optional<index_type> try_resolve_index(const index_type index, SizeFn&& size,
                                                              const bool strict = true) const {
        LSEQ_ASSERT(index >= 0);
        if (step_ > 0) {
            const slice_desc d = has_negative_bounds() ? positive(size()) : *this;
            const index_type pos = detail::sat_add(d.start_.value_or(0), detail::sat_mul(index, step_));
            if (d.stop_ && pos >= *d.stop_) {
                if (strict) {
                    return std::nullopt;
                }
                return (*d.stop_ > 0) ? (*d.stop_ - 1) : index_type{0};
            }
            return pos;
        }

        const size_type  total = size();
        const index_type n     = detail::to_sreg(total);
        const slice_desc d     = positive(total);

        index_type start = d.start_.value_or(n - 1);
        if (start > n - 1) {
            start = n - 1;
        }
        const index_type pos = detail::sat_add(start, detail::sat_mul(index, step_));
        if (pos < 0 || (d.stop_ && pos <= *d.stop_)) {
            if (strict) {
                return std::nullopt;
            }
            return d.stop_ ? (*d.stop_ + 1) : index_type{0};
        }
        return pos;
    }

    [[nodiscard]] std::optional<index_type> try_resolve_index(const index_type index, const size_type size,
                                                              const bool strict = true) const {
        return try_resolve_index(index, [size]() noexcept { return size; }, strict);
    }

    // Throws index_out_of_range when strict and the index falls outside.
    template<class SizeFn, typename = std::enable_if_t<std::is_invocable_r_v<size_type, SizeFn&>>>
    [[nodiscard]] index_type resolve_index(const index_type index, SizeFn&& size,
                                           const bool strict = true) const {
        const std::optional<index_type> pos = try_resolve_index(index, std::forward<SizeFn>(size), strict);
        if (!pos) {
            detail::throw_index_out_of_range();
        }
        return *pos;
    }

    [[nodiscard]] index_type resolve_index(const index_type index, const size_type size,
                                           const bool strict = true) const {
        return resolve_index(index, [size]() noexcept { return size; }, strict);
    }

    // --------------------------------------------------------------------------
    // Composition
    // --------------------------------------------------------------------------

    // Single absolute descriptor equivalent to applying `child` to the view
    // this descriptor selects. Two lazy descriptors compose in closed form;
    // anything else resolves both against the total size.
    template<class SizeFn, typename = std::enable_if_t<std::is_invocable_r_v<size_type, SizeFn&>>>
    [[nodiscard]] slice_desc compose(const slice_desc& child, SizeFn&& size) const {
        if (is_lazy() && child.is_lazy()) {
            const index_type base = start_.value_or(0);

            bound_type start = start_;
            if (child.start_) {
                start = detail::sat_add(base, detail::sat_mul(*child.start_, step_));
            }

            bound_type stop = stop_;
            if (child.stop_) {
                const index_type bound = detail::sat_add(base, detail::sat_mul(*child.stop_, step_));
                stop = (stop_ && *stop_ < bound) ? *stop_ : bound;
            }
            return slice_desc(unchecked_tag{}, start, stop, detail::sat_mul(step_, child.step_));
        }

        const progression outer = resolve(size());
        const progression inner = child.resolve(outer.count);

        progression p{};
        p.step  = detail::sat_mul(outer.step, inner.step);
        p.count = inner.count;
        if (inner.count != 0u) {
            p.first = outer.first + detail::sat_mul(inner.first, outer.step);
        }
        return from_progression(p);
    }

    [[nodiscard]] slice_desc compose(const slice_desc& child, const size_type size) const {
        return compose(child, [size]() noexcept { return size; });
    }

private:
    struct unchecked_tag {};

    slice_desc(unchecked_tag, const bound_type start, const bound_type stop, const index_type step) noexcept
        : start_(start)
        , stop_(stop)
        , step_(step)
    {}

    // numeric_limits<sreg>::min() has no positive counterpart; one less selects
    // the same items on any sequence whose size fits in sreg.
    static constexpr index_type normalize_step(const index_type step) noexcept {
        return detail::clamp_symmetric(step);
    }

    // Clamp a bound into [lower, upper] the way dynamic-array slicing does.
    static index_type adjust(const bound_type& bound, const index_type fallback, const index_type n,
                             const index_type lower, const index_type upper) noexcept {
        if (!bound) {
            return fallback;
        }
        index_type v = *bound;
        if (v < 0) {
            v = detail::sat_add(v, n);
            if (v < lower) {
                v = lower;
            }
        } else if (v > upper) {
            v = upper;
        }
        return v;
    }

    bound_type start_{};
    bound_type stop_{};
    index_type step_ = 1;
};

} // namespace lseq

#endif /* LSEQ_SLICE_DESC_HPP_ */
