/*
 * lseq_arith.hpp
 *
 *  Created on: 14 Oct. 2026
 *
 * Saturating signed arithmetic for slice bounds.
 *
 * Results are clamped to [-kSregMax, +kSregMax]; the value
 * numeric_limits<sreg>::min() is never produced, so negating a result is
 * always defined. Saturation is exact for slicing purposes: a bound or a
 * stride beyond kSregMax selects the same items as kSregMax on any sequence
 * whose length fits in sreg.
 */

#ifndef LSEQ_ARITH_HPP_
#define LSEQ_ARITH_HPP_

#include <limits>

#include "basic_types.h"   // reg, sreg
#include "lseq_tools.hpp"

namespace lseq::detail {

inline constexpr sreg kSregMax = std::numeric_limits<sreg>::max();

[[nodiscard]] constexpr reg magnitude(const sreg v) noexcept {
    return (v < 0) ? static_cast<reg>(0u - static_cast<reg>(v)) : static_cast<reg>(v);
}

[[nodiscard]] constexpr sreg clamp_symmetric(const sreg v) noexcept {
    return (v < -kSregMax) ? -kSregMax : v;
}

[[nodiscard]] constexpr sreg sat_add(const sreg a, const sreg b) noexcept {
    if (b > 0 && a > kSregMax - b) {
        return kSregMax;
    }
    if (b < 0 && a < -kSregMax - b) {
        return -kSregMax;
    }
    return clamp_symmetric(a + b);
}

[[nodiscard]] constexpr sreg sat_mul(const sreg a, const sreg b) noexcept {
    if (a == 0 || b == 0) {
        return 0;
    }
    const bool negative = (a < 0) != (b < 0);
    const reg  ua       = magnitude(a);
    const reg  ub       = magnitude(b);

    if (ua > static_cast<reg>(kSregMax) / ub) {
        return negative ? -kSregMax : kSregMax;
    }
    const sreg r = static_cast<sreg>(ua * ub);
    return negative ? -r : r;
}

[[nodiscard]] constexpr sreg to_sreg(const reg v) noexcept {
    return (v > static_cast<reg>(kSregMax)) ? kSregMax : static_cast<sreg>(v);
}

} // namespace lseq::detail

#endif /* LSEQ_ARITH_HPP_ */
