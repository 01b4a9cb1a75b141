/*
 * lseq_errors.hpp
 *
 *  Created on: 14 Oct. 2026
 *
 * Error taxonomy of the lazyseq library:
 *   - invalid_step        : a slice was built with step == 0.
 *   - index_out_of_range  : a read resolved to a position that does not exist
 *                           (past a declared bound or past producer exhaustion).
 *
 * Both are caller errors: raised synchronously at the offending call, never
 * retried, never deferred.
 */

#ifndef LSEQ_ERRORS_HPP_
#define LSEQ_ERRORS_HPP_

#include <stdexcept>

#include "lseq_tools.hpp"

namespace lseq {

class invalid_step : public std::invalid_argument
{
public:
    invalid_step()
        : std::invalid_argument("slice step cannot be zero")
    {}
};

class index_out_of_range : public std::out_of_range
{
public:
    index_out_of_range()
        : std::out_of_range("lazy_sequence index out of range")
    {}
};

namespace detail {

[[noreturn]] RB_NOINLINE inline void throw_invalid_step() {
    throw ::lseq::invalid_step{};
}

[[noreturn]] RB_NOINLINE inline void throw_index_out_of_range() {
    throw ::lseq::index_out_of_range{};
}

} // namespace detail

} // namespace lseq

#endif /* LSEQ_ERRORS_HPP_ */
