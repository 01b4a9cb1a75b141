/*
 * lseq_tools.hpp
 *
 *  Created on: 14 Oct. 2026
 *
 * Portability helpers shared by the lazyseq headers.
 * - Force-inline / no-inline tokens.
 * - Branch prediction hints.
 * - Exception availability gate (the library reports errors by throwing).
 */

#ifndef LSEQ_TOOLS_HPP_
#define LSEQ_TOOLS_HPP_

#include "lseq_config.hpp"

// ============================================================================
// ASSERT Macro
// ============================================================================
#ifndef LSEQ_ASSERT
#  define LSEQ_ASSERT(x)
#endif /* LSEQ_ASSERT */

/* ---------------------------------------------------------------------------
 * RB_FORCEINLINE: "strong" inlining hint for headers
 * ------------------------------------------------------------------------- */
#ifndef RB_FORCEINLINE
#  if defined(_MSC_VER)
#    define RB_FORCEINLINE __forceinline
#  elif defined(__clang__) || defined(__GNUC__)
#    define RB_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define RB_FORCEINLINE inline
#  endif
#endif /* RB_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * RB_NOINLINE: keep cold paths (throw sites) out of the hot callers
 * ------------------------------------------------------------------------- */
#ifndef RB_NOINLINE
#  if defined(_MSC_VER)
#    define RB_NOINLINE __declspec(noinline)
#  elif defined(__clang__) || defined(__GNUC__)
#    define RB_NOINLINE __attribute__((noinline))
#  else
#    define RB_NOINLINE
#  endif
#endif /* RB_NOINLINE */

/* ---------------------------------------------------------------------------
 * Branch prediction hints.
 * Separate guards prevent losing RB_UNLIKELY if RB_LIKELY is predefined.
 * ------------------------------------------------------------------------- */
#ifndef RB_LIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define RB_LIKELY(x)   __builtin_expect(!!(x), 1)
#  else
#    define RB_LIKELY(x)   (x)
#  endif
#endif /* RB_LIKELY */

#ifndef RB_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define RB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define RB_UNLIKELY(x) (x)
#  endif
#endif /* RB_UNLIKELY */

// ============================================================================
// Exceptions
// ============================================================================
// invalid_step / index_out_of_range are part of the public contract, so a
// toolchain running with exceptions disabled is rejected up front.
#if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
        !(defined(_MSC_VER) && defined(_CPPUNWIND))
#  error "lazyseq requires C++ exceptions (invalid_step / index_out_of_range)"
#endif

#endif /* LSEQ_TOOLS_HPP_ */
