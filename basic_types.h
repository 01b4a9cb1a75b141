/*
 * basic_types.h: width aliases shared by the lazyseq headers
 *
 *  Type   │ Meaning
 * ────────┼──────────────────────────────────────────────
 *  reg    │ pointer-sized unsigned integer (sizes, positions)
 *  sreg   │ pointer-sized signed integer (slice bounds, indices)
 *  usize  │ std::size_t
 *  isize  │ std::ptrdiff_t
 *
 * Platform assumptions:
 *     - 8-bit bytes.
 *     - reg and sreg have the width of a data pointer.
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#include <cstddef>   /* size_t, ptrdiff_t */
#include <cstdint>   /* uintptr_t, intptr_t */
#include <climits>   /* CHAR_BIT */

typedef std::uintptr_t reg;
typedef std::intptr_t  sreg;
typedef std::size_t    usize;
typedef std::ptrdiff_t isize;

static_assert(CHAR_BIT == 8, "basic_types.h: 8-bit bytes required");
static_assert(sizeof(reg) == sizeof(void*), "basic_types.h: reg must be pointer-sized");
static_assert(sizeof(sreg) == sizeof(reg), "basic_types.h: sreg must match reg width");
static_assert(sizeof(usize) <= sizeof(reg), "basic_types.h: size_t wider than reg");

#endif /* BASIC_TYPES_H_ */
