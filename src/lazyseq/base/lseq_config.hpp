/*
 * lseq_config.hpp
 *
 *  Created on: 14 Oct. 2026
 */

#ifndef LSEQ_CONFIG_HPP_
#define LSEQ_CONFIG_HPP_

/*
 * lazyseq settings
 * Build toggles:
 *   - LSEQ_DEFAULT_STORAGE_DEQUE (default: 1)
 *       1 -> cache items in std::deque (references stay valid while the cache grows)
 *       0 -> cache items in lseq::append_buffer (contiguous; a growing pull
 *            invalidates references handed out earlier)
 *
 *   - LSEQ_BUFFER_INITIAL_CAPACITY (default: 16)
 *       First reservation made by append_buffer when it receives its first item.
 *
 *   - LSEQ_BUFFER_GROWTH_PAD (default: 8)
 *       Growth rule: new_cap = need + need/2 + pad.
 */
#ifndef LSEQ_DEFAULT_STORAGE_DEQUE
#  define LSEQ_DEFAULT_STORAGE_DEQUE 1
#endif /* LSEQ_DEFAULT_STORAGE_DEQUE */

#ifndef LSEQ_BUFFER_INITIAL_CAPACITY
#  define LSEQ_BUFFER_INITIAL_CAPACITY 16
#endif /* LSEQ_BUFFER_INITIAL_CAPACITY */

#ifndef LSEQ_BUFFER_GROWTH_PAD
#  define LSEQ_BUFFER_GROWTH_PAD 8
#endif /* LSEQ_BUFFER_GROWTH_PAD */


// assert ------------------------
// Contract checks for misuse that is not reported through exceptions
// (reading past size in a raw buffer, pulling from a spent source).
#ifndef LSEQ_ASSERT
#  define LSEQ_ASSERT(x)
#endif /* LSEQ_ASSERT */

static_assert(LSEQ_DEFAULT_STORAGE_DEQUE == 0 || LSEQ_DEFAULT_STORAGE_DEQUE == 1,
              "LSEQ_DEFAULT_STORAGE_DEQUE must be 0 or 1");
static_assert(LSEQ_BUFFER_INITIAL_CAPACITY > 0,
              "LSEQ_BUFFER_INITIAL_CAPACITY must be > 0");

#endif /* LSEQ_CONFIG_HPP_ */
