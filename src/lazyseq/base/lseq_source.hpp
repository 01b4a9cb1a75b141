/*
 * lseq_source.hpp
 *
 *  Created on: 14 Oct. 2026
 *
 * shared_source<T, Buffer>: the producer/cache pair shared by a root
 * lazy_sequence and every slice derived from it.
 *
 * Invariants:
 *  - cache() is always a prefix of the producer output, in producer order.
 *  - cache() only grows.
 *  - An item is appended to the cache before any view can observe it.
 *
 * Release path:
 *  - pull_uncached() advances the producer without caching. After the first
 *    uncached pull the source is spent: cache() is no longer a prefix of the
 *    producer output, and pulling into the cache again is a contract
 *    violation (LSEQ_ASSERT).
 *
 * Concurrency:
 *  - Not thread-safe. Each pull is one "next, append" step with no
 *    reentrancy, so interleaved iterators on one thread are fine.
 */

#ifndef LSEQ_SOURCE_HPP_
#define LSEQ_SOURCE_HPP_

#include <memory>       // std::unique_ptr
#include <optional>
#include <utility>      // std::move

#include "basic_types.h"    // reg
#include "lseq_producer.hpp"
#include "lseq_tools.hpp"

namespace lseq::detail {

template<class T, class Buffer>
class shared_source
{
public:
    using value_type    = T;
    using buffer_type   = Buffer;
    using size_type     = reg;
    using producer_type = ::lseq::producer<T>;

    explicit shared_source(std::unique_ptr<producer_type> producer)
        : producer_(std::move(producer))
        , exhausted_(producer_ == nullptr)
    {}

    shared_source(const shared_source&)            = delete;
    shared_source& operator=(const shared_source&) = delete;
    shared_source(shared_source&&)                 = delete;
    shared_source& operator=(shared_source&&)      = delete;

    [[nodiscard]] const buffer_type& cache() const noexcept { return cache_; }
    [[nodiscard]] size_type cached() const noexcept { return static_cast<size_type>(cache_.size()); }
    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }
    [[nodiscard]] bool spent() const noexcept { return spent_; }

    // Absolute position of the item the producer yields next.
    [[nodiscard]] size_type next_position() const noexcept {
        return static_cast<size_type>(cached() + uncached_);
    }

    // Reads one item and appends it. False once the producer is exhausted.
    bool pull() {
        LSEQ_ASSERT(!spent_);
        if (exhausted_) {
            return false;
        }
        std::optional<T> item = producer_->next();
        if (!item) {
            finish();
            return false;
        }
        cache_.push_back(std::move(*item));
        return true;
    }

    // Pulls until position pos is cached. False if the producer ends first.
    bool ensure(const size_type pos) {
        while (cached() <= pos) {
            if (!pull()) {
                return false;
            }
        }
        return true;
    }

    void fill() {
        while (pull()) {
        }
    }

    // Drains the producer and returns the total number of items.
    [[nodiscard]] size_type total() {
        fill();
        return cached();
    }

    [[nodiscard]] std::optional<T> pull_uncached() {
        if (exhausted_) {
            return std::nullopt;
        }
        spent_ = true;
        std::optional<T> item = producer_->next();
        if (!item) {
            finish();
            return std::nullopt;
        }
        ++uncached_;
        return item;
    }

private:
    void finish() noexcept {
        exhausted_ = true;
        producer_.reset();
    }

    std::unique_ptr<producer_type> producer_;
    buffer_type                    cache_{};
    size_type                      uncached_  = 0;
    bool                           exhausted_ = false;
    bool                           spent_     = false;
};

} // namespace lseq::detail

#endif /* LSEQ_SOURCE_HPP_ */
