// File: src/storage/flush_policy.hpp
#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstddef>

namespace ctxmem {

/// Decides when a batch of dirty records should be written out
///
/// A flush is due when enough records are pending, when the interval since
/// the last flush has elapsed with something pending, or when the bounded
/// write queue is full (the queue never grows past its capacity).
class FlushPolicy {
public:
    struct Config {
        /// Pending records that trigger a flush
        size_t batch_threshold{10};

        /// Maximum time between flushes while records are pending
        std::chrono::seconds flush_interval{30};

        /// Capacity of the pending write queue
        size_t max_queue_size{1000};

        bool IsValid() const {
            return batch_threshold > 0 &&
                   max_queue_size >= batch_threshold &&
                   flush_interval.count() >= 0;
        }
    };

    FlushPolicy() = default;
    explicit FlushPolicy(const Config& config) : config_(config) {}

    /// Record that one more record is pending
    void NotePending() { ++pending_; }

    /// Check whether a flush should happen now
    bool ShouldFlush(const Timestamp& now) const {
        if (pending_ == 0) {
            return false;
        }
        if (pending_ >= config_.batch_threshold || pending_ >= config_.max_queue_size) {
            return true;
        }
        return (now - last_flush_) >= config_.flush_interval;
    }

    /// Reset after a completed flush
    void MarkFlushed(const Timestamp& now) {
        pending_ = 0;
        last_flush_ = now;
    }

    size_t GetPendingCount() const { return pending_; }
    Timestamp GetLastFlush() const { return last_flush_; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    size_t pending_{0};
    Timestamp last_flush_{Timestamp::Now()};
};

} // namespace ctxmem
