// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <chrono>
#include <optional>
#include <string>

namespace ctxmem {

// Timestamp: Microsecond-precision wall-clock time point.
// Wall clock (not steady) because timestamps are persisted and compared
// across process restarts.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates zero timestamp (the epoch)
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // Check for the zero timestamp
    bool IsZero() const { return ToMicros() == 0; }

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    // Shift by a duration
    template <typename Rep, typename Period>
    Timestamp operator+(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(time_point_ + std::chrono::duration_cast<ClockType::duration>(d));
    }

    template <typename Rep, typename Period>
    Timestamp operator-(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(time_point_ - std::chrono::duration_cast<ClockType::duration>(d));
    }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // Local hour of day [0, 23]
    int HourOfDay() const;

    // String conversion (UTC, ISO-8601)
    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// Elapsed time helpers (fractional, later - earlier)
double SecondsBetween(const Timestamp& later, const Timestamp& earlier);
double HoursBetween(const Timestamp& later, const Timestamp& earlier);
double DaysBetween(const Timestamp& later, const Timestamp& earlier);

// AccessOperation: Kind of touch recorded against a knowledge item
enum class AccessOperation : uint8_t {
    VIEW = 0,
    CREATE = 1,
    UPDATE = 2,
};

// Convert AccessOperation to string
const char* ToString(AccessOperation op);

// Parse AccessOperation from string
std::optional<AccessOperation> ParseAccessOperation(const std::string& str);

// Characters per token used for the token proxy
constexpr size_t kCharsPerToken = 4;

// Estimate tokens for a piece of content: ceil(length / kCharsPerToken)
size_t EstimateTokens(const std::string& content);

} // namespace ctxmem
