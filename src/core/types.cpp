// File: src/core/types.cpp
#include "core/types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ctxmem {

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

int Timestamp::HourOfDay() const {
    std::time_t t = ClockType::to_time_t(time_point_);
    std::tm local{};
    localtime_r(&t, &local);
    return local.tm_hour;
}

std::string Timestamp::ToString() const {
    std::time_t t = ClockType::to_time_t(time_point_);
    std::tm utc{};
    gmtime_r(&t, &utc);

    auto micros = ToMicros() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << micros << "Z";
    return oss.str();
}

double SecondsBetween(const Timestamp& later, const Timestamp& earlier) {
    return static_cast<double>((later - earlier).count()) / 1e6;
}

double HoursBetween(const Timestamp& later, const Timestamp& earlier) {
    return SecondsBetween(later, earlier) / 3600.0;
}

double DaysBetween(const Timestamp& later, const Timestamp& earlier) {
    return SecondsBetween(later, earlier) / 86400.0;
}

// AccessOperation implementations

const char* ToString(AccessOperation op) {
    switch (op) {
        case AccessOperation::VIEW:
            return "view";
        case AccessOperation::CREATE:
            return "create";
        case AccessOperation::UPDATE:
            return "update";
        default:
            return "unknown";
    }
}

std::optional<AccessOperation> ParseAccessOperation(const std::string& str) {
    if (str == "view" || str == "VIEW") {
        return AccessOperation::VIEW;
    } else if (str == "create" || str == "CREATE") {
        return AccessOperation::CREATE;
    } else if (str == "update" || str == "UPDATE") {
        return AccessOperation::UPDATE;
    }
    return std::nullopt;
}

size_t EstimateTokens(const std::string& content) {
    return (content.size() + kCharsPerToken - 1) / kCharsPerToken;
}

} // namespace ctxmem
