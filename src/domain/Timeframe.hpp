#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace domain {

enum class Timeframe {
    OneHour,
    OneDay,
    OneWeek,
    OneMonth,
    OneYear,
};

enum class SpreadDirection {
    Either,
    Below,
};

// Shape of a synthesized series. The start price sits between minSpread and
// maxSpread (fractions of the current price) away from the current price;
// every non-final point stays within maxVariation of its interpolated base.
struct TimeframeConfig {
    std::size_t pointCount{0};
    std::int64_t intervalMs{0};
    double maxVariation{0.0};
    double minSpread{0.0};
    double maxSpread{0.0};
    SpreadDirection direction{SpreadDirection::Either};
};

inline constexpr std::int64_t kMinuteMs = 60'000;
inline constexpr std::int64_t kHourMs = 60 * kMinuteMs;
inline constexpr std::int64_t kDayMs = 24 * kHourMs;

inline constexpr std::array<Timeframe, 5> kAllTimeframes{
    Timeframe::OneHour, Timeframe::OneDay, Timeframe::OneWeek, Timeframe::OneMonth, Timeframe::OneYear};

const TimeframeConfig& timeframeConfig(Timeframe timeframe) noexcept;
std::string timeframeToString(Timeframe timeframe);
std::optional<Timeframe> timeframeFromString(std::string_view value);

}  // namespace domain
