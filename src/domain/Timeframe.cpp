#include "domain/Timeframe.hpp"

#include <cctype>

namespace domain {
namespace {

constexpr TimeframeConfig kOneHour{60, kMinuteMs, 0.002, 0.002, 0.006, SpreadDirection::Either};
constexpr TimeframeConfig kOneDay{24, kHourMs, 0.01, 0.02, 0.06, SpreadDirection::Either};
constexpr TimeframeConfig kOneWeek{168, kHourMs, 0.02, 0.05, 0.15, SpreadDirection::Either};
constexpr TimeframeConfig kOneMonth{30, kDayMs, 0.05, 0.15, 0.45, SpreadDirection::Either};
constexpr TimeframeConfig kOneYear{365, kDayMs, 0.15, 0.40, 0.50, SpreadDirection::Below};

static_assert(kOneHour.maxVariation < kOneDay.maxVariation && kOneDay.maxVariation < kOneWeek.maxVariation &&
                  kOneWeek.maxVariation < kOneMonth.maxVariation && kOneMonth.maxVariation < kOneYear.maxVariation,
              "per-step variation must widen with the window");
static_assert(kOneYear.maxSpread < 1.0, "start price must stay positive");

}  // namespace

const TimeframeConfig& timeframeConfig(Timeframe timeframe) noexcept {
    switch (timeframe) {
    case Timeframe::OneHour:
        return kOneHour;
    case Timeframe::OneWeek:
        return kOneWeek;
    case Timeframe::OneMonth:
        return kOneMonth;
    case Timeframe::OneYear:
        return kOneYear;
    case Timeframe::OneDay:
    default:
        break;
    }
    return kOneDay;
}

std::string timeframeToString(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::OneHour:
        return "1h";
    case Timeframe::OneDay:
        return "24h";
    case Timeframe::OneWeek:
        return "7d";
    case Timeframe::OneMonth:
        return "30d";
    case Timeframe::OneYear:
        return "1y";
    }
    return "";
}

std::optional<Timeframe> timeframeFromString(std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (normalized == "1h" || normalized == "60m") {
        return Timeframe::OneHour;
    }
    if (normalized == "24h" || normalized == "1d") {
        return Timeframe::OneDay;
    }
    if (normalized == "7d" || normalized == "1w") {
        return Timeframe::OneWeek;
    }
    if (normalized == "30d" || normalized == "1mo") {
        return Timeframe::OneMonth;
    }
    if (normalized == "1y" || normalized == "365d") {
        return Timeframe::OneYear;
    }
    return std::nullopt;
}

}  // namespace domain
