#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ups_sentinel::model {

enum class window : std::uint8_t {
    ONE_MINUTE = 0,
    ONE_HOUR = 1,
    ONE_DAY = 2,
    SEVEN_DAYS = 3,
    THIRTY_DAYS = 4,
};

inline constexpr std::array<window, 5> kAllWindows = {
    window::ONE_MINUTE, window::ONE_HOUR, window::ONE_DAY, window::SEVEN_DAYS, window::THIRTY_DAYS,
};

inline constexpr std::int64_t kMinuteMs = 60LL * 1000LL;
inline constexpr std::int64_t kHourMs = 60LL * kMinuteMs;
inline constexpr std::int64_t kDayMs = 24LL * kHourMs;

inline constexpr std::int64_t window_length_ms(const window w) noexcept {
    switch (w) {
        case window::ONE_MINUTE:
            return kMinuteMs;
        case window::ONE_HOUR:
            return kHourMs;
        case window::ONE_DAY:
            return kDayMs;
        case window::SEVEN_DAYS:
            return 7LL * kDayMs;
        case window::THIRTY_DAYS:
            return 30LL * kDayMs;
    }
    return 0;
}

inline constexpr std::int64_t kLongestWindowMs = window_length_ms(window::THIRTY_DAYS);

std::string_view to_string(window w) noexcept;

// Derived from sample history; never the source of truth.
// Absent optionals mean "not enough data", never zero.
struct aggregate {
    window span{window::ONE_MINUTE};
    std::optional<double> avg_load_pct{};
    std::optional<double> system_uptime_pct{};
    std::optional<double> wall_power_uptime_pct{};
    std::size_t sample_count{0};
    std::int64_t observed_ms{0};
};

} // namespace ups_sentinel::model
