#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ups_sentinel::model {

enum class ups_status : std::uint8_t {
    ON_LINE = 0,
    ON_BATTERY = 1,
    OVERLOADED = 2,
    UNKNOWN = 3,
};

// One UPS reading. Immutable once appended to the store.
struct ups_sample {
    std::int64_t timestamp_ms{0};
    ups_status status{ups_status::UNKNOWN};
    float charge_pct{0.0F};
    float load_pct{0.0F};
    // Only present while on battery.
    std::optional<std::int64_t> runtime_estimate_s{};

    bool operator==(const ups_sample&) const = default;
};

struct poll_failure {
    enum class kind : std::uint8_t {
        UNREACHABLE = 0,
        TIMEOUT = 1,
        MALFORMED = 2,
    };

    kind reason{kind::UNREACHABLE};
    std::string detail{};
};

using poll_result = std::variant<ups_sample, poll_failure>;

// Service observed running: the UPS answered with a known power source.
inline constexpr bool is_alive(const ups_status status) noexcept {
    return status == ups_status::ON_LINE || status == ups_status::ON_BATTERY || status == ups_status::OVERLOADED;
}

inline constexpr bool is_on_wall_power(const ups_status status) noexcept {
    return status == ups_status::ON_LINE || status == ups_status::OVERLOADED;
}

std::string_view to_string(ups_status status) noexcept;
std::string_view to_string(poll_failure::kind reason) noexcept;

} // namespace ups_sentinel::model
