#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ups_sentinel::model {

enum class shutdown_outcome : std::uint8_t {
    PENDING = 0,
    SUCCESS = 1,
    FAILURE = 2,
    UNKNOWN = 3,
};

// One remote shutdown attempt sequence, created once per low-charge episode.
struct shutdown_event {
    std::int64_t id{0};
    std::string target_host{};
    std::int64_t triggered_at_ms{0};
    float charge_at_trigger{0.0F};
    shutdown_outcome outcome{shutdown_outcome::PENDING};
    std::uint32_t attempts{0};
    std::optional<std::int64_t> finalized_at_ms{};
    std::optional<std::int64_t> episode_ended_at_ms{};
};

// What the read path is allowed to see of shutdown activity.
struct shutdown_summary {
    std::optional<std::int64_t> last_triggered_at_ms{};
    std::optional<shutdown_outcome> last_outcome{};
    bool episode_active{false};
};

std::string_view to_string(shutdown_outcome outcome) noexcept;

} // namespace ups_sentinel::model
