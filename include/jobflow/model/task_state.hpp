#pragma once

#include <array>
#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace jobflow {

// Lifecycle state of a workflow or job, written by the rebalance subsystem.
enum class TaskState : std::uint8_t {
  NotStarted,
  InProgress,
  Stopped,
  Completed,
  Failed,
  Aborted,
};

// Command layered on a workflow config; observed by the rebalance subsystem.
enum class TargetState : std::uint8_t {
  Start,
  Stop,
  Delete,
};

namespace detail {

constexpr std::array<std::string_view, 6> kTaskStateNames = {
    "NOT_STARTED", "IN_PROGRESS", "STOPPED", "COMPLETED", "FAILED", "ABORTED",
};

constexpr std::array<std::string_view, 3> kTargetStateNames = {
    "START",
    "STOP",
    "DELETE",
};

}  // namespace detail

[[nodiscard]] constexpr auto is_terminal(TaskState state) noexcept -> bool {
  return state == TaskState::Completed || state == TaskState::Failed ||
         state == TaskState::Aborted;
}

[[nodiscard]] inline auto task_state_name(TaskState state) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(state);
  return idx < detail::kTaskStateNames.size() ? detail::kTaskStateNames[idx]
                                              : "UNKNOWN";
}

[[nodiscard]] inline auto parse_task_state(std::string_view name) noexcept
    -> std::optional<TaskState> {
  auto it = std::ranges::find(detail::kTaskStateNames, name);
  if (it == detail::kTaskStateNames.end()) {
    return std::nullopt;
  }
  return static_cast<TaskState>(
      std::ranges::distance(detail::kTaskStateNames.begin(), it));
}

[[nodiscard]] inline auto target_state_name(TargetState state) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(state);
  return idx < detail::kTargetStateNames.size()
             ? detail::kTargetStateNames[idx]
             : "UNKNOWN";
}

[[nodiscard]] inline auto parse_target_state(std::string_view name) noexcept
    -> std::optional<TargetState> {
  auto it = std::ranges::find(detail::kTargetStateNames, name);
  if (it == detail::kTargetStateNames.end()) {
    return std::nullopt;
  }
  return static_cast<TargetState>(
      std::ranges::distance(detail::kTargetStateNames.begin(), it));
}

}  // namespace jobflow

template <>
struct std::formatter<jobflow::TaskState> : std::formatter<std::string_view> {
  auto format(jobflow::TaskState state, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        jobflow::task_state_name(state), ctx);
  }
};

template <>
struct std::formatter<jobflow::TargetState> : std::formatter<std::string_view> {
  auto format(jobflow::TargetState state, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        jobflow::target_state_name(state), ctx);
  }
};
