#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace jobflow {

// Job and scheduled-workflow names are qualified by their owner with '_':
//   job "J1" in queue "Q"            -> "Q_J1"
//   firing of recurring template "W" -> "W_<timestamp>"
inline constexpr char kNameSeparator = '_';

// Names become single store path segments.
[[nodiscard]] inline auto is_valid_name(std::string_view name) noexcept
    -> bool {
  return !name.empty() && name.find('/') == std::string_view::npos;
}

[[nodiscard]] inline auto is_namespaced_by(std::string_view owner,
                                           std::string_view name) noexcept
    -> bool {
  return name.size() > owner.size() + 1 && name.starts_with(owner) &&
         name[owner.size()] == kNameSeparator;
}

[[nodiscard]] inline auto namespaced_job_name(std::string_view workflow,
                                              std::string_view job)
    -> std::string {
  return std::format("{}{}{}", workflow, kNameSeparator, job);
}

// Strips the "<workflow>_" prefix; names without it are returned unchanged.
[[nodiscard]] inline auto denamespaced_job_name(std::string_view workflow,
                                                std::string_view job)
    -> std::string {
  if (is_namespaced_by(workflow, job)) {
    return std::string{job.substr(workflow.size() + 1)};
  }
  return std::string{job};
}

[[nodiscard]] inline auto scheduled_workflow_name(std::string_view workflow,
                                                  std::string_view suffix)
    -> std::string {
  return std::format("{}{}{}", workflow, kNameSeparator, suffix);
}

[[nodiscard]] inline auto scheduled_workflow_name(
    std::string_view workflow, std::chrono::system_clock::time_point at)
    -> std::string {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                at.time_since_epoch())
                .count();
  return scheduled_workflow_name(workflow, std::to_string(ms));
}

[[nodiscard]] inline auto now_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace jobflow
