#include "jobflow/model/job_context.hpp"

#include "jobflow/util/log.hpp"

#include <algorithm>
#include <charconv>

namespace jobflow {

namespace {

constexpr std::string_view kStartTime = "START_TIME";
constexpr std::string_view kFinishTime = "FINISH_TIME";
constexpr std::string_view kState = "STATE";
constexpr std::string_view kParticipant = "ASSIGNED_PARTICIPANT";
constexpr std::string_view kNumAttempts = "NUM_ATTEMPTS";
constexpr std::string_view kTaskId = "TASK_ID";

auto parse_int(std::string_view text) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

auto JobContext::partition(int p) const -> const PartitionContext* {
  auto it = partitions.find(p);
  return it != partitions.end() ? &it->second : nullptr;
}

auto JobContext::count_in_state(TaskState state) const -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count_if(
      partitions, [state](const auto& entry) {
        return entry.second.state == state;
      }));
}

auto JobContext::to_record() const -> Record {
  Record r{job};
  r.set_simple_int(kStartTime, start_time);
  r.set_simple_int(kFinishTime, finish_time);
  for (const auto& [p, ctx] : partitions) {
    Record::MapField m;
    if (ctx.state) {
      m.emplace(kState, task_state_name(*ctx.state));
    }
    if (!ctx.assigned_participant.empty()) {
      m.emplace(kParticipant, ctx.assigned_participant);
    }
    m.emplace(kNumAttempts, std::to_string(ctx.num_attempts));
    if (!ctx.task_id.empty()) {
      m.emplace(kTaskId, ctx.task_id);
    }
    r.set_map(std::to_string(p), std::move(m));
  }
  return r;
}

auto JobContext::from_record(const Record& r) -> Result<JobContext> {
  JobContext ctx;
  ctx.job = r.id;
  ctx.start_time = r.simple_int(kStartTime).value_or(kUnfinished);
  ctx.finish_time = r.simple_int(kFinishTime).value_or(kUnfinished);
  for (const auto& [key, m] : r.map_fields) {
    auto p = parse_int(key);
    if (!p) {
      log::warn("Context of job {} has non-numeric partition {}", r.id, key);
      continue;
    }
    PartitionContext pc;
    if (auto it = m.find(kState); it != m.end()) {
      pc.state = parse_task_state(it->second);
    }
    if (auto it = m.find(kParticipant); it != m.end()) {
      pc.assigned_participant = it->second;
    }
    if (auto it = m.find(kNumAttempts); it != m.end()) {
      pc.num_attempts = parse_int(it->second).value_or(0);
    }
    if (auto it = m.find(kTaskId); it != m.end()) {
      pc.task_id = it->second;
    }
    ctx.partitions.emplace(*p, std::move(pc));
  }
  return ok(std::move(ctx));
}

}  // namespace jobflow
