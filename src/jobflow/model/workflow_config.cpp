#include "jobflow/model/workflow_config.hpp"

#include "jobflow/util/id.hpp"
#include "jobflow/util/log.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <utility>

namespace jobflow {

namespace {

constexpr std::string_view kWorkflowId = "WorkflowID";
constexpr std::string_view kDag = "Dag";
constexpr std::string_view kJobTypes = "JobTypes";
constexpr std::string_view kTargetState = "TargetState";
constexpr std::string_view kParallelJobs = "ParallelJobs";
constexpr std::string_view kExpiry = "Expiry";
constexpr std::string_view kFailureThreshold = "FailureThreshold";
constexpr std::string_view kTerminable = "Terminable";
constexpr std::string_view kCapacity = "Capacity";
constexpr std::string_view kStartTime = "StartTime";
constexpr std::string_view kRecurrenceUnit = "RecurrenceUnit";
constexpr std::string_view kRecurrenceInterval = "RecurrenceInterval";

constexpr std::array<std::string_view, 5> kUnitNames = {
    "MILLISECONDS", "SECONDS", "MINUTES", "HOURS", "DAYS",
};

}  // namespace

auto recurrence_unit_name(RecurrenceUnit unit) noexcept -> std::string_view {
  auto idx = std::to_underlying(unit);
  return idx < kUnitNames.size() ? kUnitNames[idx] : "UNKNOWN";
}

auto parse_recurrence_unit(std::string_view name) noexcept
    -> std::optional<RecurrenceUnit> {
  auto it = std::ranges::find(kUnitNames, name);
  if (it == kUnitNames.end()) {
    return std::nullopt;
  }
  return static_cast<RecurrenceUnit>(
      std::ranges::distance(kUnitNames.begin(), it));
}

auto ScheduleConfig::period() const
    -> std::optional<std::chrono::milliseconds> {
  if (!is_recurring()) {
    return std::nullopt;
  }
  using namespace std::chrono;
  switch (*recurrence_unit) {
    case RecurrenceUnit::Milliseconds:
      return milliseconds{recurrence_interval};
    case RecurrenceUnit::Seconds:
      return duration_cast<milliseconds>(seconds{recurrence_interval});
    case RecurrenceUnit::Minutes:
      return duration_cast<milliseconds>(minutes{recurrence_interval});
    case RecurrenceUnit::Hours:
      return duration_cast<milliseconds>(hours{recurrence_interval});
    case RecurrenceUnit::Days:
      return duration_cast<milliseconds>(hours{24 * recurrence_interval});
  }
  return std::nullopt;
}

auto WorkflowConfig::validate() const -> Result<void> {
  if (!is_valid_name(workflow_id)) {
    log::warn("Invalid workflow name '{}'", workflow_id);
    return fail(Error::InvalidArgument);
  }
  for (const auto& node : dag.all_nodes()) {
    if (!is_valid_name(node)) {
      log::warn("Workflow {} has invalid job name '{}'", workflow_id, node);
      return fail(Error::InvalidArgument);
    }
  }
  if (capacity < 0 || parallel_jobs < 1 || failure_threshold < 0 ||
      expiry.count() < 0) {
    log::warn("Workflow {} has out-of-range limits", workflow_id);
    return fail(Error::InvalidArgument);
  }
  if (schedule && schedule->recurrence_unit &&
      schedule->recurrence_interval <= 0) {
    log::warn("Workflow {} recurs every {} {}", workflow_id,
              schedule->recurrence_interval,
              recurrence_unit_name(*schedule->recurrence_unit));
    return fail(Error::InvalidArgument);
  }
  if (capacity > 0 && std::cmp_greater(dag.size(), capacity)) {
    log::warn("Workflow {} holds {} jobs, capacity is {}", workflow_id,
              dag.size(), capacity);
    return fail(Error::InvalidArgument);
  }
  return dag.validate();
}

auto WorkflowConfig::to_record() const -> Record {
  Record r{workflow_id};
  r.set_simple(kWorkflowId, workflow_id);
  set_record_dag(r, dag);
  set_record_target_state(r, target_state);
  r.set_simple_int(kParallelJobs, parallel_jobs);
  r.set_simple_int(kExpiry, expiry.count());
  r.set_simple_int(kFailureThreshold, failure_threshold);
  r.set_simple_bool(kTerminable, terminable);
  r.set_simple_int(kCapacity, capacity);
  if (schedule) {
    r.set_simple_int(kStartTime, schedule->start_time_ms);
    if (schedule->recurrence_unit) {
      r.set_simple(kRecurrenceUnit,
                   std::string(recurrence_unit_name(*schedule->recurrence_unit)));
      r.set_simple_int(kRecurrenceInterval, schedule->recurrence_interval);
    }
  }
  if (!job_types.empty()) {
    r.set_map(kJobTypes, Record::MapField(job_types.begin(), job_types.end()));
  }
  return r;
}

auto WorkflowConfig::from_record(const Record& r) -> Result<WorkflowConfig> {
  if (!is_workflow_record(r)) {
    log::error("Record {} is not a workflow config", r.id);
    return fail(Error::ParseError);
  }
  auto dag = record_dag(r);
  if (!dag) {
    return fail(dag.error());
  }

  WorkflowConfig cfg;
  cfg.workflow_id = r.simple(kWorkflowId).value_or(r.id);
  cfg.dag = std::move(*dag);
  if (auto state = r.simple(kTargetState)) {
    auto parsed = parse_target_state(*state);
    if (!parsed) {
      log::error("Workflow {} has unknown target state {}", r.id, *state);
      return fail(Error::ParseError);
    }
    cfg.target_state = *parsed;
  }
  cfg.parallel_jobs =
      static_cast<int>(r.simple_int(kParallelJobs).value_or(1));
  cfg.expiry = std::chrono::milliseconds(
      r.simple_int(kExpiry).value_or(kDefaultExpiry.count()));
  cfg.failure_threshold =
      static_cast<int>(r.simple_int(kFailureThreshold).value_or(0));
  cfg.terminable = r.simple_bool(kTerminable).value_or(true);
  cfg.capacity = static_cast<int>(r.simple_int(kCapacity).value_or(0));

  if (auto start = r.simple_int(kStartTime)) {
    ScheduleConfig schedule = ScheduleConfig::one_time(*start);
    if (auto unit = r.simple(kRecurrenceUnit)) {
      schedule.recurrence_unit = parse_recurrence_unit(*unit);
      if (!schedule.recurrence_unit) {
        log::error("Workflow {} has unknown recurrence unit {}", r.id, *unit);
        return fail(Error::ParseError);
      }
      schedule.recurrence_interval =
          r.simple_int(kRecurrenceInterval).value_or(0);
    }
    cfg.schedule = schedule;
  }
  if (const auto* types = r.map(kJobTypes)) {
    cfg.job_types.insert(types->begin(), types->end());
  }
  return ok(std::move(cfg));
}

auto is_workflow_record(const Record& record) -> bool {
  return record.simple_fields.contains(kDag);
}

auto record_dag(const Record& record) -> Result<JobDag> {
  auto text = record.simple(kDag);
  if (!text) {
    return ok(JobDag{});
  }
  return JobDag::from_json(*text);
}

auto set_record_dag(Record& record, const JobDag& dag) -> void {
  record.set_simple(kDag, dag.to_json());
}

auto record_job_types(Record& record) -> Record::MapField& {
  return record.mutable_map(kJobTypes);
}

auto erase_record_job_types(Record& record,
                            const std::vector<std::string>& jobs) -> void {
  auto it = record.map_fields.find(kJobTypes);
  if (it == record.map_fields.end()) {
    return;
  }
  for (const auto& job : jobs) {
    it->second.erase(job);
  }
}

auto record_target_state(const Record& record) -> std::optional<TargetState> {
  auto state = record.simple(kTargetState);
  if (!state) {
    return std::nullopt;
  }
  return parse_target_state(*state);
}

auto set_record_target_state(Record& record, TargetState state) -> void {
  record.set_simple(kTargetState, std::string(target_state_name(state)));
}

}  // namespace jobflow
