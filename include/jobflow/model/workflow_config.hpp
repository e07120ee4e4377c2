#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/dag/job_dag.hpp"
#include "jobflow/model/task_state.hpp"
#include "jobflow/store/record.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

enum class RecurrenceUnit : std::uint8_t {
  Milliseconds,
  Seconds,
  Minutes,
  Hours,
  Days,
};

[[nodiscard]] auto recurrence_unit_name(RecurrenceUnit unit) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_recurrence_unit(std::string_view name) noexcept
    -> std::optional<RecurrenceUnit>;

// When a workflow first runs and, for a recurring template, how often it fires.
struct ScheduleConfig {
  std::int64_t start_time_ms{0};
  std::optional<RecurrenceUnit> recurrence_unit;
  std::int64_t recurrence_interval{0};

  [[nodiscard]] static auto one_time(std::int64_t start_time_ms)
      -> ScheduleConfig {
    return ScheduleConfig{start_time_ms, std::nullopt, 0};
  }
  [[nodiscard]] static auto recurring(std::int64_t start_time_ms,
                                      RecurrenceUnit unit,
                                      std::int64_t interval) -> ScheduleConfig {
    return ScheduleConfig{start_time_ms, unit, interval};
  }

  [[nodiscard]] auto is_recurring() const noexcept -> bool {
    return recurrence_unit.has_value() && recurrence_interval > 0;
  }
  [[nodiscard]] auto period() const -> std::optional<std::chrono::milliseconds>;

  [[nodiscard]] friend auto operator==(const ScheduleConfig&,
                                       const ScheduleConfig&) -> bool = default;
};

struct WorkflowConfig {
  static constexpr std::chrono::milliseconds kDefaultExpiry{
      std::chrono::hours{24}};

  std::string workflow_id;
  JobDag dag;
  // Namespaced job name -> job type.
  std::map<std::string, std::string, std::less<>> job_types;
  TargetState target_state{TargetState::Start};
  std::optional<ScheduleConfig> schedule;
  // Maximum number of jobs in a queue's DAG; 0 = unbounded.
  int capacity{0};
  // false: long-lived job queue whose config and DAG keep changing.
  bool terminable{true};
  int parallel_jobs{1};
  std::chrono::milliseconds expiry{kDefaultExpiry};
  int failure_threshold{0};

  [[nodiscard]] auto is_recurring() const noexcept -> bool {
    return schedule && schedule->is_recurring();
  }

  [[nodiscard]] auto validate() const -> Result<void>;

  [[nodiscard]] auto to_record() const -> Record;
  [[nodiscard]] static auto from_record(const Record& record)
      -> Result<WorkflowConfig>;

  [[nodiscard]] friend auto operator==(const WorkflowConfig&,
                                       const WorkflowConfig&) -> bool = default;
};

// In-place accessors for the stored workflow config record, used by atomic
// updaters that must preserve every field they do not own.

// True when the record is a workflow config rather than a job config.
[[nodiscard]] auto is_workflow_record(const Record& record) -> bool;

// An absent Dag field reads as an empty DAG.
[[nodiscard]] auto record_dag(const Record& record) -> Result<JobDag>;
auto set_record_dag(Record& record, const JobDag& dag) -> void;

[[nodiscard]] auto record_job_types(Record& record) -> Record::MapField&;
auto erase_record_job_types(Record& record,
                            const std::vector<std::string>& jobs) -> void;

[[nodiscard]] auto record_target_state(const Record& record)
    -> std::optional<TargetState>;
auto set_record_target_state(Record& record, TargetState state) -> void;

}  // namespace jobflow
