#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/model/task_state.hpp"
#include "jobflow/store/record.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

// Finish-time value of a workflow or job that has not finished yet.
inline constexpr std::int64_t kUnfinished = -1;

// Runtime state of a workflow. Written by the rebalance subsystem; the driver
// only reads it, apart from stripping job-state entries of removed jobs.
struct WorkflowContext {
  std::string workflow;
  std::optional<TaskState> workflow_state;
  // Namespaced job name -> state.
  std::map<std::string, TaskState, std::less<>> job_states;
  std::int64_t start_time{kUnfinished};
  std::int64_t finish_time{kUnfinished};
  // Recurring templates only.
  std::optional<std::string> last_scheduled_workflow;
  std::vector<std::string> scheduled_workflows;

  [[nodiscard]] auto is_finished() const noexcept -> bool {
    return finish_time != kUnfinished;
  }

  [[nodiscard]] auto job_state(std::string_view job) const
      -> std::optional<TaskState>;

  [[nodiscard]] auto to_record() const -> Record;
  [[nodiscard]] static auto from_record(const Record& record)
      -> Result<WorkflowContext>;

  [[nodiscard]] friend auto operator==(const WorkflowContext&,
                                       const WorkflowContext&)
      -> bool = default;
};

// A context record without FINISH_TIME counts as unfinished.
[[nodiscard]] auto record_finish_time(const Record& record) -> std::int64_t;

// Removes `jobs` from the JOB_STATES map of a context record. Returns false
// when nothing was there to remove.
auto strip_record_job_states(Record& record,
                             const std::vector<std::string>& jobs) -> bool;

}  // namespace jobflow
