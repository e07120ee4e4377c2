#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/model/task_state.hpp"
#include "jobflow/model/workflow_context.hpp"
#include "jobflow/store/record.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace jobflow {

struct PartitionContext {
  std::optional<TaskState> state;
  std::string assigned_participant;
  int num_attempts{0};
  std::string task_id;

  [[nodiscard]] friend auto operator==(const PartitionContext&,
                                       const PartitionContext&)
      -> bool = default;
};

// Runtime state of one job, keyed by partition number.
struct JobContext {
  std::string job;
  std::int64_t start_time{kUnfinished};
  std::int64_t finish_time{kUnfinished};
  std::map<int, PartitionContext> partitions;

  [[nodiscard]] auto partition(int p) const -> const PartitionContext*;

  // Number of partitions currently in `state`.
  [[nodiscard]] auto count_in_state(TaskState state) const -> std::size_t;

  [[nodiscard]] auto to_record() const -> Record;
  [[nodiscard]] static auto from_record(const Record& record)
      -> Result<JobContext>;

  [[nodiscard]] friend auto operator==(const JobContext&, const JobContext&)
      -> bool = default;
};

}  // namespace jobflow
