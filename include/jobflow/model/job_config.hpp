#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/store/record.hpp"

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

// One task of a job that is not bound to a target resource's partitions.
struct TaskConfig {
  std::string id;
  std::string command;
  std::string target_partition;
  std::map<std::string, std::string, std::less<>> config;

  [[nodiscard]] friend auto operator==(const TaskConfig&, const TaskConfig&)
      -> bool = default;
};

// Immutable definition of a job. `job_id` is the namespaced name and is
// filled in when the job is attached to a workflow.
struct JobConfig {
  static constexpr std::chrono::milliseconds kDefaultTimeoutPerTask{
      std::chrono::hours{1}};
  static constexpr int kDefaultMaxAttemptsPerTask = 10;
  static constexpr int kDefaultMaxConcurrentTasksPerInstance = 1;

  std::string workflow;
  std::string job_id;
  std::string command;
  std::string job_type;
  std::string target_resource;
  std::vector<std::string> target_partition_states;
  std::vector<std::string> target_partitions;
  std::map<std::string, std::string, std::less<>> command_config;
  std::vector<TaskConfig> task_configs;

  std::chrono::milliseconds timeout_per_task{kDefaultTimeoutPerTask};
  int max_attempts_per_task{kDefaultMaxAttemptsPerTask};
  int failure_threshold{0};
  int max_concurrent_tasks_per_instance{kDefaultMaxConcurrentTasksPerInstance};
  bool ignore_dependent_job_failure{false};

  [[nodiscard]] auto has_job_type() const noexcept -> bool {
    return !job_type.empty();
  }

  [[nodiscard]] auto find_task(std::string_view task_id) const
      -> const TaskConfig*;

  [[nodiscard]] auto validate() const -> Result<void>;

  [[nodiscard]] auto to_record() const -> Record;
  [[nodiscard]] static auto from_record(const Record& record)
      -> Result<JobConfig>;

  [[nodiscard]] friend auto operator==(const JobConfig&, const JobConfig&)
      -> bool = default;
};

}  // namespace jobflow
