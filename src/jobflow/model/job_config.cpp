#include "jobflow/model/job_config.hpp"

#include "jobflow/util/log.hpp"

#include <algorithm>

namespace jobflow {

namespace field {
constexpr std::string_view kWorkflowId = "WorkflowID";
constexpr std::string_view kJobId = "JobID";
constexpr std::string_view kCommand = "Command";
constexpr std::string_view kJobType = "JobType";
constexpr std::string_view kTargetResource = "TargetResource";
constexpr std::string_view kTargetPartitionStates = "TargetPartitionStates";
constexpr std::string_view kTargetPartitions = "TargetPartitions";
constexpr std::string_view kJobCommandConfig = "JobCommandConfig";
constexpr std::string_view kTimeoutPerTask = "TimeoutPerPartition";
constexpr std::string_view kMaxAttemptsPerTask = "MaxAttemptsPerTask";
constexpr std::string_view kFailureThreshold = "FailureThreshold";
constexpr std::string_view kConcurrentTasks = "ConcurrentTasksPerInstance";
constexpr std::string_view kIgnoreDependentJobFailure =
    "IgnoreDependentJobFailure";

constexpr std::string_view kTaskId = "TASK_ID";
constexpr std::string_view kTaskCommand = "TASK_COMMAND";
constexpr std::string_view kTaskTargetPartition = "TASK_TARGET_PARTITION";
}  // namespace field

auto JobConfig::find_task(std::string_view task_id) const -> const TaskConfig* {
  auto it = std::ranges::find(task_configs, task_id, &TaskConfig::id);
  return it != task_configs.end() ? &*it : nullptr;
}

auto JobConfig::validate() const -> Result<void> {
  if (workflow.empty()) {
    log::warn("Job {} does not belong to a workflow", job_id);
    return fail(Error::InvalidArgument);
  }
  if (task_configs.empty()) {
    if (target_resource.empty()) {
      log::warn("Job {} has neither a target resource nor task configs",
                job_id);
      return fail(Error::InvalidArgument);
    }
    if (command.empty()) {
      log::warn("Job {} targets {} without a command", job_id,
                target_resource);
      return fail(Error::InvalidArgument);
    }
  }
  for (const auto& task : task_configs) {
    if (task.id.empty()) {
      log::warn("Job {} has a task config without an id", job_id);
      return fail(Error::InvalidArgument);
    }
  }
  if (timeout_per_task.count() < 0 || max_attempts_per_task < 1 ||
      failure_threshold < 0 || max_concurrent_tasks_per_instance < 1) {
    log::warn("Job {} has out-of-range limits", job_id);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto JobConfig::to_record() const -> Record {
  Record r{job_id};
  r.set_simple(field::kWorkflowId, workflow);
  r.set_simple(field::kJobId, job_id);
  if (!command.empty()) {
    r.set_simple(field::kCommand, command);
  }
  if (!job_type.empty()) {
    r.set_simple(field::kJobType, job_type);
  }
  if (!target_resource.empty()) {
    r.set_simple(field::kTargetResource, target_resource);
  }
  if (!target_partition_states.empty()) {
    r.set_list(field::kTargetPartitionStates, target_partition_states);
  }
  if (!target_partitions.empty()) {
    r.set_list(field::kTargetPartitions, target_partitions);
  }
  if (!command_config.empty()) {
    r.set_map(field::kJobCommandConfig,
              Record::MapField(command_config.begin(), command_config.end()));
  }
  r.set_simple_int(field::kTimeoutPerTask, timeout_per_task.count());
  r.set_simple_int(field::kMaxAttemptsPerTask, max_attempts_per_task);
  r.set_simple_int(field::kFailureThreshold, failure_threshold);
  r.set_simple_int(field::kConcurrentTasks, max_concurrent_tasks_per_instance);
  r.set_simple_bool(field::kIgnoreDependentJobFailure,
                    ignore_dependent_job_failure);

  for (const auto& task : task_configs) {
    Record::MapField m(task.config.begin(), task.config.end());
    m.insert_or_assign(std::string(field::kTaskId), task.id);
    if (!task.command.empty()) {
      m.insert_or_assign(std::string(field::kTaskCommand), task.command);
    }
    if (!task.target_partition.empty()) {
      m.insert_or_assign(std::string(field::kTaskTargetPartition),
                         task.target_partition);
    }
    r.set_map(task.id, std::move(m));
  }
  return r;
}

auto JobConfig::from_record(const Record& r) -> Result<JobConfig> {
  auto workflow = r.simple(field::kWorkflowId);
  if (!workflow) {
    log::error("Record {} is not a job config", r.id);
    return fail(Error::ParseError);
  }

  JobConfig cfg;
  cfg.workflow = std::move(*workflow);
  cfg.job_id = r.simple(field::kJobId).value_or(r.id);
  cfg.command = r.simple(field::kCommand).value_or("");
  cfg.job_type = r.simple(field::kJobType).value_or("");
  cfg.target_resource = r.simple(field::kTargetResource).value_or("");
  if (const auto* states = r.list(field::kTargetPartitionStates)) {
    cfg.target_partition_states = *states;
  }
  if (const auto* partitions = r.list(field::kTargetPartitions)) {
    cfg.target_partitions = *partitions;
  }
  if (const auto* m = r.map(field::kJobCommandConfig)) {
    cfg.command_config.insert(m->begin(), m->end());
  }
  cfg.timeout_per_task = std::chrono::milliseconds(
      r.simple_int(field::kTimeoutPerTask)
          .value_or(kDefaultTimeoutPerTask.count()));
  cfg.max_attempts_per_task = static_cast<int>(
      r.simple_int(field::kMaxAttemptsPerTask)
          .value_or(kDefaultMaxAttemptsPerTask));
  cfg.failure_threshold =
      static_cast<int>(r.simple_int(field::kFailureThreshold).value_or(0));
  cfg.max_concurrent_tasks_per_instance = static_cast<int>(
      r.simple_int(field::kConcurrentTasks)
          .value_or(kDefaultMaxConcurrentTasksPerInstance));
  cfg.ignore_dependent_job_failure =
      r.simple_bool(field::kIgnoreDependentJobFailure).value_or(false);

  for (const auto& [key, m] : r.map_fields) {
    if (key == field::kJobCommandConfig) {
      continue;
    }
    auto id = m.find(field::kTaskId);
    if (id == m.end()) {
      continue;
    }
    TaskConfig task;
    task.id = id->second;
    for (const auto& [k, v] : m) {
      if (k == field::kTaskId) {
        continue;
      }
      if (k == field::kTaskCommand) {
        task.command = v;
      } else if (k == field::kTaskTargetPartition) {
        task.target_partition = v;
      } else {
        task.config.emplace(k, v);
      }
    }
    cfg.task_configs.push_back(std::move(task));
  }
  return ok(std::move(cfg));
}

}  // namespace jobflow
