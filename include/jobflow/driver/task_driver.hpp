#pragma once

#include "jobflow/admin/cluster_admin.hpp"
#include "jobflow/config/system_config.hpp"
#include "jobflow/core/cancellation.hpp"
#include "jobflow/core/error.hpp"
#include "jobflow/model/job_config.hpp"
#include "jobflow/model/job_context.hpp"
#include "jobflow/model/task_state.hpp"
#include "jobflow/model/workflow.hpp"
#include "jobflow/model/workflow_config.hpp"
#include "jobflow/model/workflow_context.hpp"
#include "jobflow/rebalance/rebalance_trigger.hpp"
#include "jobflow/store/key_builder.hpp"
#include "jobflow/store/metadata_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

// Client-side facade for defining workflows and job queues and steering their
// lifecycle. Holds no state of its own besides its collaborators: every
// mutation is a read-modify-write of a store record through
// update_with_retry, so any number of drivers, in any number of processes,
// may operate on the same cluster at once.
//
// Workflow and job contexts belong to the rebalance subsystem. The driver
// reads them to decide whether an operation is legal and to poll, and only
// ever removes job-state entries of jobs it removed.
class TaskDriver {
public:
  using WorkflowConfigs = std::map<std::string, WorkflowConfig, std::less<>>;

  TaskDriver(MetadataStore& store, ClusterAdmin& admin,
             RebalanceTrigger& rebalance, DriverConfig config = {});

  [[nodiscard]] auto config() const noexcept -> const DriverConfig& {
    return config_;
  }
  [[nodiscard]] auto keys() const noexcept -> const KeyBuilder& {
    return keys_;
  }

  // Writes the job configs, then the workflow config, then lays out the
  // workflow resource. Error::AlreadyExists when a workflow of that name
  // exists; nothing is written in that case, and a call losing a concurrent
  // start of the same name leaves the winner's job configs as written.
  [[nodiscard]] auto start(const Workflow& workflow) -> Result<void>;

  // start() for a non-terminable workflow.
  [[nodiscard]] auto create_queue(const Workflow& queue) -> Result<void>;

  // Replaces the config of a job queue, DAG included, so `config` is
  // normally a modified copy of get_workflow_config(). Terminable workflows
  // are immutable (Error::IllegalState).
  [[nodiscard]] auto update_workflow(std::string_view workflow,
                                     WorkflowConfig config) -> Result<void>;

  // Appends `job` to the end of the queue's chain. The job config is written
  // before the DAG so a reader that sees the node can read its config, and
  // is never replaced by a call that fails on the same job name.
  [[nodiscard]] auto enqueue_job(std::string_view queue, std::string_view job,
                                 JobConfig config) -> Result<void>;

  // Removes a job from a queue that is not running. For a recurring queue the
  // job is removed from the last scheduled instance and from the template.
  [[nodiscard]] auto delete_job(std::string_view queue, std::string_view job)
      -> Result<void>;

  // Removes every job of the queue. The caller stops the queue first.
  [[nodiscard]] auto flush_queue(std::string_view queue) -> Result<void>;

  // Removes every job of the queue that reached a terminal state.
  [[nodiscard]] auto cleanup_job_queue(std::string_view queue) -> Result<void>;

  // Target-state changes. Each applies to the workflow and to every
  // workflow named "<workflow>_..." (the scheduled instances of a recurring
  // template); finished workflows keep their target state.
  [[nodiscard]] auto resume(std::string_view workflow) -> Result<void>;
  [[nodiscard]] auto stop(std::string_view workflow) -> Result<void>;
  // Also marks the finished scheduled instances recorded in the template's
  // context; unfinished ones are left to run out.
  [[nodiscard]] auto delete_workflow(std::string_view workflow)
      -> Result<void>;

  // stop(), then waits for the workflow to report STOPPED.
  [[nodiscard]] auto wait_to_stop(std::string_view workflow,
                                  std::chrono::milliseconds timeout,
                                  const CancellationToken& token = {})
      -> Result<void>;

  [[nodiscard]] auto get_workflow_config(std::string_view workflow)
      -> Result<WorkflowConfig>;
  [[nodiscard]] auto get_workflow_context(std::string_view workflow)
      -> Result<WorkflowContext>;
  // `job` is the namespaced job name.
  [[nodiscard]] auto get_job_config(std::string_view job) -> Result<JobConfig>;
  [[nodiscard]] auto get_job_context(std::string_view job)
      -> Result<JobContext>;
  [[nodiscard]] auto get_workflows() -> Result<WorkflowConfigs>;

  // Blocks until the workflow state is one of `states`. Error::Timeout when
  // it is not by the deadline or the workflow has no context by then.
  [[nodiscard]] auto poll_for_workflow_state(
      std::string_view workflow, std::initializer_list<TaskState> states,
      std::chrono::milliseconds timeout, const CancellationToken& token = {})
      -> Result<TaskState>;
  [[nodiscard]] auto poll_for_workflow_state(
      std::string_view workflow, std::initializer_list<TaskState> states)
      -> Result<TaskState>;

  // `job` is namespaced by `workflow`. For a recurring workflow the driver
  // first waits for a scheduled instance, then polls the same job in it.
  [[nodiscard]] auto poll_for_job_state(std::string_view workflow,
                                        std::string_view job,
                                        std::initializer_list<TaskState> states,
                                        std::chrono::milliseconds timeout,
                                        const CancellationToken& token = {})
      -> Result<TaskState>;
  [[nodiscard]] auto poll_for_job_state(std::string_view workflow,
                                        std::string_view job,
                                        std::initializer_list<TaskState> states)
      -> Result<TaskState>;

private:
  using NameSet = std::set<std::string, std::less<>>;

  [[nodiscard]] auto read_workflow_config(std::string_view workflow)
      -> Result<std::optional<WorkflowConfig>>;
  [[nodiscard]] auto read_workflow_context(std::string_view workflow)
      -> Result<std::optional<WorkflowContext>>;

  [[nodiscard]] auto add_workflow_resource(std::string_view workflow)
      -> Result<void>;
  [[nodiscard]] auto add_workflow_resource_if_missing(std::string_view workflow)
      -> Result<void>;

  // Writes the config of a job about to be committed to its owner (a DAG
  // node, or the workflow config for start). A config no commit refers to is
  // taken over at the version read, after `committed` reported false.
  // Returns the version written; `taken` when a commit already owns the job.
  [[nodiscard]] auto claim_job_config(std::string_view job, const Record& record,
                                      const std::function<Result<bool>()>& committed,
                                      Error taken) -> Result<std::int64_t>;
  // Rewrites the config after the commit, so a claim still holding an older
  // version can no longer land.
  [[nodiscard]] auto settle_job_config(std::string_view job,
                                       const Record& record) -> Result<void>;

  [[nodiscard]] auto delete_job_from_scheduled_queue(std::string_view queue,
                                                     std::string_view job,
                                                     bool recurrent)
      -> Result<void>;
  // `dag` is the queue's DAG as read by the caller.
  [[nodiscard]] auto remove_job(std::string_view queue, std::string_view job,
                                const JobDag& dag) -> Result<void>;
  [[nodiscard]] auto remove_job_from_dag(std::string_view queue,
                                         std::string_view namespaced_job)
      -> Result<void>;
  auto remove_job_states(std::string_view queue,
                         const std::vector<std::string>& jobs) -> void;

  [[nodiscard]] auto set_workflow_target_state(std::string_view workflow,
                                               TargetState state,
                                               const NameSet& skip = {})
      -> Result<void>;
  [[nodiscard]] auto set_single_workflow_target_state(std::string_view workflow,
                                                      TargetState state,
                                                      bool only_unfinished)
      -> Result<void>;

  MetadataStore& store_;
  ClusterAdmin& admin_;
  RebalanceTrigger& rebalance_;
  DriverConfig config_;
  KeyBuilder keys_;
};

}  // namespace jobflow
