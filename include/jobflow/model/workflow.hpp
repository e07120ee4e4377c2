#pragma once

#include "jobflow/core/error.hpp"
#include "jobflow/model/job_config.hpp"
#include "jobflow/model/workflow_config.hpp"

#include <map>
#include <string>
#include <string_view>

namespace jobflow {

// A workflow definition ready to be submitted: its config (with the DAG) and
// the config of every job in it. Job names given to the mutators are plain;
// they are stored namespaced by the workflow name.
class Workflow {
public:
  using JobConfigs = std::map<std::string, JobConfig, std::less<>>;

  explicit Workflow(std::string name, WorkflowConfig config = {});

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto config() const noexcept -> const WorkflowConfig& {
    return config_;
  }
  [[nodiscard]] auto mutable_config() noexcept -> WorkflowConfig& {
    return config_;
  }
  // Keyed by namespaced job name.
  [[nodiscard]] auto job_configs() const noexcept -> const JobConfigs& {
    return jobs_;
  }

  auto add_job(std::string_view job, JobConfig config) -> void;
  auto add_parent_child_dependency(std::string_view parent,
                                   std::string_view child) -> void;

  // Every DAG node has a job config and vice versa, the DAG is acyclic, and
  // every job config is well formed and belongs to this workflow.
  [[nodiscard]] auto validate() const -> Result<void>;

private:
  std::string name_;
  WorkflowConfig config_;
  JobConfigs jobs_;
};

// Non-terminable workflow that jobs are enqueued into one at a time.
[[nodiscard]] auto make_job_queue(std::string name, int capacity = 0)
    -> Workflow;

}  // namespace jobflow
