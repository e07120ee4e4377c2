#include "jobflow/model/workflow.hpp"

#include "jobflow/util/id.hpp"
#include "jobflow/util/log.hpp"

namespace jobflow {

Workflow::Workflow(std::string name, WorkflowConfig config)
    : name_(std::move(name)), config_(std::move(config)) {
  config_.workflow_id = name_;
}

auto Workflow::add_job(std::string_view job, JobConfig config) -> void {
  auto namespaced = namespaced_job_name(name_, job);
  config.workflow = name_;
  config.job_id = namespaced;
  config_.dag.add_node(namespaced);
  jobs_.insert_or_assign(std::move(namespaced), std::move(config));
}

auto Workflow::add_parent_child_dependency(std::string_view parent,
                                           std::string_view child) -> void {
  config_.dag.add_parent_to_child(namespaced_job_name(name_, parent),
                                  namespaced_job_name(name_, child));
}

auto Workflow::validate() const -> Result<void> {
  if (!is_valid_name(name_)) {
    log::warn("Invalid workflow name '{}'", name_);
    return fail(Error::InvalidArgument);
  }
  for (const auto& node : config_.dag.all_nodes()) {
    if (!jobs_.contains(node)) {
      log::warn("Workflow {}: DAG node {} has no job config", name_, node);
      return fail(Error::InvalidArgument);
    }
  }
  for (const auto& [job, cfg] : jobs_) {
    if (!config_.dag.has_node(job)) {
      log::warn("Workflow {}: job {} is not in the DAG", name_, job);
      return fail(Error::InvalidArgument);
    }
    if (cfg.workflow != name_) {
      log::warn("Workflow {}: job {} belongs to {}", name_, job, cfg.workflow);
      return fail(Error::InvalidArgument);
    }
    if (auto r = cfg.validate(); !r) {
      return r;
    }
  }
  if (auto r = config_.validate(); !r) {
    if (r.error() == Error::CycleDetected) {
      log::warn("Workflow {} has a dependency cycle", name_);
    }
    return r;
  }
  return ok();
}

auto make_job_queue(std::string name, int capacity) -> Workflow {
  WorkflowConfig config;
  config.terminable = false;
  config.capacity = capacity;
  return Workflow(std::move(name), std::move(config));
}

}  // namespace jobflow
