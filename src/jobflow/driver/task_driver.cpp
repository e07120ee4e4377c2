#include "jobflow/driver/task_driver.hpp"

#include "jobflow/store/atomic_update.hpp"
#include "jobflow/util/id.hpp"
#include "jobflow/util/log.hpp"

#include <algorithm>
#include <utility>

namespace jobflow {

TaskDriver::TaskDriver(MetadataStore& store, ClusterAdmin& admin,
                       RebalanceTrigger& rebalance, DriverConfig config)
    : store_(store),
      admin_(admin),
      rebalance_(rebalance),
      config_(std::move(config)),
      keys_(config_.cluster) {
}

auto TaskDriver::start(const Workflow& workflow) -> Result<void> {
  const auto& name = workflow.name();
  log::info("Starting workflow {}", name);
  if (auto r = workflow.validate(); !r) {
    log::error("Workflow {} is invalid: {}", name, r.error().message());
    return r;
  }

  auto existing = store_.exists(keys_.resource_config(name));
  if (!existing) {
    return fail(existing.error());
  }
  if (*existing) {
    log::error("Workflow {} already exists", name);
    return fail(Error::AlreadyExists);
  }

  WorkflowConfig config = workflow.config();
  config.workflow_id = name;
  config.job_types.clear();
  auto workflow_exists = [this, &name]() -> Result<bool> {
    return store_.exists(keys_.resource_config(name));
  };
  std::vector<std::pair<std::string, Record>> job_records;
  for (const auto& [job, job_config] : workflow.job_configs()) {
    if (job_config.has_job_type()) {
      config.job_types.insert_or_assign(job, job_config.job_type);
    }
    log::info("Adding job configuration {}", job);
    auto record = job_config.to_record();
    if (auto r = claim_job_config(job, record, workflow_exists,
                                  Error::AlreadyExists);
        !r) {
      log::error("Failed to add job configuration {}: {}", job,
                 r.error().message());
      return fail(r.error());
    }
    job_records.emplace_back(job, std::move(record));
  }

  if (auto r = store_.compare_and_set(keys_.resource_config(name),
                                      config.to_record(), kAbsentVersion);
      !r) {
    if (r.error() == Error::StoreConflict) {
      log::error("Workflow {} was created concurrently", name);
      return fail(Error::AlreadyExists);
    }
    log::error("Failed to add workflow configuration {}: {}", name,
               r.error().message());
    return r;
  }
  for (const auto& [job, record] : job_records) {
    if (auto r = settle_job_config(job, record); !r) {
      log::error("Failed to rewrite job configuration {}: {}", job,
                 r.error().message());
      return r;
    }
  }

  if (auto r = add_workflow_resource(name); !r) {
    log::error("Failed to add workflow resource {}: {}", name,
               r.error().message());
    return r;
  }
  rebalance_.invoke_rebalance(name);
  return ok();
}

auto TaskDriver::create_queue(const Workflow& queue) -> Result<void> {
  if (queue.config().terminable) {
    log::error("{} is terminable and cannot be created as a queue",
               queue.name());
    return fail(Error::InvalidArgument);
  }
  return start(queue);
}

auto TaskDriver::update_workflow(std::string_view workflow,
                                 WorkflowConfig config) -> Result<void> {
  auto current = read_workflow_config(workflow);
  if (!current) {
    return fail(current.error());
  }
  if (!*current) {
    log::error("Workflow {} does not exist", workflow);
    return fail(Error::NotFound);
  }
  if ((*current)->terminable) {
    log::error("Workflow {} is terminable; its configuration cannot change",
               workflow);
    return fail(Error::IllegalState);
  }

  config.workflow_id = std::string(workflow);
  if (auto r = config.validate(); !r) {
    log::error("New configuration of {} is invalid: {}", workflow,
               r.error().message());
    return r;
  }

  const Record replacement = config.to_record();
  auto r = update_with_retry(
      store_, keys_.resource_config(workflow),
      [&replacement](std::optional<Record> stored)
          -> Result<std::optional<Record>> {
        if (!stored || !is_workflow_record(*stored)) {
          return fail(Error::NotFound);
        }
        auto stored_config = WorkflowConfig::from_record(*stored);
        if (!stored_config) {
          return fail(stored_config.error());
        }
        if (stored_config->terminable) {
          return fail(Error::IllegalState);
        }
        return ok(std::optional<Record>{replacement});
      },
      config_.max_update_attempts);
  if (!r) {
    log::error("Failed to update workflow configuration {}: {}", workflow,
               r.error().message());
    return r;
  }

  log::info("Updated configuration of workflow {}", workflow);
  rebalance_.invoke_rebalance(workflow);
  return ok();
}

auto TaskDriver::enqueue_job(std::string_view queue, std::string_view job,
                             JobConfig config) -> Result<void> {
  if (!is_valid_name(job)) {
    log::error("Invalid job name '{}' for queue {}", job, queue);
    return fail(Error::InvalidArgument);
  }
  auto current = read_workflow_config(queue);
  if (!current) {
    return fail(current.error());
  }
  if (!*current) {
    log::error("Queue {} config does not exist", queue);
    return fail(Error::NotFound);
  }
  const WorkflowConfig& queue_config = **current;
  if (queue_config.terminable) {
    log::error("{} is not a queue", queue);
    return fail(Error::InvalidArgument);
  }

  const std::string namespaced = namespaced_job_name(queue, job);
  config.workflow = std::string(queue);
  config.job_id = namespaced;
  if (auto r = config.validate(); !r) {
    return r;
  }

  const int capacity = queue_config.capacity;
  if (capacity > 0 && std::cmp_greater_equal(queue_config.dag.size(), capacity)) {
    log::error("Queue {} is at capacity, will not add {}", queue, job);
    return fail(Error::InvalidArgument);
  }
  if (queue_config.dag.has_node(namespaced)) {
    log::error("Could not add to queue {}, job {} already exists", queue, job);
    return fail(Error::InvalidArgument);
  }

  log::info("Adding job configuration {}", namespaced);
  const Record job_record = config.to_record();
  auto in_dag = [this, queue, &namespaced]() -> Result<bool> {
    auto latest = read_workflow_config(queue);
    if (!latest) {
      return fail(latest.error());
    }
    return ok(latest->has_value() && (*latest)->dag.has_node(namespaced));
  };
  auto claimed = claim_job_config(namespaced, job_record, in_dag,
                                  Error::InvalidArgument);
  if (!claimed) {
    log::error("Could not add to queue {}, job {}: {}", queue, job,
               claimed.error().message());
    return fail(claimed.error());
  }

  const std::string& job_type = config.job_type;
  bool duplicate = false;
  auto r = update_with_retry(
      store_, keys_.resource_config(queue),
      [&](std::optional<Record> stored) -> Result<std::optional<Record>> {
        duplicate = false;
        if (!stored) {
          return fail(Error::NotFound);
        }
        auto dag = record_dag(*stored);
        if (!dag) {
          return fail(dag.error());
        }
        if (dag->has_node(namespaced)) {
          duplicate = true;
          return fail(Error::InvalidArgument);
        }
        if (capacity > 0 && std::cmp_greater_equal(dag->size(), capacity)) {
          return fail(Error::InvalidArgument);
        }

        // The tail is the first childless node in name order.
        const std::string* tail = nullptr;
        for (const auto& node : dag->all_nodes()) {
          if (dag->direct_children(node).empty()) {
            tail = &node;
            break;
          }
        }
        if (tail) {
          std::string parent = *tail;
          dag->add_parent_to_child(parent, namespaced);
        } else {
          dag->add_node(namespaced);
        }

        if (!job_type.empty()) {
          record_job_types(*stored).insert_or_assign(namespaced, job_type);
        }
        set_record_dag(*stored, *dag);
        return ok(std::move(stored));
      },
      config_.max_update_attempts);

  if (!r) {
    log::error("Could not enqueue job {} into {}: {}", job, queue,
               r.error().message());
    // The config stays when the job was committed by another call, or when
    // another call has taken it over since.
    if (!duplicate) {
      const auto path = keys_.resource_config(namespaced);
      auto stored = store_.get(path);
      if (!stored) {
        log::warn("Could not read job configuration {}: {}", namespaced,
                  stored.error().message());
      } else if (*stored && (*stored)->version == *claimed) {
        if (auto rm = store_.remove(path); !rm) {
          log::warn("Failed to remove orphaned job configuration {}: {}",
                    namespaced, rm.error().message());
        }
      }
    }
    return r;
  }

  if (auto res = settle_job_config(namespaced, job_record); !res) {
    log::error("Failed to rewrite job configuration {}: {}", namespaced,
               res.error().message());
    return res;
  }

  if (auto res = add_workflow_resource_if_missing(queue); !res) {
    log::error("Failed to add workflow resource {}: {}", queue,
               res.error().message());
    return res;
  }
  log::info("Enqueued job {} into queue {}", job, queue);
  rebalance_.invoke_rebalance(queue);
  return ok();
}

auto TaskDriver::claim_job_config(std::string_view job, const Record& record,
                                  const std::function<Result<bool>()>& committed,
                                  Error taken) -> Result<std::int64_t> {
  const auto path = keys_.resource_config(job);
  auto created = store_.compare_and_set(path, record, kAbsentVersion);
  if (created) {
    return ok(std::int64_t{0});
  }
  if (created.error() != Error::StoreConflict) {
    return fail(created.error());
  }

  // The version must be read before the commit check.
  auto stored = store_.get(path);
  if (!stored) {
    return fail(stored.error());
  }
  auto is_committed = committed();
  if (!is_committed) {
    return fail(is_committed.error());
  }
  if (*is_committed || (*stored && is_workflow_record((*stored)->record))) {
    log::error("Job {} already exists", job);
    return fail(taken);
  }

  const std::int64_t version = *stored ? (*stored)->version : kAbsentVersion;
  if (*stored) {
    log::warn("Taking over configuration of job {}, nothing refers to it", job);
  }
  if (auto r = store_.compare_and_set(path, record, version); !r) {
    if (r.error() == Error::StoreConflict) {
      log::error("Job {} is being added concurrently", job);
      return fail(taken);
    }
    return fail(r.error());
  }
  return ok(version + 1);
}

auto TaskDriver::settle_job_config(std::string_view job, const Record& record)
    -> Result<void> {
  return update_with_retry(
      store_, keys_.resource_config(job),
      [&record](std::optional<Record>) -> Result<std::optional<Record>> {
        return ok(std::optional<Record>{record});
      },
      config_.max_update_attempts);
}

auto TaskDriver::delete_job(std::string_view queue, std::string_view job)
    -> Result<void> {
  auto current = read_workflow_config(queue);
  if (!current) {
    return fail(current.error());
  }
  if (!*current) {
    log::error("Queue {} does not exist", queue);
    return fail(Error::NotFound);
  }
  const WorkflowConfig& queue_config = **current;
  if (queue_config.terminable) {
    log::error("{} is not a queue", queue);
    return fail(Error::InvalidArgument);
  }

  if (!queue_config.is_recurring()) {
    return delete_job_from_scheduled_queue(queue, job, false);
  }

  const std::string namespaced = namespaced_job_name(queue, job);
  auto has_config = store_.exists(keys_.resource_config(namespaced));
  if (!has_config) {
    return fail(has_config.error());
  }
  if (!queue_config.dag.has_node(namespaced) && !*has_config) {
    log::error("Job {} does not exist in queue {}", job, queue);
    return fail(Error::NotFound);
  }

  auto ctx = read_workflow_context(queue);
  if (!ctx) {
    return fail(ctx.error());
  }
  if (*ctx && (*ctx)->last_scheduled_workflow) {
    if (auto r = delete_job_from_scheduled_queue(
            *(*ctx)->last_scheduled_workflow, job, true);
        !r) {
      return r;
    }
  } else {
    log::info("Recurring queue {} has not scheduled an instance yet", queue);
  }

  if (auto r = remove_job_from_dag(queue, namespaced); !r) {
    return r;
  }
  if (auto r = admin_.drop_resource(keys_.cluster(), namespaced); !r) {
    return r;
  }
  if (auto r = store_.remove(keys_.rebalancer_context(namespaced)); !r) {
    log::error("Failed to remove context of job {}: {}", namespaced,
               r.error().message());
    return r;
  }
  log::info("Deleted job {} from recurring queue {}", job, queue);
  return ok();
}

auto TaskDriver::delete_job_from_scheduled_queue(std::string_view queue,
                                                 std::string_view job,
                                                 bool recurrent)
    -> Result<void> {
  auto current = read_workflow_config(queue);
  if (!current) {
    return fail(current.error());
  }
  if (!*current) {
    // A scheduled instance may not have started yet, or may be gone already.
    if (recurrent) {
      log::info("Scheduled queue {} has no configuration; skipping", queue);
      return ok();
    }
    log::error("Queue {} does not exist", queue);
    return fail(Error::NotFound);
  }

  if (!recurrent) {
    auto ctx = read_workflow_context(queue);
    if (!ctx) {
      return fail(ctx.error());
    }
    if (*ctx) {
      const auto& state = (*ctx)->workflow_state;
      if (!state) {
        log::error("Queue {} does not have a valid state", queue);
        return fail(Error::IllegalState);
      }
      if (*state == TaskState::InProgress) {
        log::error("Queue {} is still in progress", queue);
        return fail(Error::IllegalState);
      }
    }
  }

  auto r = remove_job(queue, job, (*current)->dag);
  if (!r && recurrent && r.error() == Error::NotFound) {
    log::info("Job {} is not in scheduled queue {}", job, queue);
    return ok();
  }
  return r;
}

auto TaskDriver::remove_job(std::string_view queue, std::string_view job,
                            const JobDag& dag) -> Result<void> {
  const std::string namespaced = namespaced_job_name(queue, job);
  auto has_config = store_.exists(keys_.resource_config(namespaced));
  if (!has_config) {
    return fail(has_config.error());
  }
  const bool in_dag = dag.has_node(namespaced);
  if (!in_dag && !*has_config) {
    log::error("Job {} does not exist in queue {}", job, queue);
    return fail(Error::NotFound);
  }

  if (in_dag) {
    if (auto r = remove_job_from_dag(queue, namespaced); !r) {
      return r;
    }
  } else {
    log::warn("Job {} is not in the DAG of {}; removing what is left of it",
              job, queue);
  }

  if (auto r = admin_.drop_resource(keys_.cluster(), namespaced); !r) {
    return r;
  }
  remove_job_states(queue, {namespaced});
  if (auto r = store_.remove(keys_.rebalancer_context(namespaced)); !r) {
    log::error("Failed to remove context of job {}: {}", namespaced,
               r.error().message());
    return r;
  }
  log::info("Removed job {} from queue {}", job, queue);
  return ok();
}

auto TaskDriver::remove_job_from_dag(std::string_view queue,
                                     std::string_view namespaced_job)
    -> Result<void> {
  auto r = update_with_retry(
      store_, keys_.resource_config(queue),
      [namespaced_job](std::optional<Record> stored)
          -> Result<std::optional<Record>> {
        if (!stored) {
          return fail(Error::NotFound);
        }
        auto dag = record_dag(*stored);
        if (!dag) {
          return fail(dag.error());
        }
        if (!dag->remove_node(namespaced_job)) {
          return ok(std::optional<Record>{});
        }
        erase_record_job_types(*stored, {std::string(namespaced_job)});
        set_record_dag(*stored, *dag);
        return ok(std::move(stored));
      },
      config_.max_update_attempts);
  if (!r) {
    log::error("Could not remove job {} from DAG of queue {}: {}",
               namespaced_job, queue, r.error().message());
  }
  return r;
}

auto TaskDriver::remove_job_states(std::string_view queue,
                                   const std::vector<std::string>& jobs)
    -> void {
  auto r = update_with_retry(
      store_, keys_.context(queue),
      [&jobs](std::optional<Record> stored) -> Result<std::optional<Record>> {
        if (!stored || !strip_record_job_states(*stored, jobs)) {
          return ok(std::optional<Record>{});
        }
        return ok(std::move(stored));
      },
      config_.max_update_attempts);
  if (!r) {
    log::warn("Failed to remove job states of {} job(s) from queue {}: {}",
              jobs.size(), queue, r.error().message());
  }
}

auto TaskDriver::flush_queue(std::string_view queue) -> Result<void> {
  auto current = read_workflow_config(queue);
  if (!current) {
    return fail(current.error());
  }
  if (!*current) {
    log::error("Queue {} does not exist", queue);
    return fail(Error::NotFound);
  }

  const auto& nodes = (*current)->dag.all_nodes();
  const std::vector<std::string> to_remove(nodes.begin(), nodes.end());
  for (const auto& job : to_remove) {
    if (auto r = admin_.drop_resource(keys_.cluster(), job); !r) {
      return r;
    }
    if (auto r = store_.remove(keys_.rebalancer_context(job)); !r) {
      log::error("Failed to remove context of job {}: {}", job,
                 r.error().message());
      return r;
    }
  }

  auto r = update_with_retry(
      store_, keys_.resource_config(queue),
      [&to_remove](std::optional<Record> stored)
          -> Result<std::optional<Record>> {
        if (!stored) {
          return fail(Error::NotFound);
        }
        auto dag = record_dag(*stored);
        if (!dag) {
          return fail(dag.error());
        }
        for (const auto& job : to_remove) {
          dag->erase_node(job);
        }
        erase_record_job_types(*stored, to_remove);
        set_record_dag(*stored, *dag);
        return ok(std::move(stored));
      },
      config_.max_update_attempts);
  if (!r) {
    log::error("Could not clear DAG of queue {}: {}", queue,
               r.error().message());
    return r;
  }

  remove_job_states(queue, to_remove);
  log::info("Flushed {} job(s) from queue {}", to_remove.size(), queue);
  return ok();
}

auto TaskDriver::cleanup_job_queue(std::string_view queue) -> Result<void> {
  auto current = read_workflow_config(queue);
  if (!current) {
    return fail(current.error());
  }
  if (!*current) {
    log::error("Queue {} does not exist", queue);
    return fail(Error::NotFound);
  }
  auto ctx = read_workflow_context(queue);
  if (!ctx) {
    return fail(ctx.error());
  }
  if (!*ctx || !(*ctx)->workflow_state) {
    log::error("Queue {} does not have a valid state", queue);
    return fail(Error::IllegalState);
  }

  const JobDag& dag = (*current)->dag;
  std::size_t removed = 0;
  for (const auto& node : dag.all_nodes()) {
    auto state = (*ctx)->job_state(node);
    if (!state || !is_terminal(*state)) {
      continue;
    }
    if (auto r = remove_job(queue, denamespaced_job_name(queue, node), dag);
        !r) {
      return r;
    }
    ++removed;
  }
  log::info("Cleaned up {} finished job(s) from queue {}", removed, queue);
  return ok();
}

auto TaskDriver::resume(std::string_view workflow) -> Result<void> {
  return set_workflow_target_state(workflow, TargetState::Start);
}

auto TaskDriver::stop(std::string_view workflow) -> Result<void> {
  return set_workflow_target_state(workflow, TargetState::Stop);
}

auto TaskDriver::delete_workflow(std::string_view workflow) -> Result<void> {
  // Read before marking: the rebalancer may remove the context right after.
  auto ctx = read_workflow_context(workflow);
  if (!ctx) {
    return fail(ctx.error());
  }

  NameSet recorded;
  std::vector<std::string> finished;
  if (*ctx) {
    for (const auto& scheduled : (*ctx)->scheduled_workflows) {
      auto scheduled_ctx = read_workflow_context(scheduled);
      if (!scheduled_ctx) {
        return fail(scheduled_ctx.error());
      }
      recorded.insert(scheduled);
      if (*scheduled_ctx && (*scheduled_ctx)->is_finished()) {
        finished.push_back(scheduled);
      }
    }
  }

  if (auto r = set_workflow_target_state(workflow, TargetState::Delete, recorded);
      !r) {
    return r;
  }

  for (const auto& scheduled : finished) {
    auto r = set_single_workflow_target_state(scheduled, TargetState::Delete,
                                              false);
    if (!r && r.error() == Error::NotFound) {
      log::debug("Scheduled workflow {} is already gone", scheduled);
      continue;
    }
    if (!r) {
      return r;
    }
  }
  return ok();
}

auto TaskDriver::set_workflow_target_state(std::string_view workflow,
                                           TargetState state,
                                           const NameSet& skip)
    -> Result<void> {
  if (auto r = set_single_workflow_target_state(workflow, state, true); !r) {
    return r;
  }

  auto resources = store_.children(keys_.resource_configs());
  if (!resources) {
    return fail(resources.error());
  }
  for (const auto& resource : *resources) {
    if (!is_namespaced_by(workflow, resource) || skip.contains(resource)) {
      continue;
    }
    auto rec = store_.read(keys_.resource_config(resource));
    if (!rec) {
      return fail(rec.error());
    }
    if (!*rec || !is_workflow_record(**rec)) {
      continue;
    }
    auto r = set_single_workflow_target_state(resource, state, true);
    if (!r && r.error() != Error::NotFound) {
      return r;
    }
  }
  return ok();
}

auto TaskDriver::set_single_workflow_target_state(std::string_view workflow,
                                                  TargetState state,
                                                  bool only_unfinished)
    -> Result<void> {
  if (only_unfinished) {
    auto ctx = store_.read(keys_.context(workflow));
    if (!ctx) {
      return fail(ctx.error());
    }
    if (*ctx && record_finish_time(**ctx) != kUnfinished) {
      log::info("Workflow {} has finished; keeping its target state", workflow);
      return ok();
    }
  }

  log::info("Set {} to target state {}", workflow, state);
  auto r = update_with_retry(
      store_, keys_.resource_config(workflow),
      [state](std::optional<Record> stored) -> Result<std::optional<Record>> {
        if (!stored || !is_workflow_record(*stored)) {
          return fail(Error::NotFound);
        }
        if (record_target_state(*stored) == state) {
          return ok(std::optional<Record>{});
        }
        set_record_target_state(*stored, state);
        return ok(std::move(stored));
      },
      config_.max_update_attempts);
  if (!r) {
    if (r.error() == Error::NotFound) {
      log::error("Configuration of workflow {} not found", workflow);
    } else {
      log::error("Failed to set target state of {}: {}", workflow,
                 r.error().message());
    }
    return r;
  }
  rebalance_.invoke_rebalance(workflow);
  return ok();
}

auto TaskDriver::add_workflow_resource(std::string_view workflow)
    -> Result<void> {
  if (auto r = admin_.add_resource(keys_.cluster(), workflow, 1, kTaskStateModel);
      !r) {
    return r;
  }
  if (auto r = store_.set(keys_.user_content(workflow), Record{"UserContent"});
      !r) {
    return r;
  }
  return admin_.set_resource_layout(keys_.cluster(), workflow,
                                    workflow_layout(workflow));
}

auto TaskDriver::add_workflow_resource_if_missing(std::string_view workflow)
    -> Result<void> {
  auto layout = admin_.get_resource_layout(keys_.cluster(), workflow);
  if (layout) {
    return ok();
  }
  if (layout.error() != Error::NotFound) {
    return fail(layout.error());
  }
  auto r = add_workflow_resource(workflow);
  if (!r && r.error() == Error::AlreadyExists) {
    return ok();
  }
  return r;
}

auto TaskDriver::read_workflow_config(std::string_view workflow)
    -> Result<std::optional<WorkflowConfig>> {
  auto rec = store_.read(keys_.resource_config(workflow));
  if (!rec) {
    return fail(rec.error());
  }
  if (!*rec || !is_workflow_record(**rec)) {
    return ok(std::optional<WorkflowConfig>{});
  }
  auto config = WorkflowConfig::from_record(**rec);
  if (!config) {
    return fail(config.error());
  }
  return ok(std::optional<WorkflowConfig>{std::move(*config)});
}

auto TaskDriver::read_workflow_context(std::string_view workflow)
    -> Result<std::optional<WorkflowContext>> {
  auto rec = store_.read(keys_.context(workflow));
  if (!rec) {
    return fail(rec.error());
  }
  if (!*rec) {
    return ok(std::optional<WorkflowContext>{});
  }
  auto ctx = WorkflowContext::from_record(**rec);
  if (!ctx) {
    return fail(ctx.error());
  }
  ctx->workflow = std::string(workflow);
  return ok(std::optional<WorkflowContext>{std::move(*ctx)});
}

auto TaskDriver::get_workflow_config(std::string_view workflow)
    -> Result<WorkflowConfig> {
  auto config = read_workflow_config(workflow);
  if (!config) {
    return fail(config.error());
  }
  if (!*config) {
    return fail(Error::NotFound);
  }
  return ok(std::move(**config));
}

auto TaskDriver::get_workflow_context(std::string_view workflow)
    -> Result<WorkflowContext> {
  auto ctx = read_workflow_context(workflow);
  if (!ctx) {
    return fail(ctx.error());
  }
  if (!*ctx) {
    return fail(Error::NotFound);
  }
  return ok(std::move(**ctx));
}

auto TaskDriver::get_job_config(std::string_view job) -> Result<JobConfig> {
  auto rec = store_.read(keys_.resource_config(job));
  if (!rec) {
    return fail(rec.error());
  }
  if (!*rec || is_workflow_record(**rec)) {
    return fail(Error::NotFound);
  }
  return JobConfig::from_record(**rec);
}

auto TaskDriver::get_job_context(std::string_view job) -> Result<JobContext> {
  auto rec = store_.read(keys_.context(job));
  if (!rec) {
    return fail(rec.error());
  }
  if (!*rec) {
    return fail(Error::NotFound);
  }
  auto ctx = JobContext::from_record(**rec);
  if (ctx) {
    ctx->job = std::string(job);
  }
  return ctx;
}

auto TaskDriver::get_workflows() -> Result<WorkflowConfigs> {
  auto resources = store_.children(keys_.resource_configs());
  if (!resources) {
    return fail(resources.error());
  }
  WorkflowConfigs workflows;
  for (const auto& resource : *resources) {
    auto config = read_workflow_config(resource);
    if (!config) {
      log::warn("Skipping unreadable configuration {}: {}", resource,
                config.error().message());
      continue;
    }
    if (*config) {
      workflows.emplace(resource, std::move(**config));
    }
  }
  return ok(std::move(workflows));
}

}  // namespace jobflow
