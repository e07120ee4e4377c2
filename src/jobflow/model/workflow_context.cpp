#include "jobflow/model/workflow_context.hpp"

#include "jobflow/util/log.hpp"

namespace jobflow {

namespace {

constexpr std::string_view kState = "STATE";
constexpr std::string_view kStartTime = "START_TIME";
constexpr std::string_view kFinishTime = "FINISH_TIME";
constexpr std::string_view kLastScheduled = "LAST_SCHEDULED_WORKFLOW";
constexpr std::string_view kJobStates = "JOB_STATES";
constexpr std::string_view kScheduledWorkflows = "SCHEDULED_WORKFLOWS";

}  // namespace

auto WorkflowContext::job_state(std::string_view job) const
    -> std::optional<TaskState> {
  auto it = job_states.find(job);
  if (it == job_states.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto WorkflowContext::to_record() const -> Record {
  Record r{workflow};
  if (workflow_state) {
    r.set_simple(kState, std::string(task_state_name(*workflow_state)));
  }
  r.set_simple_int(kStartTime, start_time);
  r.set_simple_int(kFinishTime, finish_time);
  if (last_scheduled_workflow) {
    r.set_simple(kLastScheduled, *last_scheduled_workflow);
  }
  auto& states = r.mutable_map(kJobStates);
  for (const auto& [job, state] : job_states) {
    states.insert_or_assign(job, std::string(task_state_name(state)));
  }
  if (!scheduled_workflows.empty()) {
    r.set_list(kScheduledWorkflows, scheduled_workflows);
  }
  return r;
}

auto WorkflowContext::from_record(const Record& r) -> Result<WorkflowContext> {
  WorkflowContext ctx;
  ctx.workflow = r.id;
  if (auto state = r.simple(kState)) {
    ctx.workflow_state = parse_task_state(*state);
    if (!ctx.workflow_state) {
      log::warn("Context of {} has unknown state {}", r.id, *state);
    }
  }
  ctx.start_time = r.simple_int(kStartTime).value_or(kUnfinished);
  ctx.finish_time = record_finish_time(r);
  ctx.last_scheduled_workflow = r.simple(kLastScheduled);
  if (const auto* states = r.map(kJobStates)) {
    for (const auto& [job, name] : *states) {
      if (auto state = parse_task_state(name)) {
        ctx.job_states.emplace(job, *state);
      } else {
        log::warn("Context of {} has unknown state {} for job {}", r.id, name,
                  job);
      }
    }
  }
  if (const auto* scheduled = r.list(kScheduledWorkflows)) {
    ctx.scheduled_workflows = *scheduled;
  }
  return ok(std::move(ctx));
}

auto record_finish_time(const Record& record) -> std::int64_t {
  return record.simple_int(kFinishTime).value_or(kUnfinished);
}

auto strip_record_job_states(Record& record,
                             const std::vector<std::string>& jobs) -> bool {
  auto it = record.map_fields.find(kJobStates);
  if (it == record.map_fields.end()) {
    return false;
  }
  bool removed = false;
  for (const auto& job : jobs) {
    removed |= it->second.erase(job) > 0;
  }
  return removed;
}

}  // namespace jobflow
