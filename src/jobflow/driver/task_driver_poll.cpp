#include "jobflow/driver/task_driver.hpp"

#include "jobflow/util/id.hpp"
#include "jobflow/util/log.hpp"

#include <algorithm>
#include <string>

namespace jobflow {

namespace {

using Clock = std::chrono::steady_clock;

auto is_one_of(std::initializer_list<TaskState> states,
               std::optional<TaskState> state) -> bool {
  return state && std::ranges::find(states, *state) != states.end();
}

auto describe(std::initializer_list<TaskState> states) -> std::string {
  std::string out;
  for (auto state : states) {
    if (!out.empty()) {
      out += ", ";
    }
    out += task_state_name(state);
  }
  return out;
}

auto describe(std::optional<TaskState> state) -> std::string_view {
  return state ? task_state_name(*state) : "<none>";
}

}  // namespace

auto TaskDriver::wait_to_stop(std::string_view workflow,
                              std::chrono::milliseconds timeout,
                              const CancellationToken& token) -> Result<void> {
  if (auto r = stop(workflow); !r) {
    return r;
  }

  auto deadline = Clock::now() + timeout;
  while (true) {
    auto ctx = read_workflow_context(workflow);
    if (!ctx) {
      return fail(ctx.error());
    }
    if (*ctx && (*ctx)->workflow_state == TaskState::Stopped) {
      log::info("Workflow {} stopped", workflow);
      return ok();
    }

    auto now = Clock::now();
    if (now >= deadline) {
      break;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (!token.sleep_for(std::min(config_.stop_poll_interval, remaining))) {
      log::info("Stopped waiting for {}: cancelled", workflow);
      return fail(Error::Cancelled);
    }
  }

  log::error("Failed to stop workflow {} within {} ms", workflow,
             timeout.count());
  return fail(Error::Timeout);
}

auto TaskDriver::poll_for_workflow_state(
    std::string_view workflow, std::initializer_list<TaskState> states,
    std::chrono::milliseconds timeout, const CancellationToken& token)
    -> Result<TaskState> {
  auto step = std::min(config_.poll_interval, timeout);
  auto deadline = Clock::now() + timeout;
  std::optional<TaskState> observed;
  do {
    if (!token.sleep_for(step)) {
      return fail(Error::Cancelled);
    }
    auto ctx = read_workflow_context(workflow);
    if (!ctx) {
      return fail(ctx.error());
    }
    observed = *ctx ? (*ctx)->workflow_state : std::nullopt;
  } while (!is_one_of(states, observed) && Clock::now() < deadline);

  if (!is_one_of(states, observed)) {
    log::error("Workflow \"{}\" context is empty or not in states [{}] (is {})",
               workflow, describe(states), describe(observed));
    return fail(Error::Timeout);
  }
  return ok(*observed);
}

auto TaskDriver::poll_for_workflow_state(
    std::string_view workflow, std::initializer_list<TaskState> states)
    -> Result<TaskState> {
  return poll_for_workflow_state(workflow, states, config_.default_timeout);
}

auto TaskDriver::poll_for_job_state(std::string_view workflow,
                                    std::string_view job,
                                    std::initializer_list<TaskState> states,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken& token)
    -> Result<TaskState> {
  auto config = read_workflow_config(workflow);
  if (!config) {
    return fail(config.error());
  }
  if (!*config) {
    log::error("Workflow \"{}\" does not exist", workflow);
    return fail(Error::NotFound);
  }

  auto step = std::min(config_.poll_interval, timeout);
  std::string target_workflow{workflow};
  std::string target_job{job};

  if ((*config)->is_recurring()) {
    // Jobs run in the scheduled instances, not in the template.
    auto deadline = Clock::now() + timeout;
    std::optional<std::string> instance;
    do {
      if (!token.sleep_for(step)) {
        return fail(Error::Cancelled);
      }
      auto ctx = read_workflow_context(workflow);
      if (!ctx) {
        return fail(ctx.error());
      }
      if (*ctx) {
        instance = (*ctx)->last_scheduled_workflow;
      }
    } while (!instance && Clock::now() < deadline);

    if (!instance) {
      log::error("Recurring workflow \"{}\" has not scheduled an instance",
                 workflow);
      return fail(Error::Timeout);
    }
    target_job =
        namespaced_job_name(*instance, denamespaced_job_name(workflow, job));
    target_workflow = std::move(*instance);
  }

  auto deadline = Clock::now() + timeout;
  std::optional<TaskState> observed;
  do {
    if (!token.sleep_for(step)) {
      return fail(Error::Cancelled);
    }
    auto ctx = read_workflow_context(target_workflow);
    if (!ctx) {
      return fail(ctx.error());
    }
    observed = *ctx ? (*ctx)->job_state(target_job) : std::nullopt;
  } while (!is_one_of(states, observed) && Clock::now() < deadline);

  if (!is_one_of(states, observed)) {
    log::error("Job \"{}\" context is empty or not in states [{}] (is {})",
               target_job, describe(states), describe(observed));
    return fail(Error::Timeout);
  }
  return ok(*observed);
}

auto TaskDriver::poll_for_job_state(std::string_view workflow,
                                    std::string_view job,
                                    std::initializer_list<TaskState> states)
    -> Result<TaskState> {
  return poll_for_job_state(workflow, job, states, config_.default_timeout);
}

}  // namespace jobflow
