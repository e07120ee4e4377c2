#include "jobflow/config/workflow_loader.hpp"

#include "jobflow/config/yaml_utils.hpp"
#include "jobflow/util/id.hpp"
#include "jobflow/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace jobflow {

namespace {

struct JobEntry {
  std::string name;
  JobConfig config;
  std::vector<std::string> parents;
};

}  // namespace

}  // namespace jobflow

namespace YAML {

template <>
struct convert<jobflow::TaskConfig> {
  static bool decode(const Node& node, jobflow::TaskConfig& t) {
    if (!node.IsMap()) return false;
    t.id = jobflow::yaml_get_or<std::string>(node, "id", "");
    t.command = jobflow::yaml_get_or<std::string>(node, "command", "");
    t.target_partition =
        jobflow::yaml_get_or<std::string>(node, "target_partition", "");
    t.config = jobflow::yaml_string_map(node, "config");
    return !t.id.empty();
  }
};

template <>
struct convert<jobflow::ScheduleConfig> {
  static bool decode(const Node& node, jobflow::ScheduleConfig& s) {
    if (!node.IsMap()) return false;
    s.start_time_ms = jobflow::yaml_get_or<std::int64_t>(node, "start_time", 0);
    if (auto unit = node["recurrence_unit"]) {
      s.recurrence_unit = jobflow::parse_recurrence_unit(unit.as<std::string>());
      if (!s.recurrence_unit) return false;
      s.recurrence_interval =
          jobflow::yaml_get_or<std::int64_t>(node, "recurrence_interval", 0);
    }
    return true;
  }
};

template <>
struct convert<jobflow::JobEntry> {
  static bool decode(const Node& node, jobflow::JobEntry& e) {
    if (!node.IsMap()) return false;
    e.name = jobflow::yaml_get_or<std::string>(node, "name", "");
    if (e.name.empty()) return false;

    auto& c = e.config;
    c.command = jobflow::yaml_get_or<std::string>(node, "command", "");
    c.job_type = jobflow::yaml_get_or<std::string>(node, "job_type", "");
    c.target_resource =
        jobflow::yaml_get_or<std::string>(node, "target_resource", "");
    c.target_partition_states =
        jobflow::yaml_string_list(node, "target_partition_states");
    c.target_partitions = jobflow::yaml_string_list(node, "target_partitions");
    c.command_config = jobflow::yaml_string_map(node, "config");
    if (auto v = node["timeout_per_task_ms"]) {
      c.timeout_per_task = std::chrono::milliseconds(v.as<std::int64_t>());
    }
    c.max_attempts_per_task = jobflow::yaml_get_or(
        node, "max_attempts_per_task",
        jobflow::JobConfig::kDefaultMaxAttemptsPerTask);
    c.failure_threshold = jobflow::yaml_get_or(node, "failure_threshold", 0);
    c.max_concurrent_tasks_per_instance = jobflow::yaml_get_or(
        node, "max_concurrent_tasks_per_instance",
        jobflow::JobConfig::kDefaultMaxConcurrentTasksPerInstance);
    c.ignore_dependent_job_failure =
        jobflow::yaml_get_or(node, "ignore_dependent_job_failure", false);
    if (auto tasks = node["tasks"]) {
      c.task_configs = tasks.as<std::vector<jobflow::TaskConfig>>();
    }
    e.parents = jobflow::yaml_string_list(node, "parents");
    return true;
  }
};

}  // namespace YAML

namespace jobflow {

auto WorkflowLoader::load_from_file(std::string_view path) -> Result<Workflow> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open workflow file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto WorkflowLoader::load_from_string(std::string_view yaml_str)
    -> Result<Workflow> {
  std::string name;
  WorkflowConfig config;
  std::vector<JobEntry> jobs;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsMap()) {
      log::error("Workflow definition is not a YAML map");
      return fail(Error::ParseError);
    }
    name = yaml_get_or<std::string>(root, "name", "");
    config.terminable = yaml_get_or(root, "terminable", true);
    config.capacity = yaml_get_or(root, "capacity", 0);
    config.parallel_jobs = yaml_get_or(root, "parallel_jobs", 1);
    config.failure_threshold = yaml_get_or(root, "failure_threshold", 0);
    if (auto v = root["expiry_ms"]) {
      config.expiry = std::chrono::milliseconds(v.as<std::int64_t>());
    }
    if (auto schedule = root["schedule"]) {
      config.schedule = schedule.as<ScheduleConfig>();
    }
    if (auto list = root["jobs"]) {
      jobs = list.as<std::vector<JobEntry>>();
    }
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (name.empty()) {
    log::error("Workflow definition has no name");
    return fail(Error::InvalidArgument);
  }

  Workflow workflow(name, std::move(config));
  for (auto& job : jobs) {
    workflow.add_job(job.name, std::move(job.config));
  }
  for (const auto& job : jobs) {
    for (const auto& parent : job.parents) {
      if (!workflow.config().dag.has_node(namespaced_job_name(name, parent))) {
        log::error("Job {} of workflow {} depends on unknown job {}", job.name,
                   name, parent);
        return fail(Error::InvalidArgument);
      }
      workflow.add_parent_child_dependency(parent, job.name);
    }
  }

  if (auto r = workflow.validate(); !r) {
    return fail(r.error());
  }
  log::debug("Loaded workflow {} with {} job(s)", name, jobs.size());
  return ok(std::move(workflow));
}

auto WorkflowLoader::to_string(const Workflow& workflow) -> std::string {
  const auto& cfg = workflow.config();
  YAML::Emitter out;
  out << YAML::BeginMap;
  yaml_emit(out, "name", workflow.name());
  if (!cfg.terminable) {
    yaml_emit(out, "terminable", false);
  }
  if (cfg.capacity != 0) {
    yaml_emit(out, "capacity", cfg.capacity);
  }
  if (cfg.parallel_jobs != 1) {
    yaml_emit(out, "parallel_jobs", cfg.parallel_jobs);
  }
  if (cfg.failure_threshold != 0) {
    yaml_emit(out, "failure_threshold", cfg.failure_threshold);
  }
  if (cfg.expiry != WorkflowConfig::kDefaultExpiry) {
    yaml_emit(out, "expiry_ms", cfg.expiry.count());
  }
  if (cfg.schedule) {
    out << YAML::Key << "schedule" << YAML::Value << YAML::BeginMap;
    yaml_emit(out, "start_time", cfg.schedule->start_time_ms);
    if (cfg.schedule->recurrence_unit) {
      yaml_emit(out, "recurrence_unit",
                std::string(recurrence_unit_name(*cfg.schedule->recurrence_unit)));
      yaml_emit(out, "recurrence_interval", cfg.schedule->recurrence_interval);
    }
    out << YAML::EndMap;
  }

  out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
  for (const auto& node : cfg.dag.topological_order()) {
    auto it = workflow.job_configs().find(node);
    if (it == workflow.job_configs().end()) {
      continue;
    }
    const auto& job = it->second;
    out << YAML::BeginMap;
    yaml_emit(out, "name", denamespaced_job_name(workflow.name(), node));
    yaml_emit_if_not_empty(out, "command", job.command);
    yaml_emit_if_not_empty(out, "job_type", job.job_type);
    yaml_emit_if_not_empty(out, "target_resource", job.target_resource);
    if (!job.target_partition_states.empty()) {
      yaml_emit(out, "target_partition_states", job.target_partition_states);
    }
    if (!job.target_partitions.empty()) {
      yaml_emit(out, "target_partitions", job.target_partitions);
    }
    if (job.timeout_per_task != JobConfig::kDefaultTimeoutPerTask) {
      yaml_emit(out, "timeout_per_task_ms", job.timeout_per_task.count());
    }
    if (job.max_attempts_per_task != JobConfig::kDefaultMaxAttemptsPerTask) {
      yaml_emit(out, "max_attempts_per_task", job.max_attempts_per_task);
    }
    if (job.failure_threshold != 0) {
      yaml_emit(out, "failure_threshold", job.failure_threshold);
    }
    if (job.max_concurrent_tasks_per_instance !=
        JobConfig::kDefaultMaxConcurrentTasksPerInstance) {
      yaml_emit(out, "max_concurrent_tasks_per_instance",
                job.max_concurrent_tasks_per_instance);
    }
    if (job.ignore_dependent_job_failure) {
      yaml_emit(out, "ignore_dependent_job_failure", true);
    }
    const auto& parents = cfg.dag.direct_parents(node);
    if (!parents.empty()) {
      out << YAML::Key << "parents" << YAML::Value << YAML::Flow
          << YAML::BeginSeq;
      for (const auto& p : parents) {
        out << denamespaced_job_name(workflow.name(), p);
      }
      out << YAML::EndSeq;
    }
    if (!job.command_config.empty()) {
      out << YAML::Key << "config" << YAML::Value << YAML::BeginMap;
      for (const auto& [k, v] : job.command_config) {
        yaml_emit(out, k, v);
      }
      out << YAML::EndMap;
    }
    if (!job.task_configs.empty()) {
      out << YAML::Key << "tasks" << YAML::Value << YAML::BeginSeq;
      for (const auto& task : job.task_configs) {
        out << YAML::BeginMap;
        yaml_emit(out, "id", task.id);
        yaml_emit_if_not_empty(out, "command", task.command);
        yaml_emit_if_not_empty(out, "target_partition", task.target_partition);
        if (!task.config.empty()) {
          out << YAML::Key << "config" << YAML::Value << YAML::BeginMap;
          for (const auto& [k, v] : task.config) {
            yaml_emit(out, k, v);
          }
          out << YAML::EndMap;
        }
        out << YAML::EndMap;
      }
      out << YAML::EndSeq;
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace jobflow
