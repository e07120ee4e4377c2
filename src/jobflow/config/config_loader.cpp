#include "jobflow/config/config_loader.hpp"

#include "jobflow/config/yaml_utils.hpp"
#include "jobflow/store/memory_store.hpp"
#include "jobflow/store/sqlite_store.hpp"
#include "jobflow/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<jobflow::StoreConfig> {
  static bool decode(const Node& node, jobflow::StoreConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    auto backend =
        jobflow::yaml_get_or<std::string>(node, "backend", "memory");
    auto parsed = jobflow::parse_store_backend(backend);
    if (!parsed) {
      return false;
    }
    s.backend = *parsed;
    s.db_file = jobflow::yaml_get_or<std::string>(node, "db_file", "jobflow.db");
    s.busy_timeout_ms = jobflow::yaml_get_or(node, "busy_timeout_ms", 5000);
    return true;
  }
};

template <>
struct convert<jobflow::DriverConfig> {
  static bool decode(const Node& node, jobflow::DriverConfig& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.cluster = jobflow::yaml_get_or<std::string>(node, "cluster", "jobflow");
    d.default_timeout = std::chrono::milliseconds(
        jobflow::yaml_get_or<std::int64_t>(node, "default_timeout_ms", 180000));
    d.poll_interval = std::chrono::milliseconds(
        jobflow::yaml_get_or<std::int64_t>(node, "poll_interval_ms", 100));
    d.stop_poll_interval = std::chrono::milliseconds(
        jobflow::yaml_get_or<std::int64_t>(node, "stop_poll_interval_ms", 1000));
    d.max_update_attempts = jobflow::yaml_get_or(node, "max_update_attempts", 64);
    return d.poll_interval.count() > 0 && d.stop_poll_interval.count() > 0 &&
           d.max_update_attempts > 0 && !d.cluster.empty();
  }
};

template <>
struct convert<jobflow::LogConfig> {
  static bool decode(const Node& node, jobflow::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = jobflow::yaml_get_or<std::string>(node, "level", "info");
    l.file = jobflow::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<jobflow::SystemConfig> {
  static bool decode(const Node& node, jobflow::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto store = node["store"]) {
      c.store = store.as<jobflow::StoreConfig>();
    }
    if (auto driver = node["driver"]) {
      c.driver = driver.as<jobflow::DriverConfig>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<jobflow::LogConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace jobflow {

namespace {

void to_yaml(YAML::Emitter& out, const StoreConfig& s) {
  const StoreConfig defaults;
  out << YAML::BeginMap;
  yaml_emit(out, "backend", std::string(store_backend_name(s.backend)));
  if (s.db_file != defaults.db_file) {
    yaml_emit(out, "db_file", s.db_file);
  }
  if (s.busy_timeout_ms != defaults.busy_timeout_ms) {
    yaml_emit(out, "busy_timeout_ms", s.busy_timeout_ms);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const DriverConfig& d) {
  const DriverConfig defaults;
  out << YAML::BeginMap;
  yaml_emit(out, "cluster", d.cluster);
  if (d.default_timeout != defaults.default_timeout) {
    yaml_emit(out, "default_timeout_ms", d.default_timeout.count());
  }
  if (d.poll_interval != defaults.poll_interval) {
    yaml_emit(out, "poll_interval_ms", d.poll_interval.count());
  }
  if (d.stop_poll_interval != defaults.stop_poll_interval) {
    yaml_emit(out, "stop_poll_interval_ms", d.stop_poll_interval.count());
  }
  if (d.max_update_attempts != defaults.max_update_attempts) {
    yaml_emit(out, "max_update_attempts", d.max_update_attempts);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LogConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  yaml_emit_if_not_empty(out, "file", l.file);
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "store" << YAML::Value;
  to_yaml(out, config.store);
  out << YAML::Key << "driver" << YAML::Value;
  to_yaml(out, config.driver);
  out << YAML::Key << "log" << YAML::Value;
  to_yaml(out, config.log);
  out << YAML::EndMap;
  return out.c_str();
}

auto ConfigLoader::save_to_file(const SystemConfig& config,
                                std::string_view path) -> Result<void> {
  std::ofstream file{std::string(path)};
  if (!file.is_open()) {
    log::error("Failed to open config file for writing: {}", path);
    return fail(Error::FileOpenFailed);
  }
  file << to_string(config) << '\n';
  return ok();
}

auto apply_log_config(const LogConfig& config) -> Result<void> {
  log::set_level(config.level);
  if (!log::set_file(config.file)) {
    log::error("Failed to open log file: {}", config.file);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto make_store(const StoreConfig& config)
    -> Result<std::unique_ptr<MetadataStore>> {
  switch (config.backend) {
    case StoreBackend::Memory:
      return ok(std::unique_ptr<MetadataStore>(
          std::make_unique<InMemoryStore>()));
    case StoreBackend::Sqlite: {
      auto store =
          std::make_unique<SqliteStore>(config.db_file, config.busy_timeout_ms);
      if (auto r = store->open(); !r) {
        return fail(r.error());
      }
      return ok(std::unique_ptr<MetadataStore>(std::move(store)));
    }
  }
  return fail(Error::InvalidArgument);
}

}  // namespace jobflow
