#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jobflow {

enum class StoreBackend : std::uint8_t { Memory, Sqlite };

[[nodiscard]] constexpr auto store_backend_name(StoreBackend backend) noexcept
    -> std::string_view {
  switch (backend) {
    case StoreBackend::Memory: return "memory";
    case StoreBackend::Sqlite: return "sqlite";
  }
  return "memory";
}

[[nodiscard]] constexpr auto parse_store_backend(std::string_view name) noexcept
    -> std::optional<StoreBackend> {
  if (name == "memory") return StoreBackend::Memory;
  if (name == "sqlite") return StoreBackend::Sqlite;
  return std::nullopt;
}

struct StoreConfig {
  StoreBackend backend{StoreBackend::Memory};
  std::string db_file{"jobflow.db"};
  int busy_timeout_ms{5000};
};

struct DriverConfig {
  std::string cluster{"jobflow"};
  std::chrono::milliseconds default_timeout{std::chrono::minutes(3)};
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds stop_poll_interval{1000};
  int max_update_attempts{64};
};

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct SystemConfig {
  StoreConfig store;
  DriverConfig driver;
  LogConfig log;
};

}  // namespace jobflow
