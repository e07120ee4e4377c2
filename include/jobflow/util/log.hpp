#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <unistd.h>

namespace jobflow::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

// Driver calls are made from caller threads (CLI tools, controllers, tests),
// so every line is formatted on the caller and written under one lock.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::mutex mu_;
  std::FILE* sink_{stderr};
  bool owns_sink_{false};
  bool colored_{::isatty(STDERR_FILENO) == 1};

  auto close_sink() -> void {
    if (owns_sink_ && sink_) {
      std::fclose(sink_);
    }
    sink_ = stderr;
    owns_sink_ = false;
  }

public:
  Logger() = default;
  ~Logger() {
    std::lock_guard lock(mu_);
    close_sink();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  // Appends to `path`; an empty path restores stderr.
  auto set_file(const std::string& path) -> bool {
    std::lock_guard lock(mu_);
    close_sink();
    colored_ = path.empty() && ::isatty(STDERR_FILENO) == 1;
    if (path.empty()) {
      return true;
    }
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    sink_ = f;
    owns_sink_ = true;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::seconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    auto message = std::format(fmt, std::forward<Args>(args)...);

    std::lock_guard lock(mu_);
    std::string line;
    line.reserve(message.size() + 48);
    if (colored_) {
      std::format_to(std::back_inserter(line),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                     level_color(level), level_name(level), "\033[0m", tid,
                     message);
    } else {
      std::format_to(std::back_inserter(line),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                     level_name(level), tid, message);
    }
    std::fputs(line.c_str(), sink_);
    std::fflush(sink_);
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace jobflow::log
