#pragma once

#include "nudge/core/constants.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace nudge::log {

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

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Asynchronous logger. Lines are formatted on the calling thread and
// written by a single writer thread; before start() and after stop() they
// are written synchronously.
class Logger {
  static constexpr std::size_t kMaxPending = 8192;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  std::FILE* out_{stdout};
  bool colored_{true};
  std::thread writer_;

  auto write_batch(const std::vector<std::string>& batch) -> void {
    for (const auto& line : batch) {
      std::fputs(line.c_str(), out_);
    }
    std::fflush(out_);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(64);

    while (true) {
      {
        std::unique_lock lock(mu_);
        cv_.wait_for(lock, timing::kLogIdleWait, [this] {
          return !pending_.empty() ||
                 !running_.load(std::memory_order_acquire);
        });
        while (!pending_.empty() && batch.size() < 64) {
          batch.push_back(std::move(pending_.front()));
          pending_.pop_front();
        }
        if (batch.empty() && !running_.load(std::memory_order_acquire))
          break;
      }
      write_batch(batch);
      batch.clear();
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (out_ != stdout) {
      std::fclose(out_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    if (!running_.exchange(false))
      return;
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Must be called before start().
  auto set_output_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f)
      return false;
    std::lock_guard lock(mu_);
    if (out_ != stdout) {
      std::fclose(out_);
    }
    out_ = f;
    colored_ = false;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    std::string line;
    if (colored_) {
      line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                         level_color(level), level_name(level), "\033[0m",
                         tid, std::format(fmt, std::forward<Args>(args)...));
    } else {
      line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                         level_name(level), tid,
                         std::format(fmt, std::forward<Args>(args)...));
    }

    std::unique_lock lock(mu_);
    if (!running_.load(std::memory_order_acquire) ||
        pending_.size() >= kMaxPending) {
      std::fputs(line.c_str(), out_);
      std::fflush(out_);
      return;
    }
    pending_.push_back(std::move(line));
    lock.unlock();
    cv_.notify_one();
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
  logger().set_level(parse_level(name));
}

inline auto set_output_file(const std::string& path) -> bool {
  return logger().set_output_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
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

}  // namespace nudge::log
