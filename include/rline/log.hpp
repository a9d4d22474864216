#pragma once
#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace rline {

enum class LogLevel : int {
  Debug = 0,
  Info  = 1,
  Warn  = 2,
  Error = 3,
};

const char* level_name(LogLevel level);

// Leveled log sink handed to the engine by reference.
// Implementations must be safe to call from several worker threads.
class Logger {
public:
  virtual ~Logger() = default;

  virtual void write(LogLevel level, std::string_view message) = 0;
  virtual bool enabled(LogLevel level) const { (void)level; return true; }

  template <typename... Args>
  void log(LogLevel level, Args&&... args) {
    if (!enabled(level)) return;
    std::ostringstream os;
    (os << ... << std::forward<Args>(args));
    write(level, os.str());
  }

  template <typename... Args> void debug(Args&&... a) { log(LogLevel::Debug, std::forward<Args>(a)...); }
  template <typename... Args> void info(Args&&... a)  { log(LogLevel::Info,  std::forward<Args>(a)...); }
  template <typename... Args> void warn(Args&&... a)  { log(LogLevel::Warn,  std::forward<Args>(a)...); }
  template <typename... Args> void error(Args&&... a) { log(LogLevel::Error, std::forward<Args>(a)...); }
};

class NullLogger final : public Logger {
public:
  void write(LogLevel, std::string_view) override {}
  bool enabled(LogLevel) const override { return false; }
};

// "[level] message" lines, filtered by a minimum level.
class StreamLogger final : public Logger {
public:
  explicit StreamLogger(std::ostream& out, LogLevel min_level = LogLevel::Info)
    : out_(out), min_level_(min_level) {}

  void write(LogLevel level, std::string_view message) override;
  bool enabled(LogLevel level) const override {
    return static_cast<int>(level) >= static_cast<int>(min_level_.load(std::memory_order_relaxed));
  }

  void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }

private:
  std::ostream& out_;
  std::atomic<LogLevel> min_level_;
  std::mutex mu_;
};

// Shared discard sink for callers that do not care about diagnostics.
Logger& null_logger();

} // namespace rline
