#include <rline/log.hpp>

namespace rline {

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}

void StreamLogger::write(LogLevel level, std::string_view message) {
  if (!enabled(level)) return;
  std::lock_guard<std::mutex> lock(mu_);
  out_ << '[' << level_name(level) << "] " << message << '\n';
}

Logger& null_logger() {
  static NullLogger sink;
  return sink;
}

} // namespace rline
