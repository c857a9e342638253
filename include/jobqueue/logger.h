#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "jobqueue/types.h"

namespace jobqueue {

enum class LogLevel { Debug, Info, Warn, Error };

// Accepts "debug", "info", "warn"/"warning", "error" in any case.
std::optional<LogLevel> parse_log_level(const std::string& name);

// Scopes a log line to one job: logger.info(ForJob{id}, "...")
struct ForJob {
  JobId id;
};

class Logger {
public:
  using Field  = std::pair<std::string, std::string>;
  using Fields = std::vector<Field>;

  Logger();
  explicit Logger(std::ostream& out);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel lvl);
  LogLevel level() const;

  void set_json(bool on);
  bool json_enabled() const;

  void debug(const std::string& msg);
  void info (const std::string& msg);
  void warn (const std::string& msg);
  void error(const std::string& msg);

  void debug(const std::string& msg, Fields fields);
  void info (const std::string& msg, Fields fields);
  void warn (const std::string& msg, Fields fields);
  void error(const std::string& msg, Fields fields);

  void debug(const ForJob& job, const std::string& msg, Fields fields = {});
  void info (const ForJob& job, const std::string& msg, Fields fields = {});
  void warn (const ForJob& job, const std::string& msg, Fields fields = {});
  void error(const ForJob& job, const std::string& msg, Fields fields = {});

private:
  void log_(LogLevel lvl, const JobId* job_id, const std::string& msg, const Fields* fields);

  static const char* level_to_cstr(LogLevel lvl);
  static std::string now_timestamp();
  static std::string json_escape(const std::string& s);

private:
  std::ostream* out_{nullptr};
  LogLevel min_level_{LogLevel::Info};

  std::atomic<bool> json_{false};
  std::atomic<std::uint64_t> seq_{0};

  mutable std::mutex mtx_;
};

} // namespace jobqueue
