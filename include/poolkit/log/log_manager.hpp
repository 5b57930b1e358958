#pragma once

#include <string>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"

namespace poolkit {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

// Normalized logging options parsed from a config file and applied to glog flags.
struct LoggingOptions {
  std::string log_dir;
  bool simple_format = false;  // custom sink: "<ts> [I] message" into <log_dir>/app.log
  bool json_format = false;    // custom sink: JSON lines into <log_dir>/app.jsonl
  // Crash diagnostics: installs glog failure signal handler once per process.
  bool install_failure_signal_handler = false;
  bool logtostderr = true;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  bool log_prefix = true;
  int min_log_level = 0;     // INFO=0, WARNING=1, ERROR=2, FATAL=3
  int stderr_threshold = 2;  // glog treats this as ERROR by default
  int verbosity = 0;         // VLOG level; 1 traces object lifecycle, 2 traces capacity tokens
};

// Process-wide logging facade. Library code logs through here so glog headers stay private.
class POOLKIT_API LogManager {
 public:
  // Initialize glog with an application name and optional config file.
  // Returns kInvalidArgument for an empty app name, kNotFound/kInvalidArgument for
  // an unreadable or malformed config. Repeated calls after success return kOk.
  static api::Status Init(const std::string& app_name, const std::string& config_path = {});

  // Reload configuration at runtime. On failure the previous options stay in force.
  static api::Status Reload(const std::string& config_path);

  static LoggingOptions CurrentOptions();

  // Shutdown glog. Call once during program teardown.
  static void Shutdown();

  // Usable before Init; glog then writes to stderr.
  static void Log(LogSeverity severity, const std::string& message);

  static bool VerboseEnabled(int level);
  static void Verbose(int level, const std::string& message);

 private:
  static api::Status ApplyOptions(const LoggingOptions& options);
  static api::Result<LoggingOptions> LoadFromFile(const std::string& path);
};

}  // namespace log
}  // namespace poolkit
