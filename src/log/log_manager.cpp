#include "poolkit/log/log_manager.hpp"

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#if defined(_WIN32)
#include <direct.h>
#include <sys/stat.h>
#else
#include <sys/stat.h>
#include <sys/types.h>
#endif
#include <glog/logging.h>

namespace poolkit {
namespace log {
namespace {

#define PK_LOG_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kLog)

struct GlobalState {
  std::mutex mu;
  LoggingOptions options;
  std::unique_ptr<google::LogSink> sink;
  bool initialized = false;
  bool failure_handler_installed = false;
};

GlobalState& State() {
  static GlobalState state;
  return state;
}

bool IsPathSeparator(char c) { return c == '/' || c == '\\'; }

std::string BaseName(const std::string& path) {
  std::size_t end = path.size();
  while (end > 0 && IsPathSeparator(path[end - 1])) --end;
  if (end == 0) return std::string();
  const std::size_t pos = path.find_last_of("/\\", end - 1);
  if (pos == std::string::npos) return path.substr(0, end);
  return path.substr(pos + 1, end - pos - 1);
}

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (IsPathSeparator(left[left.size() - 1])) return left + right;
  return left + "/" + right;
}

bool DirectoryExists(const std::string& path) {
#if defined(_WIN32)
  struct _stat info;
  if (_stat(path.c_str(), &info) != 0) return false;
#else
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
#endif
  return (info.st_mode & S_IFDIR) != 0;
}

// mkdir -p
bool CreateDirectories(const std::string& path) {
  if (path.empty()) return false;
  std::size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of("/\\", pos + 1);
    const std::string prefix = path.substr(0, pos);
    if (prefix.empty() || DirectoryExists(prefix)) continue;
    errno = 0;
#if defined(_WIN32)
    const int rc = _mkdir(prefix.c_str());
#else
    const int rc = mkdir(prefix.c_str(), 0755);
#endif
    if (rc != 0 && errno != EEXIST) return false;
  }
  return DirectoryExists(path);
}

std::string Trim(const std::string& s) {
  const std::size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  const std::size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ParseBool(const std::string& value, bool* out) {
  const std::string v = ToLower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& value, int* out) {
  if (value.empty()) return false;
  char* end = NULL;
  errno = 0;
  const long parsed = std::strtol(value.c_str(), &end, 10);
  if (errno != 0 || end == NULL || *end != '\0') return false;
  *out = static_cast<int>(parsed);
  return true;
}

bool ParseLevel(const std::string& value, int* out) {
  const std::string v = ToLower(value);
  if (v == "info") {
    *out = 0;
  } else if (v == "warning" || v == "warn") {
    *out = 1;
  } else if (v == "error") {
    *out = 2;
  } else if (v == "fatal") {
    *out = 3;
  } else if (!ParseInt(v, out) || *out < 0 || *out > 3) {
    return false;
  }
  return true;
}

std::string StripTrailingComment(const std::string& value) {
  std::size_t pos = value.find('#');
  const std::size_t slash = value.find("//");
  if (slash != std::string::npos) pos = std::min(pos, slash);
  return pos == std::string::npos ? value : Trim(value.substr(0, pos));
}

// Applies one "key = value" pair. Unknown keys are accepted and ignored.
bool ApplyKey(const std::string& key, const std::string& value, LoggingOptions* options) {
  struct BoolKey {
    const char* name;
    bool LoggingOptions::*field;
  };
  static const BoolKey kBoolKeys[] = {
      {"simple_format", &LoggingOptions::simple_format},
      {"json_format", &LoggingOptions::json_format},
      {"install_failure_signal_handler", &LoggingOptions::install_failure_signal_handler},
      {"crash_stacktrace", &LoggingOptions::install_failure_signal_handler},
      {"logtostderr", &LoggingOptions::logtostderr},
      {"alsologtostderr", &LoggingOptions::alsologtostderr},
      {"colorlogtostderr", &LoggingOptions::colorlogtostderr},
      {"log_prefix", &LoggingOptions::log_prefix},
  };
  for (std::size_t i = 0; i < sizeof(kBoolKeys) / sizeof(kBoolKeys[0]); ++i) {
    if (key == kBoolKeys[i].name) return ParseBool(value, &(options->*kBoolKeys[i].field));
  }

  if (key == "log_dir") {
    options->log_dir = value;
    return true;
  }
  if (key == "minloglevel") return ParseLevel(value, &options->min_log_level);
  if (key == "stderrthreshold") return ParseLevel(value, &options->stderr_threshold);
  if (key == "v" || key == "verbosity") return ParseInt(value, &options->verbosity);
  return true;
}

api::Result<LoggingOptions> ParseConfig(std::istream& input) {
  LoggingOptions options;
  std::string line;
  int lineno = 0;
  while (std::getline(input, line)) {
    ++lineno;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed.compare(0, 2, "//") == 0) continue;

    const std::size_t sep = trimmed.find_first_of("=:");
    if (sep == std::string::npos) continue;

    const std::string key = ToLower(Trim(trimmed.substr(0, sep)));
    const std::string value = StripTrailingComment(Trim(trimmed.substr(sep + 1)));
    if (!ApplyKey(key, value, &options)) {
      std::ostringstream msg;
      msg << "invalid value for '" << key << "' at line " << lineno;
      return api::Result<LoggingOptions>(
          PK_LOG_STATUS(api::StatusCode::kInvalidArgument, msg.str()));
    }
  }
  return api::Result<LoggingOptions>(options);
}

std::string TimestampPrefix() {
  using namespace std::chrono;
  const system_clock::time_point now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  const long long micros =
      duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000LL;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
  return std::string(buf);
}

char LevelChar(google::LogSeverity severity) {
  const char levels[] = {'I', 'W', 'E', 'F'};
  const int idx = static_cast<int>(severity);
  return levels[idx < 0 ? 0 : (idx > 3 ? 3 : idx)];
}

std::string JsonEscape(const std::string& input) {
  std::ostringstream out;
  for (std::size_t i = 0; i < input.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(input[i]);
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (c < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
              << std::dec;
        } else {
          out << static_cast<char>(c);
        }
        break;
    }
  }
  return out.str();
}

class FormattedSink : public google::LogSink {
 public:
  enum class Mode { kSimple, kJson };

  FormattedSink(const std::string& file_path, Mode mode)
      : stream_(file_path.c_str(), std::ios::app), mode_(mode) {}

  bool is_open() const { return stream_.is_open(); }

  void send(google::LogSeverity severity, const char*, const char*, int, const std::tm*,
            const char* message, size_t message_len) override {
    std::string msg(message ? message : "", message ? message_len : 0);
    while (!msg.empty() && (msg[msg.size() - 1] == '\n' || msg[msg.size() - 1] == '\r')) {
      msg.erase(msg.size() - 1);
    }
    std::ostringstream line;
    if (mode_ == Mode::kSimple) {
      line << TimestampPrefix() << " [" << LevelChar(severity) << "] " << msg;
    } else {
      line << "{\"ts\":\"" << TimestampPrefix() << "\",\"level\":\"" << LevelChar(severity)
           << "\",\"message\":\"" << JsonEscape(msg) << "\"}";
    }
    std::lock_guard<std::mutex> lock(mu_);
    stream_ << line.str() << '\n';
    stream_.flush();
  }

 private:
  std::mutex mu_;
  std::ofstream stream_;
  Mode mode_;
};

void DetachSinkLocked(GlobalState& state) {
  if (state.sink) {
    google::RemoveLogSink(state.sink.get());
    state.sink.reset();
  }
}

}  // namespace

api::Status LogManager::Init(const std::string& app_name, const std::string& config_path) {
  if (BaseName(app_name).empty()) {
    return PK_LOG_STATUS(api::StatusCode::kInvalidArgument, "app_name is empty");
  }
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (state.initialized) return api::Status::Ok();

  api::Result<LoggingOptions> options = LoadFromFile(config_path);
  if (!options.ok()) return options.status();

  // glog keeps the pointer; the string must outlive logging.
  static std::string program_name;
  program_name = BaseName(app_name);
  FLAGS_logtostderr = true;
  google::InitGoogleLogging(program_name.c_str());

  api::Status applied = ApplyOptions(options.value());
  if (!applied.ok()) {
    DetachSinkLocked(state);
    google::ShutdownGoogleLogging();
    return applied;
  }
  state.initialized = true;
  return api::Status::Ok();
}

api::Status LogManager::Reload(const std::string& config_path) {
  if (config_path.empty()) {
    return PK_LOG_STATUS(api::StatusCode::kInvalidArgument, "config_path is empty");
  }
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) {
    return PK_LOG_STATUS(api::StatusCode::kNotInitialized, "LogManager::Init was not called");
  }
  api::Result<LoggingOptions> options = LoadFromFile(config_path);
  if (!options.ok()) return options.status();
  return ApplyOptions(options.value());
}

LoggingOptions LogManager::CurrentOptions() {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  return state.options;
}

void LogManager::Shutdown() {
  GlobalState& state = State();
  std::lock_guard<std::mutex> lock(state.mu);
  if (!state.initialized) return;
  DetachSinkLocked(state);
  google::ShutdownGoogleLogging();
  state.options = LoggingOptions();
  state.initialized = false;
}

void LogManager::Log(LogSeverity severity, const std::string& message) {
  int level = static_cast<int>(severity);
  level = level < 0 ? 0 : (level > 3 ? 3 : level);
  google::LogMessage(__FILE__, __LINE__, static_cast<google::LogSeverity>(level)).stream()
      << message;
}

bool LogManager::VerboseEnabled(int level) { return VLOG_IS_ON(level); }

void LogManager::Verbose(int level, const std::string& message) {
  if (!VLOG_IS_ON(level)) return;
  google::LogMessage(__FILE__, __LINE__, google::GLOG_INFO).stream() << message;
}

// Called with State().mu held.
api::Status LogManager::ApplyOptions(const LoggingOptions& options) {
  GlobalState& state = State();
  if (!options.log_dir.empty() && !CreateDirectories(options.log_dir)) {
    return PK_LOG_STATUS(api::StatusCode::kIoError,
                         "cannot create log_dir: " + options.log_dir);
  }

  FLAGS_log_dir = options.log_dir;
  FLAGS_logtostderr = options.logtostderr;
  FLAGS_alsologtostderr = options.alsologtostderr;
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_log_prefix = options.log_prefix;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  if (options.install_failure_signal_handler && !state.failure_handler_installed) {
    google::InstallFailureSignalHandler();
    state.failure_handler_installed = true;
  }

  // Rebuild the custom sink on every apply so a reload can switch mode or path.
  DetachSinkLocked(state);
  if (options.simple_format || options.json_format) {
    const std::string base = options.log_dir.empty() ? "." : options.log_dir;
    const bool use_json = options.json_format;
    std::unique_ptr<FormattedSink> sink(new FormattedSink(
        JoinPath(base, use_json ? "app.jsonl" : "app.log"),
        use_json ? FormattedSink::Mode::kJson : FormattedSink::Mode::kSimple));
    if (!sink->is_open()) {
      return PK_LOG_STATUS(api::StatusCode::kIoError, "cannot open log sink in " + base);
    }
    google::AddLogSink(sink.get());
    state.sink.reset(sink.release());
  }

  state.options = options;
  return api::Status::Ok();
}

api::Result<LoggingOptions> LogManager::LoadFromFile(const std::string& path) {
  if (path.empty()) return api::Result<LoggingOptions>(LoggingOptions());

  std::ifstream input(path.c_str());
  if (!input.is_open()) {
    return api::Result<LoggingOptions>(
        PK_LOG_STATUS(api::StatusCode::kNotFound, "logging config not found: " + path));
  }
  return ParseConfig(input);
}

#undef PK_LOG_STATUS

}  // namespace log
}  // namespace poolkit
