#ifndef ISOFETCH_UTILS_LOGGER_HPP_
#define ISOFETCH_UTILS_LOGGER_HPP_

#include <cstddef>
#include <optional>
#include <sstream>
#include <string>

namespace isofetch {
namespace utils {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

struct LogConfig {
  std::string logDir;     // directory holding isofetch.log
  size_t maxFileSize;     // rotate once the file reaches this size
  size_t maxBackupFiles;  // isofetch.log.1 .. isofetch.log.N
  LogLevel minLevel;
  bool toConsole;
  bool toFile;
  LogConfig()
      : logDir("logs"),
        maxFileSize(10 * 1024 * 1024),  // 10 MB
        maxBackupFiles(3),
        minLevel(LogLevel::INFO),
        toConsole(true),
        toFile(true) {}
};

std::optional<LogLevel> parseLogLevel(const std::string& name);
const char* logLevelName(LogLevel level);

class Logger {
 public:
  // Without initialize() messages only go to the console.
  static void initialize(const LogConfig& config = LogConfig());
  static void shutdown();
  static bool enabled(LogLevel level);

  class LogStream {
   public:
    LogStream(LogLevel level, const char* file, const char* function, int line);
    ~LogStream();

    template <typename T>
    LogStream& operator<<(const T& msg) {
      if (enabled_) oss_ << msg;
      return *this;
    }

   private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream oss_;
  };

 private:
  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

}  // namespace utils
}  // namespace isofetch

// LOG(INFO) << "message";
#define LOG(level)                                                \
  ::isofetch::utils::Logger::LogStream(                           \
      ::isofetch::utils::LogLevel::level, __FILE__, __FUNCTION__, \
      __LINE__)

#endif  // ISOFETCH_UTILS_LOGGER_HPP_
