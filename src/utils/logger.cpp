#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace isofetch {
namespace utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
std::string log_file_path;
LogConfig active_config;
bool file_enabled = false;

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// Caller holds log_mutex.
void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty() || !std::filesystem::exists(log_file_path, ec)) {
    return;
  }
  const auto size = std::filesystem::file_size(log_file_path, ec);
  if (ec || size < active_config.maxFileSize) return;

  log_file.close();
  for (size_t i = active_config.maxBackupFiles; i > 0; --i) {
    const std::string old_name =
        log_file_path + (i == 1 ? "" : ("." + std::to_string(i - 1)));
    const std::string new_name = log_file_path + "." + std::to_string(i);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  log_file.open(log_file_path, std::ios::trunc);
}

// Caller holds log_mutex.
void openLogFile() {
  std::error_code ec;
  std::filesystem::create_directories(active_config.logDir, ec);
  if (ec) {
    std::cerr << "Failed to create log directory " << active_config.logDir
              << ": " << ec.message() << std::endl;
    file_enabled = false;
    return;
  }
  log_file_path =
      (std::filesystem::path(active_config.logDir) / "isofetch.log").string();
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
    file_enabled = false;
  }
}
}  // namespace

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "INFO") return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL") return LogLevel::FATAL;
  return std::nullopt;
}

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) log_file.close();
  active_config = config;
  if (active_config.logDir.empty()) active_config.logDir = "logs";
  if (active_config.maxFileSize == 0) {
    active_config.maxFileSize = 10 * 1024 * 1024;
  }
  file_enabled = active_config.toFile;
  if (file_enabled) openLogFile();
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) {
    log_file.flush();
    log_file.close();
  }
  file_enabled = false;
}

bool Logger::enabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(log_mutex);
  return static_cast<int>(level) >= static_cast<int>(active_config.minLevel);
}

Logger::LogStream::LogStream(LogLevel level, const char* file, const char* func,
                             int line)
    : level_(level), enabled_(Logger::enabled(level)), oss_() {
  if (!enabled_) return;
  oss_ << "[" << logLevelName(level) << "] " << getCurrentTime() << " "
       << std::filesystem::path(file).filename().string() << ":" << line << " "
       << func << ": ";
}

Logger::LogStream::~LogStream() {
  if (!enabled_) return;
  oss_ << "\n";
  const std::string msg = oss_.str();
  std::lock_guard<std::mutex> lock(log_mutex);
  if (active_config.toConsole) {
    std::clog << msg;
    if (level_ >= LogLevel::ERROR) std::clog.flush();
  }
  if (file_enabled) {
    rotateLogsIfNeeded();
    if (log_file.is_open()) {
      log_file << msg;
      log_file.flush();
    }
  }
}

}  // namespace utils
}  // namespace isofetch
