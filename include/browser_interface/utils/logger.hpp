#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace browser_interface::utils {

enum class LogLevel : std::uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  None = 4
};

struct SourceLocation {
  [[nodiscard]] const char* file_name() const { return m_filename; }
  [[nodiscard]] int line() const { return m_line_number; }

  const char* m_filename = "unknown";
  int m_line_number = 0;
};

struct LogMessage {
  LogLevel m_level;
  std::chrono::system_clock::time_point m_timestamp;
  std::string m_component;
  std::string m_message;
  SourceLocation m_location;
};

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(const LogMessage& message) = 0;
  virtual void flush() = 0;
};

class Logger {
 public:
  using SinkPtr = std::unique_ptr<LogSink>;

  explicit Logger(LogLevel min_level = LogLevel::Info);
  ~Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void add_sink(SinkPtr sink);

  void debug(std::string_view component, std::string_view message,
             SourceLocation location = {});
  void info(std::string_view component, std::string_view message,
            SourceLocation location = {});
  void warning(std::string_view component, std::string_view message,
               SourceLocation location = {});
  void error(std::string_view component, std::string_view message,
             SourceLocation location = {});

  void flush();

 private:
  void log(LogLevel level, std::string_view component, std::string_view message,
           SourceLocation location);

  LogLevel m_min_level;
  std::vector<SinkPtr> m_sinks;
  std::mutex m_mutex;
};

// Writes to stderr so stdout stays free for the host program
class ConsoleSink : public LogSink {
 public:
  explicit ConsoleSink(bool use_colors = true);
  void write(const LogMessage& message) override;
  void flush() override;

 private:
  bool m_use_colors;
  [[nodiscard]] std::string colorize(std::string_view text,
                                     LogLevel level) const;
  [[nodiscard]] std::string format_message(const LogMessage& message) const;
};

class FileSink : public LogSink {
 public:
  explicit FileSink(const std::filesystem::path& path, bool truncate = false);
  ~FileSink() override;

  void write(const LogMessage& message) override;
  void flush() override;
  [[nodiscard]] bool is_open() const;

 private:
  std::ofstream m_file;
  [[nodiscard]] std::string format_message(const LogMessage& message) const;
};

class LoggerManager {
 public:
  static Logger& get_instance();
  static void set_instance(std::unique_ptr<Logger> logger);
  static std::unique_ptr<Logger> create_default_logger();

 private:
  static std::unique_ptr<Logger> s_logger;
  static std::mutex s_init_mutex;
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None: return "none";
        default: return "info";
    }
}

inline std::optional<LogLevel> parse_log_level(std::string_view str) {
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warning" || str == "warn") return LogLevel::Warning;
    if (str == "error") return LogLevel::Error;
    if (str == "none") return LogLevel::None;
    return std::nullopt;
}

#define BI_LOG_DEBUG(component, message)                                   \
  browser_interface::utils::LoggerManager::get_instance().debug(           \
      component, message, {__FILE__, __LINE__})

#define BI_LOG_INFO(component, message)                                    \
  browser_interface::utils::LoggerManager::get_instance().info(            \
      component, message, {__FILE__, __LINE__})

#define BI_LOG_WARNING(component, message)                                 \
  browser_interface::utils::LoggerManager::get_instance().warning(         \
      component, message, {__FILE__, __LINE__})

#define BI_LOG_ERROR(component, message)                                   \
  browser_interface::utils::LoggerManager::get_instance().error(           \
      component, message, {__FILE__, __LINE__})

}  // namespace browser_interface::utils
