#include "browser_interface/utils/logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace browser_interface {
namespace utils {

namespace {
    constexpr std::string_view ANSI_RESET = "\033[0m";
    constexpr std::string_view ANSI_RED = "\033[31m";
    constexpr std::string_view ANSI_YELLOW = "\033[33m";
    constexpr std::string_view ANSI_GREEN = "\033[32m";
    constexpr std::string_view ANSI_BLUE = "\033[36m";

    std::tm local_time(std::time_t time) {
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif
        return tm_buf;
    }

    std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
        const auto tm_buf = local_time(std::chrono::system_clock::to_time_t(tp));
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(2) << tm_buf.tm_hour << ":"
            << std::setw(2) << tm_buf.tm_min << ":"
            << std::setw(2) << tm_buf.tm_sec << "."
            << std::setw(3) << ms.count();
        return oss.str();
    }

    std::string_view level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error: return "ERROR";
            default: return "UNKNOWN";
        }
    }

#ifdef _WIN32
    bool enable_ansi_colors() {
        HANDLE hErr = GetStdHandle(STD_ERROR_HANDLE);
        if (hErr == INVALID_HANDLE_VALUE) return false;

        DWORD dwMode = 0;
        if (!GetConsoleMode(hErr, &dwMode)) return false;

        dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(hErr, dwMode) != 0;
    }
#endif

    bool is_terminal() {
#ifdef _WIN32
        return _isatty(_fileno(stderr));
#else
        return isatty(fileno(stderr));
#endif
    }
}

// Logger implementation
Logger::Logger(LogLevel min_level) : m_min_level(min_level) {}

void Logger::add_sink(SinkPtr sink) {
    std::lock_guard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::debug(std::string_view component, std::string_view message,
                   SourceLocation location) {
    log(LogLevel::Debug, component, message, location);
}

void Logger::info(std::string_view component, std::string_view message,
                  SourceLocation location) {
    log(LogLevel::Info, component, message, location);
}

void Logger::warning(std::string_view component, std::string_view message,
                     SourceLocation location) {
    log(LogLevel::Warning, component, message, location);
}

void Logger::error(std::string_view component, std::string_view message,
                   SourceLocation location) {
    log(LogLevel::Error, component, message, location);
}

void Logger::flush() {
    std::lock_guard lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message,
                 SourceLocation location) {
    std::lock_guard lock(m_mutex);
    if (level < m_min_level || level == LogLevel::None) return;

    LogMessage log_msg{
        .m_level = level,
        .m_timestamp = std::chrono::system_clock::now(),
        .m_component = std::string(component),
        .m_message = std::string(message),
        .m_location = location
    };

    for (auto& sink : m_sinks) {
        sink->write(log_msg);
    }
}

// ConsoleSink implementation
ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors && is_terminal()) {
#ifdef _WIN32
    if (m_use_colors) {
        m_use_colors = enable_ansi_colors();
    }
#endif
}

void ConsoleSink::write(const LogMessage& message) {
    auto formatted = format_message(message);
    std::clog << colorize(formatted, message.m_level) << '\n';
}

void ConsoleSink::flush() {
    std::clog.flush();
}

std::string ConsoleSink::colorize(std::string_view text, LogLevel level) const {
    if (!m_use_colors) return std::string(text);

    std::string_view color;
    switch (level) {
        case LogLevel::Debug: color = ANSI_BLUE; break;
        case LogLevel::Info: color = ANSI_GREEN; break;
        case LogLevel::Warning: color = ANSI_YELLOW; break;
        case LogLevel::Error: color = ANSI_RED; break;
        default: return std::string(text);
    }

    std::ostringstream oss;
    oss << color << text << ANSI_RESET;
    return oss.str();
}

std::string ConsoleSink::format_message(const LogMessage& message) const {
    std::ostringstream oss;
    oss << "[" << format_timestamp(message.m_timestamp) << "] "
        << "[" << level_to_string(message.m_level) << "] "
        << "[" << message.m_component << "] "
        << message.m_message;
    return oss.str();
}

// FileSink implementation
FileSink::FileSink(const std::filesystem::path& path, bool truncate) {
    std::error_code ec;
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path(), ec)) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    auto mode = std::ios::out | (truncate ? std::ios::trunc : std::ios::app);

    m_file.open(path, mode);
    if (m_file.is_open() && !truncate) {
        const auto tm_buf = local_time(std::chrono::system_clock::to_time_t(
            std::chrono::system_clock::now()));
        m_file << "\n=== Log session started at "
               << std::setfill('0')
               << std::setw(4) << (tm_buf.tm_year + 1900) << "-"
               << std::setw(2) << (tm_buf.tm_mon + 1) << "-"
               << std::setw(2) << tm_buf.tm_mday << " "
               << std::setw(2) << tm_buf.tm_hour << ":"
               << std::setw(2) << tm_buf.tm_min << ":"
               << std::setw(2) << tm_buf.tm_sec << " ===\n";
        m_file.flush();
    }
}

FileSink::~FileSink() {
    if (m_file.is_open()) {
        m_file.close();
    }
}

void FileSink::write(const LogMessage& message) {
    if (m_file.is_open()) {
        m_file << format_message(message) << '\n';
    }
}

void FileSink::flush() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

bool FileSink::is_open() const {
    return m_file.is_open();
}

std::string FileSink::format_message(const LogMessage& message) const {
    std::ostringstream oss;
    oss << "[" << format_timestamp(message.m_timestamp) << "] "
        << "[" << level_to_string(message.m_level) << "] "
        << "[" << message.m_component << "] "
        << message.m_message << " ("
        << std::filesystem::path(message.m_location.file_name()).filename().string() << ":"
        << message.m_location.line() << ")";
    return oss.str();
}

// LoggerManager implementation
std::unique_ptr<Logger> LoggerManager::s_logger;
std::mutex LoggerManager::s_init_mutex;

Logger& LoggerManager::get_instance() {
    std::lock_guard<std::mutex> lock(s_init_mutex);
    if (!s_logger) {
        s_logger = create_default_logger();
    }
    return *s_logger;
}

void LoggerManager::set_instance(std::unique_ptr<Logger> logger) {
    std::lock_guard<std::mutex> lock(s_init_mutex);
    s_logger = std::move(logger);
}

std::unique_ptr<Logger> LoggerManager::create_default_logger() {
    auto logger = std::make_unique<Logger>(LogLevel::Warning);
    logger->add_sink(std::make_unique<ConsoleSink>(true));
    return logger;
}

} // namespace utils
} // namespace browser_interface
