#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdarg>
#include <cstdint>
#include <esp_log.h>

// Fixed-size formatting buffer to avoid heap usage
#ifndef LOGGER_MAX_MESSAGE_LEN
#define LOGGER_MAX_MESSAGE_LEN 256
#endif

// Numeric values match the log_level NVS key
enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static bool enabled(LogLevel level);

    static void write(LogLevel level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    // Raise or lower ESP-IDF's own per-tag level (e.g. to quiet "wifi" or "httpd")
    static void setEspLogLevel(const char* tag, esp_log_level_t level);

private:
    static LogLevel s_level;
};

#define LOG_ERROR(TAG, FMT, ...) Logger::write(LogLevel::ERROR, (TAG), (FMT), ##__VA_ARGS__)
#define LOG_WARN(TAG, FMT, ...)  Logger::write(LogLevel::WARN,  (TAG), (FMT), ##__VA_ARGS__)
#define LOG_INFO(TAG, FMT, ...)  Logger::write(LogLevel::INFO,  (TAG), (FMT), ##__VA_ARGS__)
#define LOG_DEBUG(TAG, FMT, ...) Logger::write(LogLevel::DEBUG, (TAG), (FMT), ##__VA_ARGS__)

#endif // LOGGER_HPP
