#include <dhtexpo/utils/logger.hpp>
#include <cstdio>

LogLevel Logger::s_level = LogLevel::INFO;

namespace {
    esp_log_level_t toEspLevel(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return ESP_LOG_ERROR;
            case LogLevel::WARN:  return ESP_LOG_WARN;
            case LogLevel::INFO:  return ESP_LOG_INFO;
            case LogLevel::DEBUG: return ESP_LOG_DEBUG;
        }
        return ESP_LOG_INFO;
    }
}

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

bool Logger::enabled(LogLevel level) {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(s_level);
}

void Logger::setEspLogLevel(const char* tag, esp_log_level_t level) {
    esp_log_level_set(tag, level);
}

void Logger::write(LogLevel level, const char* tag, const char* fmt, ...) {
    if (!enabled(level)) {
        return;
    }

    char buffer[LOGGER_MAX_MESSAGE_LEN];
    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    const esp_log_level_t esp_level = toEspLevel(level);
    if (n < 0) {
        ESP_LOG_LEVEL(esp_level, tag, "%s", "formatting error");
        return;
    }
    // Over-long messages are cut at the buffer size
    buffer[sizeof(buffer) - 1] = '\0';
    ESP_LOG_LEVEL(esp_level, tag, "%s", buffer);
}
