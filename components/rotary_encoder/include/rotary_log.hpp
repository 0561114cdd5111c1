#ifndef ROTARY_LOG_HPP
#define ROTARY_LOG_HPP

#include <string>
#include <fmt/printf.h>

typedef enum {
    ROTARY_LOG_NONE,       // 不输出
    ROTARY_LOG_ERROR,
    ROTARY_LOG_WARN,
    ROTARY_LOG_INFO,
    ROTARY_LOG_DEBUG,
    ROTARY_LOG_VERBOSE,
} rotary_log_level_t;

void rotary_log_level_set(rotary_log_level_t level);
rotary_log_level_t rotary_log_level_get();

// "error" "warn" "info" "debug" "verbose" "none"，无法识别时返回fallback
rotary_log_level_t rotary_log_level_from_string(const char* value, rotary_log_level_t fallback);

bool rotary_log_enabled(rotary_log_level_t level);
void rotary_log_write(rotary_log_level_t level, const char* tag, const std::string& message);
void rotary_log_flush();

#define ROTARY_LOG_AT_LEVEL(level, tag, format, ...) do {                              \
        if (rotary_log_enabled(level)) {                                            \
            rotary_log_write(level, tag, fmt::sprintf(format, ##__VA_ARGS__));      \
        }                                                                           \
    } while (0)

#define ROTARY_LOGE(tag, format, ...) ROTARY_LOG_AT_LEVEL(ROTARY_LOG_ERROR,   tag, format, ##__VA_ARGS__)
#define ROTARY_LOGW(tag, format, ...) ROTARY_LOG_AT_LEVEL(ROTARY_LOG_WARN,    tag, format, ##__VA_ARGS__)
#define ROTARY_LOGI(tag, format, ...) ROTARY_LOG_AT_LEVEL(ROTARY_LOG_INFO,    tag, format, ##__VA_ARGS__)
#define ROTARY_LOGD(tag, format, ...) ROTARY_LOG_AT_LEVEL(ROTARY_LOG_DEBUG,   tag, format, ##__VA_ARGS__)
#define ROTARY_LOGV(tag, format, ...) ROTARY_LOG_AT_LEVEL(ROTARY_LOG_VERBOSE, tag, format, ##__VA_ARGS__)

#endif
