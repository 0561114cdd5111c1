#include "rotary_log.hpp"

#include <mutex>
#include <strings.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static std::mutex s_logger_lock;
static rotary_log_level_t s_log_level = ROTARY_LOG_INFO;

static spdlog::level::level_enum to_spdlog_level(rotary_log_level_t level)
{
    switch (level) {
        case ROTARY_LOG_ERROR:   return spdlog::level::err;
        case ROTARY_LOG_WARN:    return spdlog::level::warn;
        case ROTARY_LOG_INFO:    return spdlog::level::info;
        case ROTARY_LOG_DEBUG:   return spdlog::level::debug;
        case ROTARY_LOG_VERBOSE: return spdlog::level::trace;
        case ROTARY_LOG_NONE:
        default:
            return spdlog::level::off;
    }
}

// 每个TAG一个logger，第一次使用时创建
static std::shared_ptr<spdlog::logger> get_logger(const char* tag)
{
    std::lock_guard<std::mutex> guard(s_logger_lock);
    std::shared_ptr<spdlog::logger> logger = spdlog::get(tag);
    if (!logger) {
        logger = spdlog::stdout_color_mt(tag);
        logger->set_pattern("%^%L%$ (%H:%M:%S.%e) %n: %v");
        logger->set_level(to_spdlog_level(s_log_level));
    }
    return logger;
}

void rotary_log_level_set(rotary_log_level_t level)
{
    std::lock_guard<std::mutex> guard(s_logger_lock);
    s_log_level = level;
    spdlog::set_level(to_spdlog_level(level));
}

rotary_log_level_t rotary_log_level_get()
{
    std::lock_guard<std::mutex> guard(s_logger_lock);
    return s_log_level;
}

rotary_log_level_t rotary_log_level_from_string(const char* value, rotary_log_level_t fallback)
{
    if (value == nullptr) {
        return fallback;
    }
    if (strcasecmp(value, "none") == 0)    return ROTARY_LOG_NONE;
    if (strcasecmp(value, "error") == 0)   return ROTARY_LOG_ERROR;
    if (strcasecmp(value, "warn") == 0)    return ROTARY_LOG_WARN;
    if (strcasecmp(value, "info") == 0)    return ROTARY_LOG_INFO;
    if (strcasecmp(value, "debug") == 0)   return ROTARY_LOG_DEBUG;
    if (strcasecmp(value, "verbose") == 0) return ROTARY_LOG_VERBOSE;
    return fallback;
}

bool rotary_log_enabled(rotary_log_level_t level)
{
    return level != ROTARY_LOG_NONE && level <= rotary_log_level_get();
}

void rotary_log_write(rotary_log_level_t level, const char* tag, const std::string& message)
{
    get_logger(tag)->log(to_spdlog_level(level), message);
}

void rotary_log_flush()
{
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> logger) { logger->flush(); });
}
