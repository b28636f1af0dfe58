#include "common/log_utils.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <unistd.h>

#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/string_utils.h"

namespace retryable {

namespace {

constexpr size_t LOG_QUEUE_SIZE = 8192;
constexpr size_t LOG_THREAD_COUNT = 1;
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [pid %P] [thread %t] [%l] [%s:%#] %v";

std::mutex init_mutex;
std::shared_ptr<spdlog::logger> retryable_logger;

// logdir/app_name.pid, a new file at 00:00 every day
spdlog::sink_ptr MakeDailyFileSink(const std::string& app_name, const Options& options) {
    auto log_name = GetOptionValue<std::string>(options, RETRYABLE_LOG_DIR) + "/" + app_name + "."
        + std::to_string(getpid());
    return std::make_shared<spdlog::sinks::daily_file_sink_mt>(log_name, 0, 0, false, GetLogMaxFiles(options));
}

std::vector<spdlog::sink_ptr> MakeSinks(const std::string& app_name, const Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (GetOptionValue<bool>(options, RETRYABLE_LOG_TO_CONSOLE)) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }
    if (GetOptionValue<bool>(options, RETRYABLE_LOG_TO_FILE)) {
        sinks.push_back(MakeDailyFileSink(app_name, options));
    }
    return sinks;
}

} // namespace

spdlog::level::level_enum GetLogLevel(const Options& options) {
    static const std::unordered_map<std::string, spdlog::level::level_enum> levels = {
        {"DEBUG", spdlog::level::debug},
        {"INFO", spdlog::level::info},
        {"WARNING", spdlog::level::warn},
        {"ERROR", spdlog::level::err},
    };

    auto log_level = ToUpper(TrimCopy(GetOptionValue<std::string>(options, RETRYABLE_LOG_LEVEL)));
    auto it = levels.find(log_level);
    if (it == levels.end()) {
        SPDLOG_ERROR("Unknown log level: {}, use INFO", log_level);
        return spdlog::level::info;
    }
    return it->second;
}

uint16_t GetLogMaxFiles(const Options& options) {
    int max_file_days = GetOptionValue<int>(options, RETRYABLE_LOG_MAX_FILE_DAYS);
    return static_cast<uint16_t>(std::clamp<int>(max_file_days, 0, std::numeric_limits<uint16_t>::max()));
}

void InitRetryableLog(const std::string& app_name, const Options& options) {
    std::lock_guard<std::mutex> lock(init_mutex);
    if (retryable_logger != nullptr) {
        SPDLOG_WARN("Logger {} already initialized, skip init for {}", retryable_logger->name(), app_name);
        return;
    }

    spdlog::init_thread_pool(LOG_QUEUE_SIZE, LOG_THREAD_COUNT);
    auto sinks = MakeSinks(app_name, options);
    retryable_logger = std::make_shared<spdlog::async_logger>(
        app_name,
        sinks.begin(),
        sinks.end(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::block // When the queue is full, block
    );

    spdlog::set_default_logger(retryable_logger);
    spdlog::set_level(GetLogLevel(options));
    spdlog::flush_on(spdlog::level::info);
    spdlog::set_pattern(LOG_PATTERN);

    SPDLOG_INFO("Initialized spdlog for {}", app_name);
}

} // namespace retryable
