#pragma once

#include <cstdint>
#include <string>

#include <spdlog/common.h>

#include "common/option.h"

namespace retryable {

// Get log level from options
spdlog::level::level_enum GetLogLevel(const Options& options);

// Daily log files to keep, 0 keeps all
uint16_t GetLogMaxFiles(const Options& options);

/*
 * Initialize spdlog as the default logger. Later calls are ignored.
 * @param app_name: the name of the application
 * @param options: the options of the application
 */
void InitRetryableLog(const std::string& app_name, const Options& options = Options());

} // namespace retryable
