#ifndef TOKENFLOW_COMMON_LOGGING_LOGGER_H
#define TOKENFLOW_COMMON_LOGGING_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace tokenflow {

// 全局 "tokenflow" logger (stderr, colored). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// "trace" / "debug" / "info" / "warn" / "error" / "off"
void set_log_level(const std::string& level);

} // namespace tokenflow

#endif // TOKENFLOW_COMMON_LOGGING_LOGGER_H
