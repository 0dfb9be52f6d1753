#include "common/logging/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace tokenflow {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("tokenflow");
        if (!instance) {
            instance = spdlog::stderr_color_mt("tokenflow");
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

void set_log_level(const std::string& level) {
    logger()->set_level(spdlog::level::from_str(level));
}

} // namespace tokenflow
