#include "../h/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log {
    std::shared_ptr<spdlog::logger> init() {
        auto logger = spdlog::get("passinator");
        if (logger) return logger;

        logger = spdlog::stderr_color_mt("passinator");
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return logger;
    }
}
