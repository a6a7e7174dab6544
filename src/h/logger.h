#ifndef LOGGER_H
#define LOGGER_H

#include <memory>
#include <spdlog/logger.h>

namespace Log {
    // Creates the "passinator" stderr logger and makes it the spdlog default
    std::shared_ptr<spdlog::logger> init();
}

#endif // LOGGER_H
