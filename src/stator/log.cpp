//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/log.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace stator {

logger_t get_logger(const std::string &name) noexcept {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
        logger->set_level(spdlog::get_level());
    }
    return logger;
}

} // namespace stator
