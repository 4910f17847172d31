#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/export.h"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace stator {

/** \brief shared pointer to spdlog logger */
using logger_t = std::shared_ptr<spdlog::logger>;

/** \brief returns existing logger with the given name or creates new one
 *
 * The newly created loggers write to the colored stdout sink and
 * inherit the global spdlog level.
 */
STATOR_API logger_t get_logger(const std::string &name) noexcept;

} // namespace stator

#define LOG_TRACE(LOGGER, ...) SPDLOG_LOGGER_TRACE(LOGGER, __VA_ARGS__)
#define LOG_DEBUG(LOGGER, ...) SPDLOG_LOGGER_DEBUG(LOGGER, __VA_ARGS__)
#define LOG_INFO(LOGGER, ...) SPDLOG_LOGGER_INFO(LOGGER, __VA_ARGS__)
#define LOG_WARN(LOGGER, ...) SPDLOG_LOGGER_WARN(LOGGER, __VA_ARGS__)
#define LOG_ERROR(LOGGER, ...) SPDLOG_LOGGER_ERROR(LOGGER, __VA_ARGS__)
#define LOG_CRITICAL(LOGGER, ...) SPDLOG_LOGGER_CRITICAL(LOGGER, __VA_ARGS__)
