/**
 * @file Logger.h
 * @author M. Reiter
 * @date 14.09.2026
 */

#pragma once

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

/**
 * Name under which the NeuroFis logger is registered in spdlog.
 */
#define NEUROFIS_LOGGER_NAME "NeuroFisLog"

/**
 * Macro for logging through the NeuroFis logger.
 * @param lvl Possible levels: TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL.
 * @param fmt Message with formatting tokens
 * @param ... Formatting arguments
 * @note A ';' is enforced at the end of the macro.
 */
#define NeuroFisLog(lvl, fmt, ...) SPDLOG_LOGGER_##lvl(spdlog::get(NEUROFIS_LOGGER_NAME), fmt, ##__VA_ARGS__)

namespace neurofis {
/**
 * Creation and removal of the single logger shared by the library and the application.
 */
namespace Logger {

/**
 * Type alias for log levels.
 */
using LogLevel = spdlog::level::level_enum;

/**
 * Creates the logger on the given stream, replacing a previously registered one.
 * On std::cout and std::cerr the output is colored if NEUROFIS_COLORED_CONSOLE_LOGGING is set.
 * @param oss Output stream. Has to outlive the logger.
 * @param flushLevel Messages of this level or above are flushed immediately.
 */
void create(std::ostream &oss = std::cout, LogLevel flushLevel = LogLevel::warn);

/**
 * Removes the logger. This should only be done at teardown of the application or for tests.
 * Logging through NeuroFisLog before a new logger is created is undefined behavior.
 */
void unregister();

/**
 * Get a pointer to the logger.
 * @return The logger or nullptr if none is registered.
 */
std::shared_ptr<spdlog::logger> get();
}  // namespace Logger
}  // namespace neurofis
