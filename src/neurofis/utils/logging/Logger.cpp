/**
 * @file Logger.cpp
 * @author M. Reiter
 * @date 14.09.2026
 */
#include "Logger.h"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace neurofis::Logger {

namespace {
std::shared_ptr<spdlog::sinks::sink> makeSink(std::ostream &oss) {
#ifdef NEUROFIS_COLORED_CONSOLE_LOGGING
  if (oss.rdbuf() == std::cout.rdbuf()) {
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  if (oss.rdbuf() == std::cerr.rdbuf()) {
    return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }
#endif
  return std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
}
}  // namespace

void create(std::ostream &oss, LogLevel flushLevel) {
  unregister();
  auto logger = std::make_shared<spdlog::logger>(NEUROFIS_LOGGER_NAME, makeSink(oss));
  logger->flush_on(flushLevel);
  spdlog::register_logger(logger);
}

void unregister() { spdlog::drop(NEUROFIS_LOGGER_NAME); }

std::shared_ptr<spdlog::logger> get() { return spdlog::get(NEUROFIS_LOGGER_NAME); }
}  // namespace neurofis::Logger
