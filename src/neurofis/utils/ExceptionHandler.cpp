/**
 * @file ExceptionHandler.cpp
 * @author M. Reiter
 * @date 14.09.2026
 */

#include "neurofis/utils/ExceptionHandler.h"

#include <cstdlib>
#include <iostream>

#include "neurofis/utils/logging/Logger.h"

namespace neurofis::utils {

std::mutex ExceptionHandler::_exceptionMutex;
ExceptionBehavior ExceptionHandler::_behavior = ExceptionBehavior::throwException;

void ExceptionHandler::setBehavior(ExceptionBehavior behavior) {
  std::lock_guard<std::mutex> guard(_exceptionMutex);
  _behavior = behavior;
}

ExceptionBehavior ExceptionHandler::getBehavior() {
  std::lock_guard<std::mutex> guard(_exceptionMutex);
  return _behavior;
}

void ExceptionHandler::exception(const std::string &message) { exception(NeuroFisException(message)); }

void ExceptionHandler::exception(const char *message) { exception(std::string(message)); }

void ExceptionHandler::printAndAbort(const char *what) {
  if (auto logger = Logger::get()) {
    NeuroFisLog(CRITICAL, "{}\naborting", what);
    logger->flush();
  } else {
    std::cerr << what << "\naborting" << std::endl;
  }
  std::abort();
}

ExceptionHandler::NeuroFisException::NeuroFisException(std::string description)
    : _description(std::move(description)) {}

const char *ExceptionHandler::NeuroFisException::what() const noexcept { return _description.c_str(); }

}  // namespace neurofis::utils
