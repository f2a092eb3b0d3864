/**
 * @file ExceptionHandler.h
 * @author M. Reiter
 * @date 14.09.2026
 */

#pragma once

#include <fmt/format.h>

#include <mutex>
#include <string>
#include <utility>

namespace neurofis::utils {

/**
 * What happens when NeuroFis detects an error.
 */
enum ExceptionBehavior {
  /**
   * Throw the exception to the caller. Default.
   */
  throwException,
  /**
   * Log the message and abort the process. Meant for applications that can not recover from invalid input anyway.
   */
  printAbort,
};

/**
 * Single point through which all errors of the library are reported.
 */
class ExceptionHandler {
 public:
  /**
   * Default exception class for NeuroFis errors.
   */
  class NeuroFisException : public std::exception {
   public:
    /**
     * Constructor.
     * @param description
     */
    explicit NeuroFisException(std::string description);

    [[nodiscard]] const char *what() const noexcept override;

   private:
    std::string _description;
  };

  /**
   * Set the behavior of the handler.
   * @param behavior
   */
  static void setBehavior(ExceptionBehavior behavior);

  /**
   * Getter for the current behavior.
   * @return
   */
  static ExceptionBehavior getBehavior();

  /**
   * Handle an exception derived from std::exception.
   * @tparam Exception Exception type. Throwing uses the static type, so it is kept.
   * @param e
   */
  template <class Exception>
  static void exception(const Exception &e) {
    std::lock_guard<std::mutex> guard(_exceptionMutex);
    if (_behavior == throwException) {
      throw e;  // NOLINT
    }
    printAndAbort(e.what());
  }

  /**
   * Reports a NeuroFisException with the given message.
   * @param message
   */
  static void exception(const std::string &message);

  /**
   * Reports a NeuroFisException with the given message.
   * @param message
   */
  static void exception(const char *message);

  /**
   * Reports a NeuroFisException with a message formatted by fmt, e.g.:
   * exception("{} is not less than {}", 4, 3);
   * @tparam First Forces at least one argument, to tell this apart from the plain message overloads.
   * @tparam Args
   * @param formatString
   * @param first
   * @param args
   */
  template <typename First, typename... Args>
  static void exception(const std::string &formatString, First &&first, Args &&...args) {
    exception(fmt::format(fmt::runtime(formatString), std::forward<First>(first), std::forward<Args>(args)...));
  }

 private:
  [[noreturn]] static void printAndAbort(const char *what);

  static std::mutex _exceptionMutex;
  static ExceptionBehavior _behavior;
};

}  // namespace neurofis::utils
