/**
 * @file Timer.cpp
 * @date 18.01.2011
 * @author tchipev
 */

#include "neurofis/utils/Timer.h"

#include "neurofis/utils/ExceptionHandler.h"

using namespace std::chrono;

neurofis::utils::Timer::Timer() : _startTime{} {}

neurofis::utils::Timer::~Timer() = default;

void neurofis::utils::Timer::start() {
  if (_currentlyRunning) {
    ExceptionHandler::exception("Trying to start a timer that is already started!");
    return;
  }
  _currentlyRunning = true;
  _startTime = high_resolution_clock::now();
}

long neurofis::utils::Timer::stop() {
  const auto time(high_resolution_clock::now());

  if (not _currentlyRunning) {
    ExceptionHandler::exception("Trying to stop a timer that was not started!");
    return 0;
  }
  _currentlyRunning = false;

  const auto diff = duration_cast<nanoseconds>(time - _startTime).count();

  _totalTime += diff;

  return diff;
}

void neurofis::utils::Timer::reset() { _totalTime = 0; }
