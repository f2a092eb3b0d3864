/**
 * @file TrainingObserver.h
 * @author M. Reiter
 * @date 18.09.2026
 */

#pragma once

#include <cstddef>

namespace neurofis::training {

/**
 * Interface to follow the progress of a training run and to stop it early.
 */
class TrainingObserver {
 public:
  virtual ~TrainingObserver() = default;

  /**
   * Called after every completed pass over the training data.
   * @param epoch Zero based number of the completed epoch.
   * @param numUpdates Number of rule updates in this epoch.
   * @param numSkipped Number of observations that activated no rule in this epoch.
   */
  virtual void notifyEpochComplete(size_t epoch, size_t numUpdates, size_t numSkipped) = 0;

  /**
   * Polled before every observation. Returning true ends the training after the current update.
   * @return
   */
  virtual bool stopRequested() = 0;
};

}  // namespace neurofis::training
