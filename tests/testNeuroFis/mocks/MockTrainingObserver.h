/**
 * @file MockTrainingObserver.h
 * @author M. Reiter
 * @date 23.09.2026
 */

#pragma once

#include <gmock/gmock.h>

#include "neurofis/training/TrainingObserver.h"

class MockTrainingObserver : public neurofis::training::TrainingObserver {
 public:
  MOCK_METHOD(void, notifyEpochComplete, (size_t epoch, size_t numUpdates, size_t numSkipped), (override));
  MOCK_METHOD(bool, stopRequested, (), (override));
};
