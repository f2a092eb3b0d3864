/**
 * @file InstanceCounter.h
 * @author seckler
 * @date 06.11.20
 */

#pragma once

namespace neurofis {

/**
 * Class to count NeuroFis instances.
 */
struct InstanceCounter {
  /**
   * Number of living NeuroFis instances. The logger is only unregistered when the last one is destroyed.
   */
  static inline unsigned int count{0};
};
}  // namespace neurofis
