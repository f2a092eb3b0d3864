/**
 * @file Option.h
 * @author F. Gratl
 * @date 10/14/19
 */

#pragma once

#include <algorithm>
#include <map>
#include <ostream>
#include <set>
#include <string>

#include "neurofis/utils/ExceptionHandler.h"

namespace neurofis {
inline namespace options {
/**
 * Base class for NeuroFis options.
 * @tparam actualOption Curiously recurring template pattern.
 */
template <typename actualOption>
class Option {
 public:
  /**
   * Prevents cast to bool by deleting the conversion operator.
   * @return
   */
  explicit operator bool() = delete;

  /**
   * Provides a way to iterate over the possible options.
   * @return Set of all possible values of this option type.
   */
  static std::set<actualOption> getAllOptions() {
    std::set<actualOption> retSet;
    auto mapOptionNames = actualOption::getOptionNames();
    std::for_each(mapOptionNames.begin(), mapOptionNames.end(),
                  [&retSet](auto pairOpStr) { retSet.insert(pairOpStr.first); });
    return retSet;
  };

  /**
   * Converts an Option object to its respective string representation.
   * @return The string representation or "Unknown Option (<IntValue>)".
   */
  [[nodiscard]] std::string to_string() const {
    auto &actualThis = *static_cast<const actualOption *>(this);
    auto mapOptNames = actualOption::getOptionNames();  // <- not copying the map destroys the strings
    auto match = mapOptNames.find(actualThis);
    if (match == mapOptNames.end()) {
      return "Unknown Option (" + std::to_string(actualThis) + ")";
    } else {
      return match->second;
    }
  }

  /**
   * Converts a string to an enum.
   *
   * The given string needs to match exactly an option.
   *
   * @param optionString
   * @return Option enum.
   */
  static actualOption parseOptionExact(const std::string &optionString) {
    for (auto [optionEnum, optionName] : actualOption::getOptionNames()) {
      if (optionString == optionName) {
        return optionEnum;
      }
    }

    // the end of the function should not be reached
    utils::ExceptionHandler::exception("Option::parseOptionExact() no match found for: {}", optionString);
    return actualOption();
  }

  /**
   * Stream operator.
   * @param os
   * @param option
   * @return
   */
  friend std::ostream &operator<<(std::ostream &os, const Option &option) {
    os << option.to_string();
    return os;
  }
};
}  // namespace options
}  // namespace neurofis
