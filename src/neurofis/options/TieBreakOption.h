/**
 * @file TieBreakOption.h
 * @author M. Reiter
 * @date 14.09.2026
 */

#pragma once

#include <set>

#include "Option.h"

namespace neurofis {
inline namespace options {
/**
 * Class representing the choices how equally activated rules are resolved when searching the most activated rule.
 */
class TieBreakOption : public Option<TieBreakOption> {
 public:
  /**
   * Possible choices for the tie break.
   */
  enum Value {
    /**
     * Strict comparison starting from zero activation. The first enumerated maximum wins and observations without
     * any positive activation have no winner. Used while training.
     */
    firstMaximum,
    /**
     * Greater-or-equal comparison starting from zero activation. The last enumerated maximum wins. Used for
     * prediction.
     */
    lastMaximum
  };

  /**
   * Constructor.
   */
  TieBreakOption() = default;

  /**
   * Constructor from value.
   * @param option
   */
  constexpr TieBreakOption(Value option) : _value(option) {}

  /**
   * Cast to value.
   * @return
   */
  constexpr operator Value() const { return _value; }

  /**
   * Provides a way to iterate over the possible choices of TieBreakOption.
   * @return map option -> string representation
   */
  static std::map<TieBreakOption, std::string> getOptionNames() {
    return {
        {TieBreakOption::firstMaximum, "firstMaximum"},
        {TieBreakOption::lastMaximum, "lastMaximum"},
    };
  };

 private:
  Value _value{Value(-1)};
};
}  // namespace options
}  // namespace neurofis
