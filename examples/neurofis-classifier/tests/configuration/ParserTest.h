/**
 * @file ParserTest.h
 * @author N. Fottner
 * @date 02/08/19
 */
#pragma once
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "NeuroFisTestBase.h"
#include "src/configuration/ClassifierConfig.h"
#include "src/configuration/ParserExitCodes.h"

class ParserTest : public NeuroFisTestBase {
 protected:
  /**
   * Runs the full parser on the given arguments. The executable name is prepended.
   * @param arguments
   * @param config Receives the parsed values.
   * @return Exit code of the parser.
   */
  static ClassifierParser::exitCodes parse(const std::vector<std::string> &arguments, ClassifierConfig &config);

  static std::string yamlFile(const std::string &name) { return std::string(YAMLDIRECTORY) + name; }
};
