/**
 * @file ClassifierConfig.cpp
 * @author F. Gratl
 * @date 18.10.2019
 */
#include "ClassifierConfig.h"

#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <iostream>

#include "ClassifierParser.h"

ClassifierConfig::ClassifierConfig(int argc, char **argv) {
  auto parserExitCode = ClassifierParser::parseInput(argc, argv, *this);
  if (parserExitCode != ClassifierParser::exitCodes::success) {
    if (parserExitCode == ClassifierParser::exitCodes::parsingError) {
      std::cerr << "Error when parsing the configuration." << std::endl;
      exit(EXIT_FAILURE);
    }
    exit(EXIT_SUCCESS);
  }
}

bool ClassifierConfig::parseLogLevel(const std::string &strArg, neurofis::Logger::LogLevel &logLevel) {
  if (strArg.empty()) {
    return false;
  }
  switch (std::tolower(strArg[0])) {
    case 't': {
      logLevel = neurofis::Logger::LogLevel::trace;
      break;
    }
    case 'd': {
      logLevel = neurofis::Logger::LogLevel::debug;
      break;
    }
    case 'i': {
      logLevel = neurofis::Logger::LogLevel::info;
      break;
    }
    case 'w': {
      logLevel = neurofis::Logger::LogLevel::warn;
      break;
    }
    case 'e': {
      logLevel = neurofis::Logger::LogLevel::err;
      break;
    }
    case 'c': {
      logLevel = neurofis::Logger::LogLevel::critical;
      break;
    }
    case 'o': {
      logLevel = neurofis::Logger::LogLevel::off;
      break;
    }
    default: {
      return false;
    }
  }
  return true;
}

std::string ClassifierConfig::validate() const {
  std::string errors;
  if (dataFile.value.empty()) {
    errors += fmt::format("No {} given.\n", dataFile.name);
  }
  if (labelColumn.value < -1) {
    errors += fmt::format("{} has to be -1 or a column index but is {}.\n", labelColumn.name, labelColumn.value);
  }
  if (testFraction.value < 0. or testFraction.value >= 1.) {
    errors += fmt::format("{} has to be in [0, 1) but is {}.\n", testFraction.name, testFraction.value);
  }
  if (minObservationsPerRule.value < 1) {
    errors += fmt::format("{} has to be at least 1.\n", minObservationsPerRule.name);
  }
  if (not(learningRate.value >= 0.)) {
    errors += fmt::format("{} has to be a non-negative number but is {}.\n", learningRate.name, learningRate.value);
  }
  return errors;
}

std::string ClassifierConfig::to_string() const {
  std::string str;
  auto printOption = [&](const auto &option) {
    str += fmt::format("{:<{}}:  {}\n", option.name, valueOffset, option.value);
  };

  printOption(dataFile);
  printOption(labelColumn);
  printOption(hasHeader);
  printOption(testFraction);
  printOption(noShuffle);
  if (not noShuffle.value) {
    printOption(seed);
  }
  printOption(maxRules);
  printOption(minObservationsPerRule);
  printOption(iterations);
  printOption(learningRate);
  printOption(inspect);
  str += fmt::format("{:<{}}:  {}\n", logLevel.name, valueOffset, spdlog::level::to_string_view(logLevel.value));
  if (not logFileName.value.empty()) {
    printOption(logFileName);
  }
  return str;
}
