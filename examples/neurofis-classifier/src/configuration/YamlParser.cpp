/**
 * @file YamlParser.cpp
 * @author N. Fottner, D. Martin
 * @date 15.07.2019, 11.04.2023
 */
#include "YamlParser.h"

#include <fmt/format.h>

#include <iostream>
#include <vector>

std::string ClassifierParser::YamlParser::makeErrorMsg(const YAML::Mark &mark, const std::string &key,
                                                       const std::string &errorMsg, const std::string &expected,
                                                       const std::string &description) {
  return fmt::format(
      "YamlParser: Parsing error in line {} at column {}, key: {}\n"
      "Message: {}\n"
      "Expected: {}\n"
      "Parameter description: {}\n",
      mark.line + 1, mark.column, key, errorMsg, expected, description);
}

bool ClassifierParser::YamlParser::parseYamlFile(ClassifierConfig &config) {
  /*
  Variables used to print the expected input and a description of the parameter if an error occurs while
  parsing. Yaml mark is used to identify the current line of the error.
  */
  std::string expected;
  std::string description;
  YAML::Mark mark;
  std::vector<std::string> errors;

  YAML::Node node;
  try {
    node = YAML::LoadFile(config.yamlFilename.value);
  } catch (const YAML::Exception &e) {
    std::cerr << "YamlParser: Could not load " << config.yamlFilename.value << ": " << e.what() << std::endl;
    return false;
  }

  // We iterate over all keys to identify known/unknown parameters.
  for (auto itemIterator = node.begin(); itemIterator != node.end(); ++itemIterator) {
    std::string key;
    try {
      key = itemIterator->first.as<std::string>();
      mark = node[key].Mark();

      if (key == config.dataFile.name) {
        expected = "String";
        description = config.dataFile.description;

        config.dataFile.value = node[key].as<std::string>();
      } else if (key == config.labelColumn.name) {
        expected = "Integer >= -1";
        description = config.labelColumn.description;

        config.labelColumn.value = node[key].as<int>();
        if (config.labelColumn.value < -1) {
          throw std::runtime_error("The label column has to be -1 or a column index.");
        }
      } else if (key == config.hasHeader.name) {
        expected = "Boolean Value";
        description = config.hasHeader.description;

        config.hasHeader.value = node[key].as<bool>();
      } else if (key == config.testFraction.name) {
        expected = "Floating-Point Value in [0, 1)";
        description = config.testFraction.description;

        config.testFraction.value = node[key].as<double>();
        if (config.testFraction.value < 0. or config.testFraction.value >= 1.) {
          throw std::runtime_error("The test fraction has to be in [0, 1).");
        }
      } else if (key == config.seed.name) {
        expected = "Unsigned Integer";
        description = config.seed.description;

        config.seed.value = node[key].as<unsigned long>();
      } else if (key == config.noShuffle.name) {
        expected = "Boolean Value";
        description = config.noShuffle.description;

        config.noShuffle.value = node[key].as<bool>();
      } else if (key == config.maxRules.name) {
        expected = "Unsigned Integer";
        description = config.maxRules.description;

        config.maxRules.value = node[key].as<size_t>();
      } else if (key == config.minObservationsPerRule.name) {
        expected = "Unsigned Integer >= 1";
        description = config.minObservationsPerRule.description;

        config.minObservationsPerRule.value = node[key].as<size_t>();
        if (config.minObservationsPerRule.value < 1) {
          throw std::runtime_error("Minimal observations per rule has to be at least 1.");
        }
      } else if (key == config.iterations.name) {
        expected = "Unsigned Integer";
        description = config.iterations.description;

        config.iterations.value = node[key].as<size_t>();
      } else if (key == config.learningRate.name) {
        expected = "Floating-Point Value >= 0";
        description = config.learningRate.description;

        config.learningRate.value = node[key].as<double>();
        if (not(config.learningRate.value >= 0.)) {
          throw std::runtime_error("The learning rate must not be negative.");
        }
      } else if (key == config.inspect.name) {
        expected = "Boolean Value";
        description = config.inspect.description;

        config.inspect.value = node[key].as<bool>();
      } else if (key == config.logLevel.name) {
        expected = "Log level out of the possible values.";
        description = config.logLevel.description;

        if (not ClassifierConfig::parseLogLevel(node[key].as<std::string>(), config.logLevel.value)) {
          throw std::runtime_error("Unknown Log Level parsed from yaml file: " + node[key].as<std::string>());
        }
      } else if (key == config.logFileName.name) {
        expected = "String";
        description = config.logFileName.description;

        config.logFileName.value = node[key].as<std::string>();
      } else {
        errors.push_back(fmt::format("YamlParser: Unrecognized option in input YAML: {}\n", key));
      }
    } catch (const std::exception &e) {
      errors.push_back(makeErrorMsg(mark, key, e.what(), expected, description));
    }
  }

  if (not errors.empty()) {
    for (const auto &err : errors) {
      std::cerr << err << std::endl;
    }
    return false;
  }

  return true;
}
