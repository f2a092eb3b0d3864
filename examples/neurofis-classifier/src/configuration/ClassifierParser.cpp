/**
 * @file ClassifierParser.cpp
 * @author F. Gratl
 * @date 18.10.2019
 */

#include "ClassifierParser.h"

#include <iostream>
#include <string>
#include <vector>

#include "CLIParser.h"
#include "YamlParser.h"

ClassifierParser::exitCodes ClassifierParser::parseInput(int argc, char **argv, ClassifierConfig &config) {
  // we need to copy argv because the call to getopt in CLIParser::yamlFilePresent reorders it...
  std::vector<std::string> argvStrings(argv, argv + argc);
  std::vector<char *> argvCopy;
  argvCopy.reserve(argc + 1);
  for (auto &arg : argvStrings) {
    argvCopy.push_back(arg.data());
  }
  argvCopy.push_back(nullptr);

  try {
    CLIParser::yamlFilePresent(argc, argv, config);
  } catch (const std::runtime_error &e) {
    std::cerr << e.what() << std::endl;
    return exitCodes::parsingError;
  }

  if (not config.yamlFilename.value.empty()) {
    if (not YamlParser::parseYamlFile(config)) {
      return exitCodes::parsingError;
    }
  }

  const auto exitCode = CLIParser::parseInput(argc, argvCopy.data(), config);
  if (exitCode != exitCodes::success) {
    return exitCode;
  }

  if (const auto errors = config.validate(); not errors.empty()) {
    std::cerr << errors;
    return exitCodes::parsingError;
  }
  return exitCodes::success;
}
