/**
 * @file YamlParser.h
 * @author N. Fottner, D. Martin
 * @date 15.07.2019, 11.04.2023
 */
#pragma once

#include <yaml-cpp/yaml.h>

#include <string>

#include "ClassifierConfig.h"

/**
 * Parser for input through YAML files.
 */
namespace ClassifierParser::YamlParser {

/**
 * Parses the input for the classifier from the Yaml File specified in the configuration.
 * All errors are collected and printed to std::cerr.
 * @param config configuration where the input is stored.
 * @return false if any errors occurred during parsing.
 */
bool parseYamlFile(ClassifierConfig &config);

/**
 * Creates an error message for a key.
 * @param mark The Yaml-Mark for printing line- and column number
 * @param key The key that caused the error
 * @param errorMsg Message thrown by an exception in yaml-cpp or in the parser
 * @param expected The expected value of the key
 * @param description The parameter description of the key
 * @return
 */
std::string makeErrorMsg(const YAML::Mark &mark, const std::string &key, const std::string &errorMsg,
                         const std::string &expected, const std::string &description);

}  // namespace ClassifierParser::YamlParser
