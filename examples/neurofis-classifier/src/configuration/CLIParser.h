/**
 * @file CLIParser.h
 * @author F. Gratl
 * @date 18.10.2019
 */

#pragma once

#include <getopt.h>

#include <iomanip>
#include <iostream>
#include <string>

#include "ClassifierConfig.h"
#include "ParserExitCodes.h"
#include "neurofis/utils/TupleUtils.h"

/**
 * Parser for input from the command line.
 */
namespace ClassifierParser::CLIParser {
/**
 * Checks if a yaml file is specified in the given command line arguments.
 * If so, its path is saved in the configuration.
 * Throws a std::runtime_error if the file does not exist.
 *
 * @param argc number of command line arguments.
 * @param argv command line argument array.
 * @param config configuration where the input is stored.
 */
void yamlFilePresent(int argc, char **argv, ClassifierConfig &config);

/**
 * Parses the input for the classifier from the command line.
 * @param argc number of command line arguments.
 * @param argv command line argument array.
 * @param config configuration where the input is stored.
 * @return Indicator of success. See ClassifierParser::exitCodes for possible values.
 */
exitCodes parseInput(int argc, char **argv, ClassifierConfig &config);

/**
 * Prints the help message to the given stream.
 * @tparam Options Tuple of ClassifierOptions.
 * @param ostream Typically std::out.
 * @param relPathOfExecutable  Typically argv[0].
 * @param relevantOptions Options to include in the help message.
 */
template <class Options>
void printHelpMessage(std::ostream &ostream, const std::string &relPathOfExecutable, const Options &relevantOptions) {
  // print header
  ostream << "Usage: " << relPathOfExecutable << std::endl;
  ostream << "A CSV data file is mandatory. All other options are optional." << std::endl;
  ostream << std::endl;
  ostream << "Options:" << std::endl;

  constexpr int outputWidthOptions{35};
  neurofis::utils::TupleUtils::for_each(relevantOptions, [&](const auto &option) {
    ostream << "    --" << std::setw(outputWidthOptions) << std::left << option.name;
    ostream << (option.requiresArgument ? "<arg>" : "     ") << "  " << option.description << std::endl;
  });
}

}  // namespace ClassifierParser::CLIParser
