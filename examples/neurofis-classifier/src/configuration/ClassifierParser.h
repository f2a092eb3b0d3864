/**
 * @file ClassifierParser.h
 * @author F. Gratl
 * @date 18.10.2019
 */

#pragma once

#include "ClassifierConfig.h"
#include "ParserExitCodes.h"

/**
 * General parser.
 */
namespace ClassifierParser {

/**
 * Parse the given command line options and if necessary also the yaml file within that.
 * Values from the command line override values from the yaml file.
 * Parsed values are directly stored to the passed config object.
 * @param argc
 * @param argv
 * @param config
 * @return Indicator of success. See ClassifierParser::exitCodes for possible values.
 */
exitCodes parseInput(int argc, char **argv, ClassifierConfig &config);

}  // namespace ClassifierParser
