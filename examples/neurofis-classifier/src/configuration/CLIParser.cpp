/**
 * @file CLIParser.cpp
 * @author F. Gratl
 * @date 18.10.2019
 */

#include "CLIParser.h"

#include <sys/stat.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <vector>

namespace {
/**
 * std::stoul that rejects negative input instead of wrapping it around.
 * @param strArg
 * @return
 */
size_t parseCount(const std::string &strArg) {
  const auto firstChar = strArg.find_first_not_of(" \t");
  if (firstChar != std::string::npos and strArg[firstChar] == '-') {
    throw std::invalid_argument("negative count: " + strArg);
  }
  return std::stoul(strArg);
}
}  // namespace

ClassifierParser::exitCodes ClassifierParser::CLIParser::parseInput(int argc, char **argv, ClassifierConfig &config) {
  using namespace std;

  // utility options
  // getoptChars for all other options are line numbers so use negative numbers here to avoid clashes
  // also do not use -1 because it is used by getopt to signal that there is no cli option
  const auto helpOption{ClassifierConfig::ClassifierOption<std::string, -2>("", "help", false, "Display this message.")};

  const auto relevantOptions{std::make_tuple(
      config.yamlFilename, config.dataFile, config.labelColumn, config.hasHeader, config.testFraction, config.seed,
      config.noShuffle, config.maxRules, config.minObservationsPerRule, config.iterations, config.learningRate,
      config.inspect, config.logLevel, config.logFileName, helpOption)};

  constexpr auto relevantOptionsSize = std::tuple_size_v<decltype(relevantOptions)>;

  // sanity check that all getopt chars are unique. Brackets for scoping.
  {
    // map tracking mappings of getopt chars to strings
    std::map<int, std::string> getoptCharsToName;
    // look for clashes by checking if getopt chars are in the map and otherwise add them
    neurofis::utils::TupleUtils::for_each(relevantOptions, [&](auto &opt) {
      if (auto iterAtClash = getoptCharsToName.find(opt.getoptChar); iterAtClash != getoptCharsToName.end()) {
        throw std::runtime_error("CLIParser::parseInput: the following options share the same getopt char!\n" +
                                 opt.name + " : " + std::to_string(opt.getoptChar) + "\n" + iterAtClash->second +
                                 " : " + std::to_string(iterAtClash->first));
      } else {
        getoptCharsToName.insert({opt.getoptChar, opt.name});
      }
    });
  }

  // create data structure for options that getopt can use
  std::vector<struct option> long_options;
  // reserve space for all relevant options and terminal field
  long_options.reserve(relevantOptionsSize + 1);

  neurofis::utils::TupleUtils::for_each(relevantOptions,
                                        [&](auto &elem) { long_options.push_back(elem.toGetoptOption()); });

  // needed to signal the end of the array
  long_options.push_back({nullptr, no_argument, nullptr, 0});

  // reset getopt to scan from the start of argv
  optind = 1;
  bool displayHelp = false;
  for (int cliOption = 0, cliOptionIndex = 0;
       (cliOption = getopt_long(argc, argv, "", long_options.data(), &cliOptionIndex)) != -1;) {
    string strArg;
    if (optarg != nullptr) strArg = optarg;
    switch (cliOption) {
      case decltype(config.yamlFilename)::getoptChar: {
        // already parsed in CLIParser::yamlFilePresent
        break;
      }
      case decltype(config.dataFile)::getoptChar: {
        config.dataFile.value = strArg;
        break;
      }
      case decltype(config.labelColumn)::getoptChar: {
        try {
          config.labelColumn.value = stoi(strArg);
        } catch (const exception &) {
          cerr << "Error parsing the label column: " << strArg << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.hasHeader)::getoptChar: {
        config.hasHeader.value = true;
        break;
      }
      case decltype(config.testFraction)::getoptChar: {
        try {
          config.testFraction.value = stod(strArg);
        } catch (const exception &) {
          cerr << "Error parsing the test fraction: " << strArg << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.seed)::getoptChar: {
        try {
          config.seed.value = parseCount(strArg);
        } catch (const exception &) {
          cerr << "Error parsing the seed: " << strArg << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.noShuffle)::getoptChar: {
        config.noShuffle.value = true;
        break;
      }
      case decltype(config.maxRules)::getoptChar: {
        try {
          config.maxRules.value = parseCount(strArg);
        } catch (const exception &) {
          cerr << "Error parsing the maximal number of rules: " << strArg << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.minObservationsPerRule)::getoptChar: {
        try {
          config.minObservationsPerRule.value = parseCount(strArg);
          if (config.minObservationsPerRule.value < 1) {
            cerr << "Minimal observations per rule has to be a positive integer!" << endl;
            displayHelp = true;
          }
        } catch (const exception &) {
          cerr << "Error parsing the minimal observations per rule: " << strArg << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.iterations)::getoptChar: {
        try {
          config.iterations.value = parseCount(strArg);
        } catch (const exception &) {
          cerr << "Error parsing number of iterations: " << strArg << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.learningRate)::getoptChar: {
        try {
          config.learningRate.value = stod(strArg);
        } catch (const exception &) {
          cerr << "Error parsing the learning rate: " << strArg << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.inspect)::getoptChar: {
        config.inspect.value = true;
        break;
      }
      case decltype(config.logLevel)::getoptChar: {
        if (not ClassifierConfig::parseLogLevel(strArg, config.logLevel.value)) {
          cerr << "Unknown Log Level: " << strArg << endl;
          cerr << "Please use 'trace', 'debug', 'info', 'warning', 'error', 'critical' or 'off'." << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.logFileName)::getoptChar: {
        config.logFileName.value = strArg;
        break;
      }
      case decltype(helpOption)::getoptChar: {
        printHelpMessage(std::cout, argv[0], relevantOptions);
        return exitCodes::helpFlagFound;
      }
      default: {
        // error message handled by getopt
        displayHelp = true;
      }
    }
  }

  if (optind < argc) {
    cerr << "Unexpected positional argument: " << argv[optind] << endl;
    displayHelp = true;
  }

  if (displayHelp) {
    printHelpMessage(std::cout, argv[0], relevantOptions);
    return exitCodes::parsingError;
  }
  return exitCodes::success;
}

// anonymous namespace to hide helper function
namespace {

/**
 * Checks if a file with the given path exists.
 * @param filename
 * @return True iff the file exists.
 */
bool checkFileExists(const std::string &filename) {
  struct stat buffer;
  return (stat(filename.c_str(), &buffer) == 0);
}

}  // namespace

void ClassifierParser::CLIParser::yamlFilePresent(int argc, char **argv, ClassifierConfig &config) {
  // suppress error messages since we only want to look if the yaml option is there
  auto opterrBefore = opterr;
  opterr = 0;
  struct option longOptions[] = {config.yamlFilename.toGetoptOption(),
                                 {nullptr, 0, nullptr, 0}};  // needed to signal the end of the array
  optind = 1;

  // search all cli parameters for the yaml option
  for (int cliOption = 0, cliOptionIndex = 0;
       (cliOption = getopt_long(argc, argv, "", longOptions, &cliOptionIndex)) != -1;) {
    switch (cliOption) {
      case decltype(config.yamlFilename)::getoptChar:
        config.yamlFilename.value = optarg;
        if (not checkFileExists(optarg)) {
          opterr = opterrBefore;
          throw std::runtime_error("CLIParser::yamlFilePresent: Yaml-File " + config.yamlFilename.value +
                                   " not found!");
        }
        break;
      default: {
        // do nothing
      }
    }
  }

  opterr = opterrBefore;
}
