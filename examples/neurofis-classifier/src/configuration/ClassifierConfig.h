/**
 * @file ClassifierConfig.h
 * @author F. Gratl
 * @date 18.10.2019
 */

#pragma once

#include <getopt.h>

#include <string>
#include <utility>

#include "neurofis/utils/logging/Logger.h"

/**
 * Class containing all parameters for configuring a neurofis-classifier run.
 */
class ClassifierConfig {
 public:
  /**
   * Constructor that initializes the configuration from the CLI arguments (incl. yaml file argument).
   * Exits the program if parsing fails or only help was requested.
   * @param argc: the argument count of the arguments passed to the main function.
   * @param argv: the argument vector passed to the main function.
   */
  ClassifierConfig(int argc, char **argv);

  /**
   * Constructor using only default values.
   * Useful for testing but requires at least a data file before this is valid.
   */
  ClassifierConfig() = default;

  /**
   * Struct to bundle information for options.
   * @tparam T Datatype of the option
   * @tparam getOptChar int for the switch case that is used during cli argument parsing with getOpt.
   * @note ints should be unique so they can be used for a switch case.
   * @note getOptChar should never be -1 because getopt uses this value to indicate that there are no more cli arguments
   * @note use __LINE__ as a cheap generator for unique ints.
   */
  template <class T, int getOptChar>
  struct ClassifierOption {
    /**
     * Value of this option.
     */
    T value;

    /**
     * Indicate whether this option is a flag or takes arguments.
     */
    bool requiresArgument;

    /**
     * String representation of the option name.
     */
    std::string name;

    /**
     * String describing this option. This is displayed when neurofis-classifier is invoked with --help.
     */
    std::string description;

    /**
     * Member to access the template parameter.
     */
    constexpr static int getoptChar{getOptChar};

    /**
     * Constructor
     * @param value Default value for this option.
     * @param newName String representation of the option name.
     * @param requiresArgument Indicate whether this option is a flag or takes arguments.
     * @param newDescription String describing this option.
     */
    ClassifierOption(T value, std::string newName, bool requiresArgument, std::string newDescription)
        : value(std::move(value)),
          requiresArgument(requiresArgument),
          name(std::move(newName)),
          description(std::move(newDescription)) {}

    /**
     * Returns a getopt option struct for this object.
     * @return
     */
    [[nodiscard]] auto toGetoptOption() const {
      struct option retStruct {
        name.c_str(), requiresArgument, nullptr, getOptChar
      };
      return retStruct;
    }
  };

  /**
   * Convert the content of the config to a string representation.
   * @return
   */
  [[nodiscard]] std::string to_string() const;

  /**
   * Checks the combination of all values.
   * @return Empty string if valid, otherwise a description of all problems.
   */
  [[nodiscard]] std::string validate() const;

  /**
   * Choice of the log level as string. Also used to parse it.
   */
  static inline const char *logLevelChoices{"Possible Values: (trace debug info warn error critical off)"};

  /**
   * Parses the first letter of a log level.
   * @param strArg
   * @param logLevel Set if the string is a known level.
   * @return False if the string is no known level.
   */
  static bool parseLogLevel(const std::string &strArg, neurofis::Logger::LogLevel &logLevel);

  /**
   * yamlFilename
   */
  ClassifierOption<std::string, __LINE__> yamlFilename{"", "yaml-filename", true, "Path to a .yaml input file."};

  // Data

  /**
   * dataFile
   */
  ClassifierOption<std::string, __LINE__> dataFile{"", "data-file", true,
                                                   "Path to a CSV file with one observation per line."};

  /**
   * labelColumn
   */
  ClassifierOption<int, __LINE__> labelColumn{-1, "label-column", true,
                                              "Zero based column of the integer class label. -1 is the last column."};

  /**
   * hasHeader
   */
  ClassifierOption<bool, __LINE__> hasHeader{false, "has-header", false,
                                             "Skip the first line of the data file. (Flag)"};

  /**
   * testFraction
   */
  ClassifierOption<double, __LINE__> testFraction{
      0., "test-fraction", true,
      "Fraction of the shuffled observations held out for evaluation in [0, 1). With 0 the training data is used."};

  /**
   * seed
   */
  ClassifierOption<unsigned long, __LINE__> seed{42, "seed", true, "Seed of the random number generator."};

  /**
   * noShuffle
   */
  ClassifierOption<bool, __LINE__> noShuffle{false, "no-shuffle", false,
                                             "Keep the order of the data file instead of shuffling it. (Flag)"};

  // Classifier

  /**
   * maxRules
   */
  ClassifierOption<size_t, __LINE__> maxRules{10, "max-rules", true,
                                              "Expected upper bound of the rule count. Exceeding it only warns."};

  /**
   * minObservationsPerRule
   */
  ClassifierOption<size_t, __LINE__> minObservationsPerRule{
      5, "min-observations-per-rule", true, "Minimal support of the majority class of a grid cell to keep it as rule."};

  /**
   * iterations
   */
  ClassifierOption<size_t, __LINE__> iterations{1000, "iterations", true,
                                                "Number of training passes over the data."};

  /**
   * learningRate
   */
  ClassifierOption<double, __LINE__> learningRate{0.001, "learning-rate", true,
                                                  "Distance a vertex moves per training update."};

  // Output

  /**
   * inspect
   */
  ClassifierOption<bool, __LINE__> inspect{false, "inspect", false, "Print the trained rule base. (Flag)"};

  /**
   * logLevel
   */
  ClassifierOption<neurofis::Logger::LogLevel, __LINE__> logLevel{
      neurofis::Logger::LogLevel::info, "log-level", true,
      std::string("Log level for NeuroFis. Set to debug for more information. ") + logLevelChoices};

  /**
   * logFileName
   */
  ClassifierOption<std::string, __LINE__> logFileName{"", "log-file", true,
                                                      "Path to a file to store the log output."};

 private:
  /**
   * Number of characters reserved for the option names when printing the configuration.
   */
  static constexpr size_t valueOffset{32};
};
