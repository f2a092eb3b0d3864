/**
 * @file main.cpp
 * @date 23.02.2018
 * @author F. Gratl
 */

#include <cstdlib>
#include <iostream>

#include "Experiment.h"
#include "src/configuration/ClassifierConfig.h"

/**
 * The main function for neurofis-classifier.
 * @param argc
 * @param argv
 * @return
 */
int main(int argc, char **argv) {
  ClassifierConfig configuration(argc, argv);

  std::cout << configuration.to_string() << std::endl;

  try {
    Experiment experiment(configuration);
    experiment.run();
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
