/**
 * @file DataSet.cpp
 * @author M. Reiter
 * @date 22.09.2026
 */
#include "DataSet.h"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

#include "neurofis/utils/ExceptionHandler.h"

namespace {
/**
 * Removes leading and trailing whitespace.
 */
std::string trim(const std::string &str) {
  const auto first = str.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = str.find_last_not_of(" \t\r");
  return str.substr(first, last - first + 1);
}

/**
 * Splits a line at every comma and trims the fields.
 */
std::vector<std::string> splitFields(const std::string &line) {
  std::vector<std::string> fields;
  std::stringstream lineStream(line);
  std::string field;
  while (std::getline(lineStream, field, ',')) {
    fields.push_back(trim(field));
  }
  // a trailing comma denotes an empty last field
  if (not line.empty() and line.back() == ',') {
    fields.emplace_back("");
  }
  return fields;
}

/**
 * Parses a whole field as number. Trailing characters are an error.
 */
double parseNumber(const std::string &field, const std::string &filename, size_t lineNumber) {
  size_t pos = 0;
  double value = 0.;
  try {
    value = std::stod(field, &pos);
  } catch (const std::exception &) {
    pos = 0;
  }
  if (field.empty() or pos != field.size()) {
    neurofis::utils::ExceptionHandler::exception("DataSet::loadCsv: {} line {}: \"{}\" is not a number.", filename,
                                                 lineNumber, field);
  }
  return value;
}
}  // namespace

DataSet::DataSet(neurofis::FeatureMatrix data, neurofis::LabelVector labels)
    : _data(std::move(data)), _labels(std::move(labels)) {
  if (static_cast<size_t>(_data.rows()) != _labels.size()) {
    neurofis::utils::ExceptionHandler::exception("DataSet: {} observations but {} labels.", _data.rows(),
                                                 _labels.size());
  }
}

DataSet DataSet::loadCsv(const std::string &filename, int labelColumn, bool hasHeader) {
  std::ifstream file(filename);
  if (not file.is_open()) {
    neurofis::utils::ExceptionHandler::exception("DataSet::loadCsv: could not open {}.", filename);
  }

  std::vector<std::vector<double>> rows;
  neurofis::LabelVector labels;
  size_t numColumns = 0;
  size_t labelIndex = 0;
  bool skipHeader = hasHeader;

  std::string line;
  for (size_t lineNumber = 1; std::getline(file, line); ++lineNumber) {
    if (trim(line).empty()) {
      continue;
    }
    if (skipHeader) {
      skipHeader = false;
      continue;
    }
    const auto fields = splitFields(line);
    if (numColumns == 0) {
      numColumns = fields.size();
      if (numColumns < 2) {
        neurofis::utils::ExceptionHandler::exception(
            "DataSet::loadCsv: {} line {}: at least one feature and one label column are required.", filename,
            lineNumber);
      }
      labelIndex = labelColumn < 0 ? numColumns - 1 : static_cast<size_t>(labelColumn);
      if (labelIndex >= numColumns) {
        neurofis::utils::ExceptionHandler::exception("DataSet::loadCsv: label column {} does not exist in {} ({} columns).",
                                                     labelColumn, filename, numColumns);
      }
    } else if (fields.size() != numColumns) {
      neurofis::utils::ExceptionHandler::exception("DataSet::loadCsv: {} line {}: expected {} columns but found {}.",
                                                   filename, lineNumber, numColumns, fields.size());
    }

    std::vector<double> row;
    row.reserve(numColumns - 1);
    for (size_t column = 0; column < fields.size(); ++column) {
      const double value = parseNumber(fields[column], filename, lineNumber);
      if (column == labelIndex) {
        if (value != std::floor(value) or value < 0. or
            value > static_cast<double>(std::numeric_limits<neurofis::ClassLabel>::max())) {
          neurofis::utils::ExceptionHandler::exception(
              "DataSet::loadCsv: {} line {}: label {} is not a non-negative integer.", filename, lineNumber, value);
        }
        labels.push_back(static_cast<neurofis::ClassLabel>(value));
      } else {
        row.push_back(value);
      }
    }
    rows.push_back(std::move(row));
  }

  if (rows.empty()) {
    neurofis::utils::ExceptionHandler::exception("DataSet::loadCsv: {} contains no observations.", filename);
  }

  neurofis::FeatureMatrix data(rows.size(), numColumns - 1);
  for (size_t row = 0; row < rows.size(); ++row) {
    for (size_t column = 0; column < rows[row].size(); ++column) {
      data(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(column)) = rows[row][column];
    }
  }
  return {std::move(data), std::move(labels)};
}

void DataSet::shuffle(neurofis::Random &random) {
  const auto permutation = random.permutation(size());
  neurofis::FeatureMatrix shuffledData(_data.rows(), _data.cols());
  neurofis::LabelVector shuffledLabels(_labels.size());
  for (size_t i = 0; i < permutation.size(); ++i) {
    shuffledData.row(static_cast<Eigen::Index>(i)) = _data.row(static_cast<Eigen::Index>(permutation[i]));
    shuffledLabels[i] = _labels[permutation[i]];
  }
  _data = std::move(shuffledData);
  _labels = std::move(shuffledLabels);
}

std::pair<DataSet, DataSet> DataSet::split(double testFraction) const {
  if (not(testFraction >= 0. and testFraction < 1.)) {
    neurofis::utils::ExceptionHandler::exception("DataSet::split: test fraction {} is not in [0, 1).", testFraction);
  }
  const auto numTest = static_cast<size_t>(std::floor(testFraction * static_cast<double>(size())));
  const auto numTrain = size() - numTest;

  DataSet train(_data.topRows(static_cast<Eigen::Index>(numTrain)),
                neurofis::LabelVector(_labels.begin(), _labels.begin() + numTrain));
  DataSet test(_data.bottomRows(static_cast<Eigen::Index>(numTest)),
               neurofis::LabelVector(_labels.begin() + numTrain, _labels.end()));
  return {std::move(train), std::move(test)};
}
