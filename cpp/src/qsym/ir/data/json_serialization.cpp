// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "json_serialization.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <tuple>

namespace qsym::ir::data {

std::tuple<int, int, int> parse_version_string(
    const std::string& version_string) {
  // Expected format: "major.minor.patch"
  std::size_t first_dot = version_string.find('.');
  std::size_t second_dot = first_dot == std::string::npos
                               ? std::string::npos
                               : version_string.find('.', first_dot + 1);

  if (first_dot == std::string::npos || second_dot == std::string::npos) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }

  try {
    int major = std::stoi(version_string.substr(0, first_dot));
    int minor = std::stoi(
        version_string.substr(first_dot + 1, second_dot - first_dot - 1));
    int patch = std::stoi(version_string.substr(second_dot + 1));

    return std::make_tuple(major, minor, patch);
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }
}

void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version) {
  if (expected_version == found_version) {
    return;
  }

  auto [expected_major, expected_minor, expected_patch] =
      parse_version_string(expected_version);
  auto [found_major, found_minor, found_patch] =
      parse_version_string(found_version);

  if (expected_major != found_major) {
    throw std::runtime_error(
        "Serialization version major mismatch. Expected: " + expected_version +
        ", Found: " + found_version +
        ". Major version differences are not compatible.");
  }

  if (expected_minor != found_minor) {
    throw std::runtime_error(
        "Serialization version minor mismatch. Expected: " + expected_version +
        ", Found: " + found_version +
        ". Minor version differences are not compatible.");
  }

  // Patch version differences are allowed
}

nlohmann::json read_json_file(const std::string& filename,
                              const std::string& what) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error(
        "Unable to open " + what + " JSON file '" + filename +
        "'. Please check that the file exists and you have read permissions.");
  }

  try {
    return nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Error parsing " + what + " JSON file '" +
                             filename + "': " + e.what());
  }
}

void write_json_file(const std::string& filename, const nlohmann::json& j) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }

  file << j.dump(2);

  if (file.fail()) {
    throw std::runtime_error("Error writing to file: " + filename);
  }
}

}  // namespace qsym::ir::data
