// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>

namespace qsym::ir::data {

/**
 * @file json_serialization.hpp
 * @brief Version handling for JSON serialized configuration
 */

/**
 * @brief Validate serialization version compatibility
 * @param expected_version The version string this code expects (e.g., "0.1.0")
 * @param found_version The version string found in the serialized data
 * @throws std::runtime_error if major or minor version mismatch
 */
void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version);

/**
 * @brief Parse a semantic version string into major, minor, patch components
 * @param version_string Version string in format "major.minor.patch"
 * @return Tuple of (major, minor, patch) as integers
 * @throws std::runtime_error if version string format is invalid
 */
std::tuple<int, int, int> parse_version_string(
    const std::string& version_string);

/**
 * @brief Reads and parses a JSON document from disk.
 * @param filename Path of the file to read
 * @param what Short description of the document used in error messages
 * @throws std::runtime_error if the file cannot be opened or is not valid JSON
 */
nlohmann::json read_json_file(const std::string& filename,
                              const std::string& what);

/**
 * @brief Writes a JSON document to disk with 2-space indentation.
 * @throws std::runtime_error if the file cannot be opened or written
 */
void write_json_file(const std::string& filename, const nlohmann::json& j);

}  // namespace qsym::ir::data
