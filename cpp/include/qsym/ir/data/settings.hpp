// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace qsym::ir::data {

/**
 * @brief Exception thrown when modification of locked settings is requested
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  SettingsAreLocked()
      : std::runtime_error(
            "Settings are locked: configure a new algorithm instance.") {}
};

/**
 * @brief Exception thrown when a setting is not found
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Exception thrown when a value is not one of the allowed options of
 * its setting
 */
class InvalidSettingValue : public std::invalid_argument {
 public:
  InvalidSettingValue(const std::string& key, const std::string& value,
                      const std::vector<std::string>& allowed);
};

/**
 * @brief Named options of an algorithm
 *
 * Every option holds a string, optionally restricted to a list of allowed
 * values. Keys can only be created by derived classes during construction,
 * through set_default(), so the available keys are fixed once the object
 * exists. Algorithms lock their settings when they start running; after
 * that every modification throws SettingsAreLocked and the settings may be
 * read from any number of threads.
 *
 * Usage:
 * ```cpp
 * class TraversalSettings : public Settings {
 *  public:
 *   TraversalSettings() {
 *     set_default("mode", "fast", "Traversal mode", {"fast", "exact"});
 *   }
 * };
 * ```
 */
class Settings {
 public:
  Settings() = default;
  virtual ~Settings() = default;

  Settings(const Settings&) = delete;
  Settings& operator=(const Settings&) = delete;

  /**
   * @brief Returns the current value of a setting
   * @throws SettingNotFound if key doesn't exist
   */
  const std::string& get(const std::string& key) const;

  /**
   * @brief Changes the value of an existing setting
   * @throws SettingsAreLocked, SettingNotFound, InvalidSettingValue
   */
  void set(const std::string& key, const std::string& value);

  bool has(const std::string& key) const;

  /**
   * @brief All keys, in lexicographic order
   */
  std::vector<std::string> keys() const;

  /**
   * @throws SettingNotFound if key doesn't exist
   */
  const std::string& get_description(const std::string& key) const;

  /**
   * @brief Allowed values of a setting; empty when any value is accepted
   * @throws SettingNotFound if key doesn't exist
   */
  const std::vector<std::string>& get_allowed_values(
      const std::string& key) const;

  /**
   * @brief Changes several settings at once
   *
   * Every entry is validated before any is written, so a failing update
   * leaves the settings unchanged.
   *
   * @throws SettingsAreLocked, SettingNotFound, InvalidSettingValue
   */
  void update(const std::map<std::string, std::string>& values);

  /**
   * @brief Copies the values of every key the other settings also have
   */
  void update(const Settings& other);

  /**
   * @brief Changes the settings named in a JSON object
   *
   * The object maps keys to string values. An optional "version" entry is
   * checked against the serialization version.
   *
   * @throws std::runtime_error if json is not an object or has an
   * incompatible version
   * @throws std::invalid_argument if a value is not a string
   * @throws SettingsAreLocked, SettingNotFound, InvalidSettingValue
   */
  void update_from_json(const nlohmann::json& json);

  /**
   * @brief Reads a JSON file and applies it with update_from_json()
   * @throws std::runtime_error if the file cannot be read or parsed
   */
  void update_from_json_file(const std::string& filename);

  /**
   * @brief Serializes the version and every key/value pair
   */
  nlohmann::json to_json() const;

  void to_json_file(const std::string& filename) const;

  /**
   * @brief Prevents further modification. Safe to call concurrently.
   */
  void lock() const noexcept {
    _locked.store(true, std::memory_order_release);
  }

  bool is_locked() const noexcept {
    return _locked.load(std::memory_order_acquire);
  }

  /**
   * @brief Renders a Key | Value | Allowed | Description table
   * @param max_width Descriptions longer than this are truncated
   */
  std::string as_table(std::size_t max_width = 60) const;

 protected:
  /**
   * @brief Registers a setting with its default value
   *
   * Does nothing if the key already exists.
   *
   * @throws InvalidSettingValue if allowed is not empty and does not contain
   * value
   */
  void set_default(const std::string& key, const std::string& value,
                   const std::string& description,
                   std::vector<std::string> allowed = {});

 private:
  struct Entry {
    std::string value;
    std::string description;
    std::vector<std::string> allowed;
  };

  const Entry& entry(const std::string& key) const;

  /**
   * @throws SettingNotFound, InvalidSettingValue
   */
  void validate(const std::string& key, const std::string& value) const;

  void throw_if_locked() const;

  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  std::map<std::string, Entry> settings_;

  mutable std::atomic<bool> _locked{false};
};

}  // namespace qsym::ir::data
