// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <iomanip>
#include <qsym/ir/data/settings.hpp>
#include <sstream>

#include "json_serialization.hpp"

namespace qsym::ir::data {

namespace detail {

std::string format_options(const std::vector<std::string>& values) {
  std::string options_str = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) options_str += ", ";
    options_str += "\"" + values[i] + "\"";
  }
  return options_str + "]";
}

bool is_allowed(const std::string& value,
                const std::vector<std::string>& allowed) {
  return allowed.empty() ||
         std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

}  // namespace detail

InvalidSettingValue::InvalidSettingValue(
    const std::string& key, const std::string& value,
    const std::vector<std::string>& allowed)
    : std::invalid_argument("Value '" + value + "' for setting '" + key +
                            "' is out of allowed options. Allowed options: " +
                            detail::format_options(allowed)) {}

const Settings::Entry& Settings::entry(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

void Settings::validate(const std::string& key,
                        const std::string& value) const {
  const auto& allowed = entry(key).allowed;
  if (!detail::is_allowed(value, allowed)) {
    throw InvalidSettingValue(key, value, allowed);
  }
}

void Settings::throw_if_locked() const {
  if (is_locked()) {
    throw SettingsAreLocked();
  }
}

const std::string& Settings::get(const std::string& key) const {
  return entry(key).value;
}

void Settings::set(const std::string& key, const std::string& value) {
  throw_if_locked();
  validate(key, value);
  settings_[key].value = value;
}

bool Settings::has(const std::string& key) const {
  return settings_.find(key) != settings_.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(settings_.size());
  for (const auto& [key, _] : settings_) {
    result.push_back(key);
  }
  return result;
}

const std::string& Settings::get_description(const std::string& key) const {
  return entry(key).description;
}

const std::vector<std::string>& Settings::get_allowed_values(
    const std::string& key) const {
  return entry(key).allowed;
}

void Settings::update(const std::map<std::string, std::string>& values) {
  throw_if_locked();
  for (const auto& [key, value] : values) {
    validate(key, value);
  }
  for (const auto& [key, value] : values) {
    settings_[key].value = value;
  }
}

void Settings::update(const Settings& other) {
  std::map<std::string, std::string> values;
  for (const auto& [key, other_entry] : other.settings_) {
    if (has(key)) {
      values[key] = other_entry.value;
    }
  }
  update(values);
}

void Settings::update_from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::runtime_error("Settings JSON must be an object");
  }

  std::map<std::string, std::string> values;
  for (const auto& [key, value] : json.items()) {
    if (key == "version") {
      if (!value.is_string()) {
        throw std::runtime_error("Settings version must be a string");
      }
      validate_serialization_version(SERIALIZATION_VERSION,
                                     value.get<std::string>());
      continue;
    }
    if (!value.is_string()) {
      throw std::invalid_argument("Value of setting '" + key +
                                  "' must be a JSON string, got " +
                                  value.type_name());
    }
    values[key] = value.get<std::string>();
  }
  update(values);
}

void Settings::update_from_json_file(const std::string& filename) {
  update_from_json(read_json_file(filename, "Settings"));
}

nlohmann::json Settings::to_json() const {
  nlohmann::json json_obj;
  json_obj["version"] = SERIALIZATION_VERSION;
  for (const auto& [key, setting] : settings_) {
    json_obj[key] = setting.value;
  }
  return json_obj;
}

void Settings::to_json_file(const std::string& filename) const {
  write_json_file(filename, to_json());
}

std::string Settings::as_table(std::size_t max_width) const {
  std::size_t key_width = 3;
  std::size_t value_width = 5;
  std::size_t allowed_width = 7;
  std::map<std::string, std::string> allowed_strings;

  for (const auto& [key, setting] : settings_) {
    key_width = std::max(key_width, key.size());
    value_width = std::max(value_width, setting.value.size());
    if (!setting.allowed.empty()) {
      auto options = detail::format_options(setting.allowed);
      allowed_width = std::max(allowed_width, options.size());
      allowed_strings[key] = std::move(options);
    }
  }

  std::ostringstream oss;
  oss << std::left << std::setw(key_width) << "Key" << " | "
      << std::setw(value_width) << "Value" << " | " << std::setw(allowed_width)
      << "Allowed" << " | Description\n";
  oss << std::string(key_width + value_width + allowed_width + 9 +
                         std::min<std::size_t>(max_width, 11),
                     '-')
      << "\n";

  for (const auto& [key, setting] : settings_) {
    std::string description = setting.description;
    if (description.size() > max_width && max_width > 3) {
      description = description.substr(0, max_width - 3) + "...";
    }
    auto allowed_it = allowed_strings.find(key);
    oss << std::setw(key_width) << key << " | " << std::setw(value_width)
        << setting.value << " | " << std::setw(allowed_width)
        << (allowed_it == allowed_strings.end() ? "" : allowed_it->second)
        << " | " << description << "\n";
  }

  return oss.str();
}

void Settings::set_default(const std::string& key, const std::string& value,
                           const std::string& description,
                           std::vector<std::string> allowed) {
  if (has(key)) {
    return;
  }
  if (!detail::is_allowed(value, allowed)) {
    throw InvalidSettingValue(key, value, allowed);
  }
  settings_[key] = Entry{value, description, std::move(allowed)};
}

}  // namespace qsym::ir::data
