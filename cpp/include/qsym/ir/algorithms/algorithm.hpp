// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <qsym/ir/data/settings.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qsym::ir::algorithms {

/**
 * @brief Base class for expression transforms
 *
 * run() locks the settings before delegating to _run_impl(), so an algorithm
 * is configured once and can then be shared between threads.
 *
 * @tparam ReturnType The return type of run() and _run_impl()
 * @tparam Args The input arguments of run() and _run_impl()
 */
template <typename ReturnType, typename... Args>
class Algorithm {
 public:
  Algorithm() = default;
  virtual ~Algorithm() = default;

  Algorithm(const Algorithm&) = delete;
  Algorithm& operator=(const Algorithm&) = delete;

  ReturnType run(Args... args) const {
    _settings->lock();
    return _run_impl(std::forward<Args>(args)...);
  }

  data::Settings& settings() { return *_settings; }
  const data::Settings& settings() const { return *_settings; }

  /**
   * @brief The name the algorithm is registered under
   */
  virtual std::string name() const = 0;

  /**
   * @brief The name of the algorithm family, e.g. "canonicalizer"
   */
  virtual std::string type_name() const = 0;

 protected:
  virtual ReturnType _run_impl(Args... args) const = 0;

  /// Replaced by derived classes with their own settings type
  std::unique_ptr<data::Settings> _settings =
      std::make_unique<data::Settings>();
};

/**
 * @brief Thread-safe registry of named algorithm implementations
 *
 * Each instantiation keeps its own registry. Derived provides
 * `algorithm_type_name()`, `default_algorithm_name()` and
 * `register_default_instances(Registry&)`; the defaults are added before the
 * registry becomes visible to any caller.
 *
 * Usage:
 * @code
 * CanonicalizerFactory::register_instance(
 *     []() { return std::make_unique<MyCanonicalizer>(); });
 * auto canonicalizer = CanonicalizerFactory::create("mine");
 * @endcode
 */
template <typename BaseAlgorithmType, typename Derived>
class AlgorithmFactory {
 public:
  using return_type = std::unique_ptr<BaseAlgorithmType>;
  using functor_type = std::function<return_type()>;

  /**
   * @brief Creates a new instance with default settings
   * @param name A registered name; the default implementation if empty
   * @throws std::runtime_error if the name is not registered
   */
  static return_type create(const std::string& name = "") {
    const std::string key =
        name.empty() ? Derived::default_algorithm_name() : name;
    functor_type make;
    {
      auto& reg = registry();
      std::lock_guard<std::mutex> guard(reg.mutex);
      auto it = reg.makers.find(key);
      if (it == reg.makers.end()) {
        throw std::runtime_error(prefix() + "no algorithm named '" + key +
                                 "', available options are: " +
                                 join_names(reg.makers));
      }
      make = it->second;
    }
    return make();
  }

  /**
   * @brief Adds an implementation under the name it reports
   * @throws std::runtime_error if the name is taken or the implementation
   * belongs to another algorithm family
   */
  static void register_instance(functor_type make) {
    add_instance(registry(), std::move(make));
  }

  /**
   * @return true if the name was registered
   */
  static bool unregister_instance(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> guard(reg.mutex);
    return reg.makers.erase(name) > 0;
  }

  /**
   * @brief Registered names in lexicographic order
   */
  static std::vector<std::string> available() {
    auto& reg = registry();
    std::lock_guard<std::mutex> guard(reg.mutex);
    std::vector<std::string> names;
    for (const auto& [name, _] : reg.makers) {
      names.push_back(name);
    }
    return names;
  }

  static bool has(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> guard(reg.mutex);
    return reg.makers.count(name) > 0;
  }

 protected:
  struct Registry {
    std::mutex mutex;
    std::map<std::string, functor_type> makers;
  };

  static void add_instance(Registry& reg, functor_type make) {
    const auto sample = make();
    if (sample->type_name() != Derived::algorithm_type_name()) {
      throw std::runtime_error(prefix() + "algorithm '" + sample->name() +
                               "' belongs to the family '" +
                               sample->type_name() + "'");
    }
    const std::string name = sample->name();

    std::lock_guard<std::mutex> guard(reg.mutex);
    if (!reg.makers.emplace(name, std::move(make)).second) {
      throw std::runtime_error(prefix() + "algorithm '" + name +
                               "' is already registered");
    }
  }

  static Registry& registry() {
    // Function-local static initialization runs exactly once, even under
    // concurrent first use.
    static const std::unique_ptr<Registry> instance = [] {
      auto reg = std::make_unique<Registry>();
      Derived::register_default_instances(*reg);
      return reg;
    }();
    return *instance;
  }

 private:
  static std::string prefix() {
    return "Algorithm factory for " + Derived::algorithm_type_name() + ": ";
  }

  static std::string join_names(
      const std::map<std::string, functor_type>& makers) {
    std::string names;
    for (const auto& [name, _] : makers) {
      if (!names.empty()) names += ", ";
      names += name;
    }
    return names;
  }
};

}  // namespace qsym::ir::algorithms
