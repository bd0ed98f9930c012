// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_CONFIGURATION_HPP
#define ORION_TOOL_CONFIGURATION_HPP

#include "../runtime/Errors.hpp"
#include "../util/print.hpp"

#include <format>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace orion {
namespace tool {

/*
 * Run-time settings: built-in defaults overlaid by a JSON configuration
 * file. Command-line options of the tools are applied on top with set().
 */
class Configuration {
private:
  nlohmann::json values_;

public:
  Configuration() : values_(defaults()) { }
  Configuration(const Configuration& other) = default;
  Configuration& operator=(const Configuration& other) = default;
  Configuration(Configuration&& other) = default;
  Configuration& operator=(Configuration&& other) = default;
  ~Configuration() = default;

  static nlohmann::json defaults() {
    return {
      {"start", "sql_statement"},
      {"top_weight", 1000000},
      {"max_radius", 1.0},
      {"adjust_consistency", false},
      {"repair_attempts", 20000},
      {"breed_mutate", "nonterminal"},
      {"breed_mate", "nonterminal"},
      {"log_level", "error"},
      {"grammar", ""},
      {"universe", ""},
      {"weights_in", ""},
    };
  }

  // Merges the settings of a JSON object file. Returns false (and reports
  // the problem) if the file is unreadable or not a JSON object.
  bool load(const std::string& fn) {
    std::ifstream cf(fn);
    if (!cf) {
      util::perrf("Failed to open the configuration file for reading: {}", fn);
      return false;
    }

    nlohmann::json data = nlohmann::json::parse(cf, nullptr, false, true);
    if (data.is_discarded() || !data.is_object()) {
      util::perrf("Invalid JSON in configuration file: {}", fn);
      return false;
    }
    values_.update(data);
    return true;
  }

  bool has(const std::string& key) const {
    return values_.contains(key) && !values_[key].is_null();
  }

  template<class T>
  T value(const std::string& key) const {
    if (!has(key)) {
      throw runtime::GrammarError(std::format("No configuration for {}", key));
    }
    try {
      return values_[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
      throw runtime::GrammarError(std::format("Configuration {} has the wrong type: {}", key, e.what()));
    }
  }

  template<class T>
  void set(const std::string& key, const T& value) {
    values_[key] = value;
  }

  std::string format() const {
    return values_.dump(2);
  }
};

} // namespace tool
} // namespace orion

#endif // ORION_TOOL_CONFIGURATION_HPP
