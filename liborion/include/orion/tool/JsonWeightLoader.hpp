// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_JSONWEIGHTLOADER_HPP
#define ORION_TOOL_JSONWEIGHTLOADER_HPP

#include "../runtime/Grammar.hpp"
#include "../util/print.hpp"

#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace orion {
namespace tool {

// Weight vectors are flat JSON arrays of integers. Comments are allowed,
// which is how human_weights() annotates every weight with its rule.
class JsonWeightLoader {
public:
  JsonWeightLoader() = default;
  JsonWeightLoader(const JsonWeightLoader& other) = delete;
  JsonWeightLoader& operator=(const JsonWeightLoader& other) = delete;
  JsonWeightLoader(JsonWeightLoader&& other) = delete;
  JsonWeightLoader& operator=(JsonWeightLoader&& other) = delete;

  bool load(const std::string& fn, std::vector<runtime::Weight>& weights) {
    std::ifstream wf(fn);
    if (!wf) {
      util::perrf("Failed to open the weights JSON file for reading: {}", fn);
      return false;
    }

    nlohmann::json data = nlohmann::json::parse(wf, nullptr, false, true);
    if (data.is_discarded() || !data.is_array()) {
      util::perrf("Invalid JSON in weights file: {}", fn);
      return false;
    }

    weights.clear();
    for (const auto& w : data) {
      if (!w.is_number_integer()) {
        util::perrf("Non-integer weight {} in weights file: {}", w.dump(), fn);
        return false;
      }
      weights.push_back(w.get<runtime::Weight>());
    }
    return true;
  }

  bool save(const std::string& fn, const runtime::WeightedGrammar& grammar) {
    if (!util::pfile(fn, grammar.human_weights())) {
      util::perrf("Failed to write the weights JSON file: {}", fn);
      return false;
    }
    return true;
  }
};

} // namespace tool
} // namespace orion

#endif // ORION_TOOL_JSONWEIGHTLOADER_HPP
