// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_JSONUNIVERSELOADER_HPP
#define ORION_TOOL_JSONUNIVERSELOADER_HPP

#include "../runtime/Errors.hpp"
#include "../runtime/Scope.hpp"
#include "../util/print.hpp"

#include <format>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace orion {
namespace tool {

class JsonUniverseLoader {
public:
  JsonUniverseLoader() = default;
  JsonUniverseLoader(const JsonUniverseLoader& other) = delete;
  JsonUniverseLoader& operator=(const JsonUniverseLoader& other) = delete;
  JsonUniverseLoader(JsonUniverseLoader&& other) = delete;
  JsonUniverseLoader& operator=(JsonUniverseLoader&& other) = delete;

  bool load(const std::string& fn, runtime::Universe& universe) {
    std::ifstream uf(fn);
    if (!uf) {
      util::perrf("Failed to open the universe JSON file for reading: {}", fn);
      return false;
    }

    nlohmann::json data = nlohmann::json::parse(uf, nullptr, false, true);
    if (data.is_discarded() || !data.is_object()) {
      util::perrf("Invalid JSON in universe file: {}", fn);
      return false;
    }
    parse(data, universe);
    return true;
  }

  // Every universe object must be a JSON object; missing or mistyped fields
  // are GrammarErrors.
  void parse(const nlohmann::json& data, runtime::Universe& universe) {
    try {
      parse_objects(data, universe);
    } catch (const nlohmann::json::exception& e) {
      throw runtime::GrammarError(std::format("Malformed universe definition: {}", e.what()));
    }
  }

private:
  void parse_objects(const nlohmann::json& data, runtime::Universe& universe) {
    if (!data.is_object()) {
      throw runtime::GrammarError("A universe definition must be a JSON object");
    }
    for (auto& [key, object] : data.items()) {
      if (!object.is_object()) {
        throw runtime::GrammarError(std::format("Universe object {} is not a JSON object", key));
      }
      std::string kind_name = object.value("kind", "TABLE");
      auto kind = runtime::source_kind_from_name(kind_name);
      if (!kind || !runtime::is_physical(*kind)) {
        throw runtime::GrammarError(std::format("Unknown kind {} of universe object {}", kind_name, key));
      }
      universe.add(key, {object.value("schema", ""),
                         object.value("name", key),
                         object.value("alias", ""),
                         *kind,
                         object.value("columns", std::vector<std::string>{})});
    }
  }
};

} // namespace tool
} // namespace orion

#endif // ORION_TOOL_JSONUNIVERSELOADER_HPP
