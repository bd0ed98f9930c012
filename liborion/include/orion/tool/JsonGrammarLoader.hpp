// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_JSONGRAMMARLOADER_HPP
#define ORION_TOOL_JSONGRAMMARLOADER_HPP

#include "../runtime/Action.hpp"
#include "../runtime/Errors.hpp"
#include "../runtime/Grammar.hpp"
#include "../util/log.hpp"
#include "../util/print.hpp"

#include <cmath>
#include <format>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace orion {
namespace tool {

/*
 * Populates a weighted grammar from a JSON grammar definition: a symbol
 * list (nonterminals, keywords and terminals with their text) and a rule
 * list referring to symbols by id, with a weight class and optional
 * generation and representation action names per rule.
 */
class JsonGrammarLoader {
private:
  std::string start_;

public:
  JsonGrammarLoader() = default;
  JsonGrammarLoader(const JsonGrammarLoader& other) = delete;
  JsonGrammarLoader& operator=(const JsonGrammarLoader& other) = delete;
  JsonGrammarLoader(JsonGrammarLoader&& other) = delete;
  JsonGrammarLoader& operator=(JsonGrammarLoader&& other) = delete;
  ~JsonGrammarLoader() = default;

  // The start symbol named by the last loaded definition (may be empty).
  const std::string& start() const { return start_; }

  static std::map<std::string, runtime::Weight> weight_classes() {
    const runtime::Weight normal = 1000000;
    const runtime::Weight low = static_cast<runtime::Weight>(std::sqrt(static_cast<double>(normal)) + 1);
    const double log_normal = std::log(static_cast<double>(normal));
    const runtime::Weight medium = static_cast<runtime::Weight>(static_cast<double>(low) * log_normal * log_normal);
    return {{"N", normal}, {"L", low}, {"M", medium}, {"O", 10}};
  }

  // Returns false if the file cannot be read or is not JSON. Structural
  // problems of the definition are GrammarErrors (see parse).
  bool load(const std::string& fn, runtime::WeightedGrammar& grammar) {
    std::ifstream gf(fn);
    if (!gf) {
      util::perrf("Failed to open the grammar JSON file for reading: {}", fn);
      return false;
    }

    nlohmann::json data = nlohmann::json::parse(gf, nullptr, false, true);
    if (data.is_discarded()) {
      util::perrf("Invalid JSON in grammar file: {}", fn);
      return false;
    }
    parse(data, grammar);
    return true;
  }

  // Missing or mistyped fields of the definition are GrammarErrors too.
  void parse(const nlohmann::json& data, runtime::WeightedGrammar& grammar) {
    try {
      parse_definition(data, grammar);
    } catch (const nlohmann::json::exception& e) {
      throw runtime::GrammarError(std::format("Malformed grammar definition: {}", e.what()));
    }
  }

private:
  void parse_definition(const nlohmann::json& data, runtime::WeightedGrammar& grammar) {
    if (!data.is_object() || !data.contains("symbols") || !data.contains("rules")) {
      throw runtime::GrammarError("A grammar definition needs 'symbols' and 'rules'");
    }
    start_ = data.value("start", "");

    auto classes = weight_classes();
    if (data.contains("weight_classes")) {
      for (auto& [name, weight] : data["weight_classes"].items()) {
        classes[name] = weight.get<runtime::Weight>();
      }
    }

    std::map<std::string, const runtime::Symbol*> symbols;
    std::vector<std::string> declared_nts;
    for (const auto& entry : data["symbols"]) {
      std::string kind = entry.at("kind").get<std::string>();
      std::string id = entry.at("id").get<std::string>();
      if (symbols.contains(id)) {
        throw runtime::GrammarError(std::format("Name {} in symbol list twice", id));
      }

      std::string name;
      if (kind == "NT") {
        name = id;
        declared_nts.push_back(id);
      } else if (kind == "KW") {
        name = id;
      } else if (kind == "T") {
        name = entry.value("text", id);
      } else {
        throw runtime::GrammarError(std::format("Unknown symbol kind {} of {}", kind, id));
      }
      symbols[id] = grammar.symbols().intern(name);
    }

    std::set<std::string> nt_ids(declared_nts.begin(), declared_nts.end());
    std::set<std::string> defined;
    for (const auto& rule : data["rules"]) {
      std::string lhs_id = rule.at("lhs").get<std::string>();
      if (!nt_ids.contains(lhs_id)) {
        throw runtime::GrammarError(std::format("Left symbol {} is not a declared nonterminal", lhs_id));
      }

      nlohmann::json items = rule.value("rhs", nlohmann::json::array());
      if (!items.is_array()) {
        throw runtime::GrammarError(std::format("Right side of a rule of {} is not a list", lhs_id));
      }
      std::vector<const runtime::Symbol*> rhs;
      for (const auto& item : items) {
        std::string rhs_id = item.get<std::string>();
        auto it = symbols.find(rhs_id);
        if (it == symbols.end()) {
          throw runtime::GrammarError(std::format("Right symbol {} unknown in a rule of {}", rhs_id, lhs_id));
        }
        rhs.push_back(it->second);
      }

      runtime::GenAction gen = runtime::GenAction::None;
      if (rule.contains("gen")) {
        auto action = runtime::gen_action_from_name(rule["gen"].get<std::string>());
        if (!action) {
          throw runtime::GrammarError(std::format("Unknown generation action {}", rule["gen"].get<std::string>()));
        }
        gen = *action;
      }

      runtime::RepAction rep = runtime::RepAction::Default;
      if (rule.contains("rep")) {
        auto action = runtime::rep_action_from_name(rule["rep"].get<std::string>());
        if (!action) {
          throw runtime::GrammarError(std::format("Unknown representation action {}", rule["rep"].get<std::string>()));
        }
        rep = *action;
      }

      grammar.add_rule(grammar.productions().intern(symbols[lhs_id], rhs), rule_weight(rule, classes), gen, rep);
      defined.insert(lhs_id);
    }

    for (const auto& id : declared_nts) {
      if (!defined.contains(id)) {
        ORION_LOG_WARN("Nonterminal {} has no rules; it is generated as unimplemented", id);
        grammar.add_rule(grammar.productions().intern(symbols[id], {}), 1, runtime::GenAction::None, runtime::RepAction::Unimplemented);
      }
    }
  }

  static runtime::Weight rule_weight(const nlohmann::json& rule, const std::map<std::string, runtime::Weight>& classes) {
    if (!rule.contains("class")) {
      return classes.at("N");
    }
    const auto& cls = rule["class"];
    if (cls.is_number_integer()) {
      return cls.get<runtime::Weight>();
    }
    std::string name = cls.get<std::string>();
    auto it = classes.find(name);
    if (it == classes.end()) {
      throw runtime::GrammarError(std::format("Bad rule kind {}", name));
    }
    return it->second;
  }
};

} // namespace tool
} // namespace orion

#endif // ORION_TOOL_JSONGRAMMARLOADER_HPP
