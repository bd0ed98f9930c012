// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_GRAMMAR_HPP
#define ORION_RUNTIME_GRAMMAR_HPP

#include "../util/random.hpp"
#include "Action.hpp"
#include "Errors.hpp"
#include "Production.hpp"
#include "Symbol.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace orion {
namespace runtime {

using Weight = std::int64_t;

struct RuleEntry {
  const Production* production;
  Weight weight;
  GenAction gen;
  RepAction rep;
  size_t index;
};

struct Nonterminal {
  const Symbol* symbol;
  Weight total;
  std::vector<size_t> rules;  // Indices into the rule table, in registration order.
  size_t index;
};

// The weights of the rules of one nonterminal, in registration order.
struct NonterminalWeights {
  const Symbol* symbol;
  std::vector<Weight> weights;
};

/*
 * Weighted context-free grammar. Owns the symbol and production registries it
 * is built from, the rule table and the per-nonterminal grouping of rules.
 * Weights can be exported and re-imported positionally, which is how
 * candidate weight vectors are armed and rolled back.
 */
class WeightedGrammar {
private:
  SymbolRegistry symbols_;
  ProductionRegistry productions_;
  std::vector<RuleEntry> rules_;
  std::vector<Nonterminal> nonterminals_;
  std::unordered_map<const Symbol*, size_t> nt_index_;
  std::unordered_set<const Production*> added_;

public:
  WeightedGrammar() = default;
  WeightedGrammar(const WeightedGrammar& other) = delete;
  WeightedGrammar& operator=(const WeightedGrammar& other) = delete;
  WeightedGrammar(WeightedGrammar&& other) = delete;
  WeightedGrammar& operator=(WeightedGrammar&& other) = delete;
  ~WeightedGrammar() = default;

  SymbolRegistry& symbols() { return symbols_; }
  const SymbolRegistry& symbols() const { return symbols_; }
  ProductionRegistry& productions() { return productions_; }

  void add_rule(const Production* production, Weight weight, GenAction gen = GenAction::None, RepAction rep = RepAction::Default) {
    if (!production) {
      throw GrammarError("Cannot add a null rule");
    }
    if (weight < 1) {
      throw GrammarError(std::format("The weight {} of rule {} is less than 1", weight, production->format()));
    }
    if (added_.contains(production)) {
      throw GrammarError(std::format("Duplicate rule {}", production->format()));
    }

    auto it = nt_index_.find(production->lhs);
    if (it == nt_index_.end()) {
      it = nt_index_.emplace(production->lhs, nonterminals_.size()).first;
      nonterminals_.push_back({production->lhs, 0, {}, nonterminals_.size()});
    }

    size_t index = rules_.size();
    added_.insert(production);
    rules_.push_back({production, weight, gen, rep, index});
    Nonterminal& nt = nonterminals_[it->second];
    nt.total += weight;
    nt.rules.push_back(index);
  }

  // Convenience for building grammars in code: interns the symbols and the production.
  void add_rule(const std::string& lhs, const std::vector<std::string>& rhs, Weight weight,
                GenAction gen = GenAction::None, RepAction rep = RepAction::Default) {
    std::vector<const Symbol*> rhs_symbols;
    rhs_symbols.reserve(rhs.size());
    for (const auto& name : rhs) {
      rhs_symbols.push_back(symbols_.intern(name));
    }
    add_rule(productions_.intern(symbols_.intern(lhs), rhs_symbols), weight, gen, rep);
  }

  bool is_nonterminal(const Symbol* symbol) const {
    return nt_index_.contains(symbol);
  }

  const Nonterminal& nonterminal(const Symbol* symbol) const {
    auto it = nt_index_.find(symbol);
    if (it == nt_index_.end()) {
      throw GrammarError(std::format("Symbol {} is not a nonterminal", symbol ? symbol->name : "<null>"));
    }
    return nonterminals_[it->second];
  }

  const std::vector<Nonterminal>& nonterminals() const { return nonterminals_; }
  const std::vector<RuleEntry>& rules() const { return rules_; }
  size_t rule_count() const { return rules_.size(); }
  size_t nt_count() const { return nonterminals_.size(); }

  // Draws uniformly from [1, total] and returns the first rule (in
  // registration order) whose running weight sum reaches the draw.
  const RuleEntry& random_rule(const Symbol* symbol, util::RandomEngine& rng) const {
    const Nonterminal& nt = nonterminal(symbol);
    if (nt.total < 1) {
      throw GrammarError(std::format("Nonterminal {} has no positive weight", symbol->name));
    }
    Weight choice = util::random_int<Weight>(rng, 1, nt.total);
    Weight running = 0;
    for (size_t index : nt.rules) {
      running += rules_[index].weight;
      if (choice <= running) {
        return rules_[index];
      }
    }
    return rules_[nt.rules.back()];
  }

  std::string rule_name(size_t index) const {
    return std::format("Rule.{}.{}", rules_[index].production->lhs->name, index);
  }

  std::vector<Weight> to_weights() const {
    std::vector<Weight> weights;
    weights.reserve(rules_.size());
    for (const RuleEntry& entry : rules_) {
      weights.push_back(entry.weight);
    }
    return weights;
  }

  void set_weights(const std::vector<Weight>& weights, bool require_positive = true) {
    if (weights.size() != rules_.size()) {
      throw GrammarError(std::format("Weights length {} != rule table length {}", weights.size(), rules_.size()));
    }
    for (size_t i = 0; i < weights.size(); ++i) {
      if (weights[i] < 0 || (require_positive && weights[i] < 1)) {
        throw GrammarError(std::format("Input weight {} is {}", i, weights[i]));
      }
    }
    for (size_t i = 0; i < weights.size(); ++i) {
      rules_[i].weight = weights[i];
    }
    recompute_totals();
  }

  // Changes the weight of one rule without touching the totals.
  void set_rule_weight(size_t index, Weight weight) {
    rules_[index].weight = weight;
  }

  void recompute_total(size_t nt_index) {
    Nonterminal& nt = nonterminals_[nt_index];
    nt.total = 0;
    for (size_t index : nt.rules) {
      nt.total += rules_[index].weight;
    }
  }

  void recompute_totals() {
    for (size_t i = 0; i < nonterminals_.size(); ++i) {
      recompute_total(i);
    }
  }

  NonterminalWeights project_nt(const Symbol* symbol) const {
    const Nonterminal& nt = nonterminal(symbol);
    NonterminalWeights result{symbol, {}};
    result.weights.reserve(nt.rules.size());
    for (size_t index : nt.rules) {
      result.weights.push_back(rules_[index].weight);
    }
    return result;
  }

  NonterminalWeights random_nt(util::RandomEngine& rng) const {
    if (nonterminals_.empty()) {
      throw GrammarError("The grammar has no nonterminals");
    }
    return project_nt(util::random_choice(rng, nonterminals_).symbol);
  }

  void update_nt(const NonterminalWeights& group) {
    const Nonterminal& nt = nonterminal(group.symbol);
    if (group.weights.size() != nt.rules.size()) {
      throw GrammarError(std::format("Nonterminal {} has {} rules, got {} weights",
                                     group.symbol->name, nt.rules.size(), group.weights.size()));
    }
    for (size_t i = 0; i < nt.rules.size(); ++i) {
      rules_[nt.rules[i]].weight = group.weights[i];
    }
    recompute_total(nt.index);
  }

  // The weight vector as a JSON array with every weight annotated by its
  // rule. Loadable again as weights.
  std::string human_weights() const {
    size_t width = 1;
    for (const RuleEntry& entry : rules_) {
      width = std::max(width, std::to_string(entry.weight).size());
    }
    std::string result = "[\n";
    for (size_t i = 0; i < rules_.size(); ++i) {
      result += std::format("  {:>{}}{} // {}\n", rules_[i].weight, width, i + 1 < rules_.size() ? "," : " ",
                            rules_[i].production->format());
    }
    result += "]\n";
    return result;
  }

  // BNF-like listing of the rules, grouped by nonterminal, starting with
  // the start symbol (if given) and the others sorted by name.
  std::string format(const Symbol* start = nullptr) const {
    std::vector<const Nonterminal*> order;
    for (const Nonterminal& nt : nonterminals_) {
      if (nt.symbol != start) {
        order.push_back(&nt);
      }
    }
    std::sort(order.begin(), order.end(), [](const Nonterminal* a, const Nonterminal* b) {
      return SymbolNameLess()(a->symbol, b->symbol);
    });
    if (start && is_nonterminal(start)) {
      order.insert(order.begin(), &nonterminal(start));
    }

    std::string result;
    for (const Nonterminal* nt : order) {
      result += std::format("{} ::=  // total weight = {}\n", nt->symbol->name, nt->total);
      const char* separator = "   ";
      for (size_t index : nt->rules) {
        result += separator;
        for (const Symbol* symbol : rules_[index].production->rhs) {
          result += " " + symbol->name;
        }
        result += std::format("  // {}\n", rules_[index].weight);
        separator = " | ";
      }
      result += " ;\n";
    }
    return result;
  }
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_GRAMMAR_HPP
