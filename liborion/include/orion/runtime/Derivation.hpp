// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_DERIVATION_HPP
#define ORION_RUNTIME_DERIVATION_HPP

#include "../util/log.hpp"
#include "../util/random.hpp"
#include "Action.hpp"
#include "DerivationTree.hpp"
#include "Errors.hpp"
#include "Grammar.hpp"
#include "Listener.hpp"
#include "Scope.hpp"
#include "ScopeCatalog.hpp"

#include <cstdint>
#include <deque>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orion {
namespace runtime {

// Outcome of rendering a subtree: its text, or the reason it has none.
class RenderResult {
private:
  bool ok_;
  std::string value_;

  RenderResult(bool ok, std::string value) : ok_(ok), value_(std::move(value)) { }

public:
  static RenderResult success(std::string text) { return RenderResult(true, std::move(text)); }
  static RenderResult failure(std::string reason) { return RenderResult(false, std::move(reason)); }

  bool ok() const { return ok_; }
  const std::string& text() const { return value_; }
  const std::string& reason() const { return value_; }
};

// What a generation action hands back to be stored on its node.
struct GenOutcome {
  std::optional<std::string> text{};
  ScopeSegment* scope{nullptr};
};

struct GenerationResult {
  std::string start;
  std::uint64_t seed;
  std::string text;
  bool success;
  std::string reason;
  std::map<std::string, int> production_counts;
};

/*
 * Expands a start symbol into a derivation tree with weighted-random rule
 * choices and renders it to text. Every call runs on its own random engine
 * and scope catalog, so the result depends only on the grammar weights, the
 * universe and the seed.
 */
class DerivationEngine {
public:
  static constexpr const char* fallback_statement = "select null from dual where 1 = 0";

private:
  const WeightedGrammar& grammar_;
  const Universe& universe_;
  std::vector<Listener*> listeners_;

public:
  DerivationEngine(const WeightedGrammar& grammar, const Universe& universe, const std::vector<Listener*>& listeners = {})
      : grammar_(grammar), universe_(universe), listeners_(listeners) { }

  DerivationEngine(const DerivationEngine& other) = delete;
  DerivationEngine& operator=(const DerivationEngine& other) = delete;
  DerivationEngine(DerivationEngine&& other) = delete;
  DerivationEngine& operator=(DerivationEngine&& other) = delete;

  ~DerivationEngine() {
    for (Listener* listener : listeners_) {
      delete listener;
    }
  }

  // Takes ownership of the listener.
  void add_listener(Listener* listener) {
    listeners_.push_back(listener);
  }

  GenerationResult generate(const std::string& start, std::uint64_t seed, bool count_productions = false) const {
    const Symbol* symbol = grammar_.symbols().find(start);
    if (!symbol) {
      throw GrammarError(std::format("Unknown start symbol {}", start));
    }
    return generate(symbol, seed, count_productions);
  }

  GenerationResult generate(const Symbol* start, std::uint64_t seed, bool count_productions = false) const {
    if (!grammar_.is_nonterminal(start)) {
      throw GrammarError(std::format("Start symbol {} is not a nonterminal", start->name));
    }

    util::RandomEngine rng(seed);
    ScopeCatalog catalog(universe_, rng);
    DerivationTree tree(start);
    GenerationResult result{start->name, seed, "", true, "OK", {}};

    for (Listener* listener : listeners_) {
      listener->start_derivation(tree);
    }

    std::deque<size_t> work{DerivationTree::root};
    while (!work.empty()) {
      size_t index = work.front();
      work.pop_front();
      const Symbol* symbol = tree[index].symbol;
      if (!grammar_.is_nonterminal(symbol)) {
        continue;
      }

      const RuleEntry& rule = grammar_.random_rule(symbol, rng);
      tree[index].rule = &rule;
      tree[index].gen = rule.gen;
      tree[index].rep = rule.rep;
      enter_rule(tree, index, rule);

      GenOutcome outcome = run_gen_action(rule.gen, catalog);
      if (outcome.text) {
        tree[index].text = std::move(*outcome.text);
        tree[index].has_text = true;
      }
      if (outcome.scope) {
        tree[index].scope = outcome.scope;
      }
      if (count_productions) {
        result.production_counts[grammar_.rule_name(rule.index)]++;
      }

      const auto& rhs = rule.production->rhs;
      std::vector<size_t> children;
      children.reserve(rhs.size());
      for (const Symbol* child : rhs) {
        children.push_back(tree.add_child(index, child));
      }
      work.insert(work.begin(), children.begin(), children.end());
      exit_rule(tree, index, rule);
    }

    Renderer renderer(grammar_, tree, catalog, rng);
    RenderResult rendered = renderer.render(DerivationTree::root);
    std::string text;
    if (rendered.ok()) {
      text = rendered.text();
    } else {
      ORION_LOG_WARN("Rendering from seed {} failed: {}", seed, rendered.reason());
      text = fallback_statement;
      result.success = false;
      result.reason = rendered.reason();
    }
    result.text = std::format("/*{}*/ {}", seed, text);
    return result;
  }

private:
  void enter_rule(const DerivationTree& tree, size_t node, const RuleEntry& rule) const {
    for (Listener* listener : listeners_) {
      listener->enter_rule(tree, node, rule);
    }
  }

  void exit_rule(const DerivationTree& tree, size_t node, const RuleEntry& rule) const {
    for (auto it = listeners_.rbegin(); it != listeners_.rend(); ++it) {
      (*it)->exit_rule(tree, node, rule);
    }
  }

  static GenOutcome run_gen_action(GenAction action, ScopeCatalog& catalog) {
    switch (action) {
      case GenAction::None:
        return {};
      case GenAction::SchemaName:
        return {catalog.add_schema()};
      case GenAction::TableName:
        return {catalog.add_table()};
      case GenAction::TableAlias:
        return {catalog.get_alias()};
      case GenAction::SourceAlias:
        return {catalog.add_source_alias_for_table()};
      case GenAction::SubQuery:
        return {std::nullopt, catalog.push_segment()};
      case GenAction::EndOfSubquery:
        catalog.pop_segment();
        return {};
    }
    return {};
  }

  class Renderer {
  private:
    const WeightedGrammar& grammar_;
    const DerivationTree& tree_;
    ScopeCatalog& catalog_;
    util::RandomEngine& rng_;

  public:
    Renderer(const WeightedGrammar& grammar, const DerivationTree& tree, ScopeCatalog& catalog, util::RandomEngine& rng)
        : grammar_(grammar), tree_(tree), catalog_(catalog), rng_(rng) { }

    RenderResult render(size_t index) {
      const DerivationNode& node = tree_[index];
      if (!grammar_.is_nonterminal(node.symbol)) {
        return RenderResult::success(node.symbol->name);
      }

      switch (node.rep) {
        case RepAction::Default:
          return render_joined(node, " ");
        case RepAction::Text:
          if (!node.has_text) {
            return RenderResult::failure(std::format("no text stored for {}", node.symbol->name));
          }
          return RenderResult::success(node.text);
        case RepAction::TightConcat:
          return render_joined(node, "");
        case RepAction::TightOper:
          return render_tight(node, 3, "", "");
        case RepAction::TightUnary:
          return render_tight(node, 2, "", "");
        case RepAction::TightParen: {
          if (node.children.size() < 2) {
            return arity_failure(node, 2);
          }
          RenderResult inside = render(node.children[1]);
          if (!inside.ok()) {
            return inside;
          }
          return RenderResult::success("(" + trim(inside.text()) + ")");
        }
        case RepAction::BetterCommas: {
          RenderResult text = render_joined(node, " ");
          return text.ok() ? RenderResult::success(replace_all(text.text(), " ,", ",")) : text;
        }
        case RepAction::SqueezeBlanks: {
          RenderResult text = render_joined(node, " ");
          return text.ok() ? RenderResult::success(replace_all(text.text(), " ", "")) : text;
        }
        case RepAction::SubQuery:
          catalog_.enter_segment(node.scope);
          return render_joined(node, " ");
        case RepAction::EndOfSubquery:
          catalog_.pop_segment();
          return RenderResult::success("");
        case RepAction::SchemaName:
          return RenderResult::success(catalog_.choose_schema());
        case RepAction::TableName:
          return RenderResult::success(catalog_.choose_table());
        case RepAction::TableAlias:
          return RenderResult::success(catalog_.choose_alias());
        case RepAction::TableRef:
          return render_table_ref(node);
        case RepAction::ViewName:
          return RenderResult::success(catalog_.choose_view());
        case RepAction::MaterializedViewName:
          return RenderResult::success(catalog_.choose_materialized_view());
        case RepAction::SequenceName:
          return RenderResult::success(catalog_.choose_sequence());
        case RepAction::ColumnRef:
          catalog_.choose_alias();
          return RenderResult::success(catalog_.choose_column());
        case RepAction::ColumnTableRef:
          return RenderResult::success(column_table_ref());
        case RepAction::ColumnTableSchemaRef: {
          std::string schema = catalog_.choose_schema();
          if (schema == ScopeCatalog::unknown_schema) {
            return RenderResult::success(column_table_ref());
          }
          return RenderResult::success(schema + "." + column_table_ref());
        }
        case RepAction::ColumnAlias: {
          std::optional<std::string> alias = catalog_.choose_column_alias();
          if (!alias) {
            return RenderResult::failure(std::format("no alias registered for the column chosen by {}", node.symbol->name));
          }
          return RenderResult::success(*alias);
        }
        case RepAction::QueryRef:
          return RenderResult::success("CafeBabe");
        case RepAction::TickKeyword: {
          if (node.children.empty()) {
            return arity_failure(node, 1);
          }
          RenderResult inside = render(node.children[0]);
          if (!inside.ok()) {
            return inside;
          }
          std::string text = inside.text();
          size_t pos = text.find("&q");
          if (pos != std::string::npos) {
            text.erase(pos, 2);
          }
          return RenderResult::success(text);
        }
        case RepAction::OrdIdent:
          return RenderResult::success(random_text("abcdefghijklmnopqrstuvwxyz", 1, 1)
                                       + random_text("abcdefghijklmnopqrstuvwxyz0123456789", 1, 10));
        case RepAction::QuoteIdent:
          return RenderResult::success("\"" + random_text("abcdefghijklmnopqrstuvwxyz0123456789~!@#$%^&*()_+", 1, 10) + "\"");
        case RepAction::TickString:
          return RenderResult::success("'" + random_text("abcdefghijklmnopqrstuvwxyz0123456789", 1, 20) + "'");
        case RepAction::IntegerLit:
          return RenderResult::success(random_text("0123456789", 1, 41));
        case RepAction::SmallInt:
          return RenderResult::success(std::format("{}{}", util::random_bool(rng_) ? "0" : "", util::random_int(rng_, 0, 40)));
        case RepAction::MediumInt:
          return RenderResult::success(std::format("{}{}", util::random_bool(rng_) ? "0" : "", util::random_int(rng_, 0, 4009)));
        case RepAction::NumberLit:
          return RenderResult::success(std::format("{}.{}", util::random_int(rng_, 0, 99), util::random_int(rng_, 0, 99)));
        case RepAction::IeeeLit: {
          static constexpr std::string_view exponents[] = {"E", "E+", "E-"};
          int whole = util::random_int(rng_, 0, 99);
          int fraction = util::random_int(rng_, 0, 99);
          std::string_view exponent = exponents[util::random_int(rng_, 0, 2)];
          return RenderResult::success(std::format("{}.{}{}{}", whole, fraction, exponent, util::random_int(rng_, 0, 9)));
        }
        case RepAction::FormatLit:
          return RenderResult::success("'999'");
        case RepAction::NlsParam:
          return RenderResult::success("'NLS_NUMERIC_CHARACTERS = '',.'''");
        case RepAction::Unimplemented:
          return RenderResult::failure(std::format("unimplemented {}", node.symbol->name));
      }
      return RenderResult::failure(std::format("unknown representation of {}", node.symbol->name));
    }

  private:
    // Children joined by `separator`, empty ones skipped, trimmed.
    RenderResult render_joined(const DerivationNode& node, std::string_view separator) {
      std::string text;
      for (size_t child : node.children) {
        RenderResult part = render(child);
        if (!part.ok()) {
          return part;
        }
        if (part.text().empty()) {
          continue;
        }
        if (!text.empty()) {
          text += separator;
        }
        text += part.text();
      }
      return RenderResult::success(trim(text));
    }

    RenderResult render_tight(const DerivationNode& node, size_t arity, std::string_view prefix, std::string_view suffix) {
      if (node.children.size() < arity) {
        return arity_failure(node, arity);
      }
      std::string text(prefix);
      for (size_t i = 0; i < arity; ++i) {
        RenderResult part = render(node.children[i]);
        if (!part.ok()) {
          return part;
        }
        text += trim(part.text());
      }
      text += suffix;
      return RenderResult::success(text);
    }

    // `name` or `qualifier . name` under a single child.
    RenderResult render_table_ref(const DerivationNode& node) {
      if (node.children.empty()) {
        return arity_failure(node, 1);
      }
      const auto& grandchildren = tree_[node.children[0]].children;
      if (grandchildren.empty()) {
        return render(node.children[0]);
      }
      RenderResult first = render(grandchildren[0]);
      if (!first.ok() || grandchildren.size() < 3) {
        return first;
      }
      RenderResult last = render(grandchildren[2]);
      if (!last.ok()) {
        return last;
      }
      return RenderResult::success(first.text() + "." + last.text());
    }

    std::string column_table_ref() {
      std::string alias = catalog_.choose_alias();
      std::string column = catalog_.choose_column();
      return alias + "." + column;
    }

    std::string random_text(std::string_view charset, int min_length, int max_length) {
      int length = util::random_int(rng_, min_length, max_length);
      std::string text;
      text.reserve(length);
      for (int i = 0; i < length; ++i) {
        text += charset[util::random_index(rng_, charset.size())];
      }
      return text;
    }

    static RenderResult arity_failure(const DerivationNode& node, size_t arity) {
      return RenderResult::failure(std::format("{} needs at least {} children, has {}", node.symbol->name, arity, node.children.size()));
    }

    static std::string trim(const std::string& text) {
      size_t begin = text.find_first_not_of(" \t\n");
      if (begin == std::string::npos) {
        return "";
      }
      size_t end = text.find_last_not_of(" \t\n");
      return text.substr(begin, end - begin + 1);
    }

    static std::string replace_all(std::string text, std::string_view from, std::string_view to) {
      size_t pos = 0;
      while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
      }
      return text;
    }
  };
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_DERIVATION_HPP
