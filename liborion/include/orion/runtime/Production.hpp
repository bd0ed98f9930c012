// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_PRODUCTION_HPP
#define ORION_RUNTIME_PRODUCTION_HPP

#include "Symbol.hpp"

#include <format>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace orion {
namespace runtime {

/*
 * Production rule: a left-hand nonterminal and the (possibly empty) sequence
 * of symbols it is replaced with.
 */
class Production {
public:
  const Symbol* const lhs;
  const std::vector<const Symbol*> rhs;
  const size_t id;

  Production(const Symbol* lhs, const std::vector<const Symbol*>& rhs, size_t id) : lhs(lhs), rhs(rhs), id(id) { }
  Production(const Production& other) = delete;
  Production& operator=(const Production& other) = delete;
  Production(Production&& other) = delete;
  Production& operator=(Production&& other) = delete;
  ~Production() = default;

  std::string format() const {
    std::string result = lhs->name + " ::=";
    for (const Symbol* symbol : rhs) {
      result += " " + symbol->name;
    }
    return result;
  }
};

class ProductionRegistry {
private:
  using Key = std::pair<size_t, std::vector<size_t>>;

  std::vector<Production*> productions_;
  std::map<Key, Production*> by_key_;

  static Key make_key(const Symbol* lhs, const std::vector<const Symbol*>& rhs) {
    std::vector<size_t> rhs_ids;
    rhs_ids.reserve(rhs.size());
    for (const Symbol* symbol : rhs) {
      rhs_ids.push_back(symbol->id);
    }
    return {lhs->id, std::move(rhs_ids)};
  }

public:
  ProductionRegistry() = default;
  ProductionRegistry(const ProductionRegistry& other) = delete;
  ProductionRegistry& operator=(const ProductionRegistry& other) = delete;
  ProductionRegistry(ProductionRegistry&& other) = delete;
  ProductionRegistry& operator=(ProductionRegistry&& other) = delete;

  ~ProductionRegistry() {
    for (Production* production : productions_) {
      delete production;
    }
  }

  // Returns the already existing production if an identical one was interned before.
  const Production* intern(const Symbol* lhs, const std::vector<const Symbol*>& rhs) {
    Key key = make_key(lhs, rhs);
    auto it = by_key_.find(key);
    if (it != by_key_.end()) {
      return it->second;
    }
    Production* production = new Production(lhs, rhs, productions_.size());
    productions_.push_back(production);
    by_key_.emplace(std::move(key), production);
    return production;
  }

  const Production* find(const Symbol* lhs, const std::vector<const Symbol*>& rhs) const {
    auto it = by_key_.find(make_key(lhs, rhs));
    return it != by_key_.end() ? it->second : nullptr;
  }

  size_t size() const { return productions_.size(); }
};

} // namespace runtime
} // namespace orion

template<>
struct std::formatter<orion::runtime::Production> {
  template<class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template<class FmtContext>
  auto format(const orion::runtime::Production& production, FmtContext& ctx) const {
    return std::format_to(ctx.out(), "{}", production.format());
  }
};

#endif // ORION_RUNTIME_PRODUCTION_HPP
