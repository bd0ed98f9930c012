// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_SYMBOL_HPP
#define ORION_RUNTIME_SYMBOL_HPP

#include <format>
#include <string>
#include <unordered_map>
#include <vector>

namespace orion {
namespace runtime {

/*
 * Grammar symbol. Whether it is a terminal or a nonterminal is decided by the
 * grammar it is used in (nonterminals are the left-hand sides of rules).
 */
class Symbol {
public:
  const std::string name;
  const size_t id;

  Symbol(const std::string& name, size_t id) : name(name), id(id) { }
  Symbol(const Symbol& other) = delete;
  Symbol& operator=(const Symbol& other) = delete;
  Symbol(Symbol&& other) = delete;
  Symbol& operator=(Symbol&& other) = delete;
  ~Symbol() = default;

  std::string format() const { return name; }
};

// Orders symbols by name, for output that must not depend on addresses.
struct SymbolNameLess {
  bool operator()(const Symbol* a, const Symbol* b) const { return a->name < b->name; }
};

class SymbolRegistry {
private:
  std::vector<Symbol*> symbols_;
  std::unordered_map<std::string, Symbol*> by_name_;

public:
  SymbolRegistry() = default;
  SymbolRegistry(const SymbolRegistry& other) = delete;
  SymbolRegistry& operator=(const SymbolRegistry& other) = delete;
  SymbolRegistry(SymbolRegistry&& other) = delete;
  SymbolRegistry& operator=(SymbolRegistry&& other) = delete;

  ~SymbolRegistry() {
    for (Symbol* symbol : symbols_) {
      delete symbol;
    }
  }

  const Symbol* intern(const std::string& name) {
    auto it = by_name_.find(name);
    if (it != by_name_.end()) {
      return it->second;
    }
    Symbol* symbol = new Symbol(name, symbols_.size());
    symbols_.push_back(symbol);
    by_name_.emplace(name, symbol);
    return symbol;
  }

  const Symbol* find(const std::string& name) const {
    auto it = by_name_.find(name);
    return it != by_name_.end() ? it->second : nullptr;
  }

  const Symbol* operator[](size_t id) const { return symbols_[id]; }

  size_t size() const { return symbols_.size(); }
};

} // namespace runtime
} // namespace orion

template<>
struct std::formatter<orion::runtime::Symbol> {
  template<class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template<class FmtContext>
  auto format(const orion::runtime::Symbol& symbol, FmtContext& ctx) const {
    return std::format_to(ctx.out(), "{}", symbol.name);
  }
};

#endif // ORION_RUNTIME_SYMBOL_HPP
