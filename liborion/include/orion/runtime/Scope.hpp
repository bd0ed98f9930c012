// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_SCOPE_HPP
#define ORION_RUNTIME_SCOPE_HPP

#include "../util/random.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace orion {
namespace runtime {

enum class SourceKind {
  Table = 0,
  View,
  MaterializedView,
  Sequence,
  Parent,
  Child,
};

inline constexpr std::array<std::string_view, 6> source_kind_names = {
  "TABLE", "VIEW", "MVIEW", "SEQUENCE", "PARENT", "CHILD"
};

inline std::string_view source_kind_name(SourceKind kind) {
  return source_kind_names[static_cast<size_t>(kind)];
}

inline std::optional<SourceKind> source_kind_from_name(std::string_view name) {
  for (size_t i = 0; i < source_kind_names.size(); ++i) {
    if (source_kind_names[i] == name) {
      return static_cast<SourceKind>(i);
    }
  }
  return std::nullopt;
}

inline bool is_physical(SourceKind kind) {
  return kind != SourceKind::Parent && kind != SourceKind::Child;
}

// A real database object generation may refer to.
struct CatalogObject {
  std::string schema;
  std::string name;
  std::string alias;
  SourceKind kind;
  std::vector<std::string> columns;
};

/*
 * Read-only catalog of the database objects available for generation,
 * partitioned by kind. Built once and shared by every generation run.
 */
class Universe {
private:
  std::map<std::string, CatalogObject> objects_;
  std::array<std::vector<std::string>, 4> buckets_{};

public:
  Universe() = default;
  Universe(const Universe& other) = delete;
  Universe& operator=(const Universe& other) = delete;
  Universe(Universe&& other) = default;
  Universe& operator=(Universe&& other) = default;
  ~Universe() = default;

  void add(const std::string& key, CatalogObject object) {
    if (!is_physical(object.kind)) {
      throw GrammarError(std::format("Universe object {} has non-physical kind {}", key, source_kind_name(object.kind)));
    }
    if (objects_.contains(key)) {
      throw GrammarError(std::format("Universe object {} defined twice", key));
    }
    if (object.alias.empty()) {
      object.alias = object.name;
    }
    buckets_[static_cast<size_t>(object.kind)].push_back(key);
    objects_.emplace(key, std::move(object));
  }

  const CatalogObject& at(const std::string& key) const { return objects_.at(key); }

  const std::vector<std::string>& keys(SourceKind kind) const {
    return buckets_[static_cast<size_t>(kind)];
  }

  const std::map<std::string, CatalogObject>& objects() const { return objects_; }
  bool empty() const { return objects_.empty(); }
  size_t size() const { return objects_.size(); }

  // Distinct schemas in key order.
  std::vector<std::string> schemas() const {
    std::vector<std::string> result;
    for (const auto& [key, object] : objects_) {
      if (std::find(result.begin(), result.end(), object.schema) == result.end()) {
        result.push_back(object.schema);
      }
    }
    return result;
  }
};

// Empty fields stand for "not known".
struct SourceDescriptor {
  std::optional<std::string> schema;
  std::optional<std::string> name;
  std::optional<std::string> alias;
  std::optional<SourceKind> kind;

  bool operator==(const SourceDescriptor& other) const = default;
};

struct ColumnDescriptor {
  std::optional<std::string> schema;
  std::optional<std::string> name;
  std::optional<std::string> alias;
  std::optional<std::string> column;
  std::optional<std::string> column_alias;

  bool operator==(const ColumnDescriptor& other) const = default;

  bool empty() const {
    return !schema && !name && !alias && !column && !column_alias;
  }
};

// Counters behind synthetic names. One per generation run, so that equal
// seeds mint equal names.
class NameMint {
private:
  int fake_num_{0};
  int block_serial_{0};

public:
  std::string fake_name(const std::string& prefix) {
    return std::format("{}_{}", prefix, ++fake_num_);
  }

  std::string block_name() {
    return std::format("QB{}", ++block_serial_);
  }
};

class ScopeSegment;

struct SourceEntry {
  std::optional<std::string> schema;
  std::string name;
  std::string alias;
  SourceKind kind;
  std::vector<std::string> columns;
  const ScopeSegment* inline_source;  // Columns are read from here when set.
};

enum class ScopeFlag {
  Schema,  // Qualify newly registered physical sources with their schema.
};

/*
 * The record of one query block: which sources were introduced under which
 * aliases (symbol table) and which columns were picked from them under which
 * column aliases (column table).
 */
class ScopeSegment {
private:
  std::string name_;
  ScopeSegment* parent_;
  ScopeSegment* child_{nullptr};
  std::map<std::string, SourceEntry> symtab_;
  std::map<std::string, std::map<std::string, std::string>> coltab_;
  std::set<ScopeFlag> flags_;
  std::optional<std::string> latest_;  // Alias of the last registered physical source.
  const Universe& universe_;
  NameMint& mint_;
  util::RandomEngine& rng_;

public:
  ScopeSegment(const Universe& universe, NameMint& mint, util::RandomEngine& rng, ScopeSegment* parent = nullptr)
      : name_(mint.block_name()), parent_(parent), universe_(universe), mint_(mint), rng_(rng) {
    if (parent_) {
      add_inline_source(*parent_, SourceKind::Parent);
    }
  }

  ScopeSegment(const ScopeSegment& other) = delete;
  ScopeSegment& operator=(const ScopeSegment& other) = delete;
  ScopeSegment(ScopeSegment&& other) = delete;
  ScopeSegment& operator=(ScopeSegment&& other) = delete;
  ~ScopeSegment() = default;

  const std::string& name() const { return name_; }
  ScopeSegment* parent() const { return parent_; }
  ScopeSegment* child() const { return child_; }
  void set_child(ScopeSegment* child) { child_ = child; }
  const Universe& universe() const { return universe_; }
  const std::map<std::string, SourceEntry>& symtab() const { return symtab_; }
  const std::map<std::string, std::map<std::string, std::string>>& coltab() const { return coltab_; }

  void set_flag(ScopeFlag flag) { flags_.insert(flag); }
  void clear_flag(ScopeFlag flag) { flags_.erase(flag); }
  bool has_flag(ScopeFlag flag) const { return flags_.contains(flag); }

  std::string fake_name(const std::string& prefix) { return mint_.fake_name(prefix); }

  // The columns this block makes visible to the blocks around it.
  std::vector<std::string> exported_columns() const {
    std::vector<std::string> result;
    result.reserve(coltab_.size());
    for (const auto& [column, aliases] : coltab_) {
      result.push_back(column);
    }
    return result;
  }

  std::vector<std::string> columns(const SourceEntry& entry) const {
    return entry.inline_source ? entry.inline_source->exported_columns() : entry.columns;
  }

  // Registers another block as a row source named after that block. Its
  // columns are evaluated lazily, at lookup time.
  SourceDescriptor add_inline_source(const ScopeSegment& source, SourceKind kind) {
    symtab_[source.name()] = SourceEntry{std::nullopt, source.name(), source.name(), kind, {}, &source};
    return {std::nullopt, source.name(), source.name(), kind};
  }

  // Registers a random object of the given kind from the universe. An alias
  // already used in this block is suffixed to keep aliases unique. Without
  // any object of that kind a placeholder is returned.
  SourceDescriptor add_physical_source(SourceKind kind) {
    const auto& keys = universe_.keys(kind);
    if (keys.empty()) {
      std::string placeholder = fake_name(std::format("UNKNOWN_{}", source_kind_name(kind)));
      return {std::nullopt, placeholder, placeholder, kind};
    }

    const CatalogObject& object = universe_.at(util::random_choice(rng_, keys));
    std::string alias = object.alias;
    if (symtab_.contains(alias)) {
      alias = fake_name(alias);
    }
    symtab_[alias] = SourceEntry{object.schema, object.name, alias, object.kind, object.columns, nullptr};
    latest_ = alias;
    return {has_flag(ScopeFlag::Schema) ? std::optional<std::string>(object.schema) : std::nullopt, object.name, alias, object.kind};
  }

  SourceDescriptor add_table() { return add_physical_source(SourceKind::Table); }
  SourceDescriptor add_view() { return add_physical_source(SourceKind::View); }
  SourceDescriptor add_materialized_view() { return add_physical_source(SourceKind::MaterializedView); }
  SourceDescriptor add_sequence() { return add_physical_source(SourceKind::Sequence); }

  // Gives a source registered under its own name a genuine alias. Sources
  // that already have one are returned as they are.
  SourceDescriptor add_source_alias(const std::string& alias) {
    auto it = symtab_.find(alias);
    if (it == symtab_.end()) {
      return {std::nullopt, std::nullopt, fake_name("UNKNOWN_ALIAS"), std::nullopt};
    }

    std::string new_alias = alias;
    if (it->second.alias == it->second.name) {
      new_alias = fake_name(alias);
      SourceEntry entry = std::move(it->second);
      symtab_.erase(it);
      entry.alias = new_alias;
      it = symtab_.emplace(new_alias, std::move(entry)).first;
      sync_aliases(alias, new_alias);
      if (latest_ == alias) {
        latest_ = new_alias;
      }
    }
    const SourceEntry& entry = it->second;
    return {entry.schema, entry.name, new_alias, entry.kind};
  }

  // Picks a column of the given (or a random) source and records it in the
  // column table under a fresh or reused column alias.
  ColumnDescriptor add_source_column(const std::optional<std::string>& source_alias = std::nullopt) {
    if (symtab_.empty() && !source_alias) {
      std::string column = fake_name("UNKNOWN_COLUMN");
      return {std::nullopt, fake_name("UNKNOWN"), fake_name("UNKNOWN"), column, column};
    }

    std::string key = source_alias ? *source_alias : random_key();
    auto it = symtab_.find(key);
    std::vector<std::string> candidates = it != symtab_.end() ? columns(it->second) : std::vector<std::string>{};
    if (candidates.empty()) {
      std::string base = it != symtab_.end() ? it->second.name : "UNKNOWN";
      std::string column = fake_name("UNKNOWN_COLUMN");
      return {std::nullopt, it != symtab_.end() ? it->second.name : fake_name("UNKNOWN"), fake_name(base), column, column};
    }

    const SourceEntry& entry = it->second;
    std::string column = util::random_choice(rng_, candidates);
    std::string column_alias = add_to_coltab(column, entry.alias);
    return {is_physical(entry.kind) ? entry.schema : std::nullopt, entry.name, key, column, column_alias};
  }

  // Returns the alias of a column already taken from the given source. A
  // column still known by its own name gets a fresh alias.
  ColumnDescriptor add_column_alias(const std::string& column, const std::string& source_alias) {
    auto it = coltab_.find(column);
    if (it == coltab_.end()) {
      return {};
    }

    auto& aliases = it->second;
    auto match = std::find_if(aliases.begin(), aliases.end(), [&](const auto& kv) { return kv.second == source_alias; });
    if (match == aliases.end()) {
      return {};
    }

    std::string column_alias = match->first;
    if (column_alias == column) {
      column_alias = fake_name(aliases.rbegin()->first);
      aliases.erase(match);
      aliases.emplace(column_alias, source_alias);
    }
    auto source = symtab_.find(source_alias);
    return {source != symtab_.end() ? source->second.schema : std::nullopt,
            source != symtab_.end() ? std::optional<std::string>(source->second.name) : std::nullopt,
            source_alias, column, column_alias};
  }

  // A column already recorded in this block, optionally restricted to one source.
  ColumnDescriptor get_source_column(const std::optional<std::string>& source_alias = std::nullopt) {
    struct Candidate {
      const std::string* column;
      const std::string* column_alias;
      const std::string* source_alias;
    };
    std::vector<Candidate> candidates;
    for (const auto& [column, aliases] : coltab_) {
      for (const auto& [column_alias, alias] : aliases) {
        if (!source_alias || alias == *source_alias) {
          candidates.push_back({&column, &column_alias, &alias});
        }
      }
    }
    if (candidates.empty()) {
      return {};
    }
    const Candidate& pick = util::random_choice(rng_, candidates);
    return describe_column(*pick.source_alias, *pick.column, *pick.column_alias);
  }

  ColumnDescriptor get_source_column_alias(const std::string& column, const std::string& source_alias) {
    auto it = coltab_.find(column);
    if (it == coltab_.end()) {
      return {};
    }
    std::vector<std::string> candidates;
    for (const auto& [column_alias, alias] : it->second) {
      if (alias == source_alias) {
        candidates.push_back(column_alias);
      }
    }
    if (candidates.empty()) {
      return {};
    }
    return describe_column(source_alias, column, util::random_choice(rng_, candidates));
  }

  // The source registered under `name` (or a random source of `kind`). A
  // name that is not registered, or a kind without sources, gives a placeholder.
  SourceDescriptor get_physical_source(const std::optional<std::string>& name, SourceKind kind) {
    if (name) {
      auto it = symtab_.find(*name);
      if (it != symtab_.end()) {
        const SourceEntry& entry = it->second;
        return {entry.schema, entry.name, entry.alias,
                entry.kind == kind ? std::optional<SourceKind>(kind) : std::nullopt};
      }
      std::string placeholder = fake_name(std::format("UNKNOWN_{}", source_kind_name(kind)));
      return {std::nullopt, placeholder, placeholder, kind};
    }

    std::vector<std::string> keys;
    for (const auto& [alias, entry] : symtab_) {
      if (entry.kind == kind) {
        keys.push_back(alias);
      }
    }
    if (keys.empty()) {
      std::string placeholder = fake_name(std::format("UNKNOWN_{}", source_kind_name(kind)));
      return {std::nullopt, placeholder, placeholder, kind};
    }
    return get_physical_source(util::random_choice(rng_, keys), kind);
  }

  SourceDescriptor get_table(const std::optional<std::string>& name = std::nullopt) {
    return get_physical_source(name, SourceKind::Table);
  }

  // The table registered last in this block, or a random one if the last
  // registered source is not a table.
  SourceDescriptor get_latest_table() {
    if (latest_) {
      auto it = symtab_.find(*latest_);
      if (it != symtab_.end() && it->second.kind == SourceKind::Table) {
        return get_table(*latest_);
      }
    }
    return get_table();
  }

  std::string random_key() {
    std::vector<std::string> keys;
    keys.reserve(symtab_.size());
    for (const auto& [alias, entry] : symtab_) {
      keys.push_back(alias);
    }
    return util::random_choice(rng_, keys);
  }

private:
  std::string add_to_coltab(const std::string& column, const std::string& source_alias) {
    auto it = coltab_.find(column);
    if (it == coltab_.end()) {
      coltab_[column] = {{column, source_alias}};
      return column;
    }
    std::string column_alias = fake_name(it->second.rbegin()->first);
    it->second.emplace(column_alias, source_alias);
    return column_alias;
  }

  void sync_aliases(const std::string& old_alias, const std::string& new_alias) {
    for (auto& [column, aliases] : coltab_) {
      for (auto& [column_alias, alias] : aliases) {
        if (alias == old_alias) {
          alias = new_alias;
        }
      }
    }
  }

  ColumnDescriptor describe_column(const std::string& source_alias, const std::string& column, const std::string& column_alias) const {
    auto it = symtab_.find(source_alias);
    return {it != symtab_.end() ? it->second.schema : std::nullopt,
            it != symtab_.end() ? std::optional<std::string>(it->second.name) : std::nullopt,
            source_alias, column, column_alias};
  }
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_SCOPE_HPP
