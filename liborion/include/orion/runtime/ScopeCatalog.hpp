// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_SCOPECATALOG_HPP
#define ORION_RUNTIME_SCOPECATALOG_HPP

#include "../util/log.hpp"
#include "../util/random.hpp"
#include "Errors.hpp"
#include "Scope.hpp"

#include <array>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orion {
namespace runtime {

/*
 * Semantic state of one generation run: the stack of query-block segments
 * and a cursor through which sibling expansions cooperatively assemble one
 * qualified reference (schema, table or alias, column, column alias) without
 * talking to each other directly.
 */
class ScopeCatalog {
public:
  enum class State {
    None = 0,
    AliasChosen,
    NameResolved,
    ColumnChosen,
  };

  static constexpr std::array<std::string_view, 4> state_names = {
    "None", "AliasChosen", "NameResolved", "ColumnChosen"
  };

  static constexpr const char* unknown_schema = "UNKNOWN_SCHEMA";

private:
  struct Cursor {
    State state{State::None};
    std::string alias;
    std::string name;
    std::string column;
  };

  const Universe& universe_;
  util::RandomEngine& rng_;
  NameMint mint_;
  std::vector<ScopeSegment*> segments_;  // Every segment of the run, owned.
  std::vector<ScopeSegment*> stack_;
  Cursor cursor_;

public:
  ScopeCatalog(const Universe& universe, util::RandomEngine& rng) : universe_(universe), rng_(rng) { }
  ScopeCatalog(const ScopeCatalog& other) = delete;
  ScopeCatalog& operator=(const ScopeCatalog& other) = delete;
  ScopeCatalog(ScopeCatalog&& other) = delete;
  ScopeCatalog& operator=(ScopeCatalog&& other) = delete;

  ~ScopeCatalog() {
    clear();
  }

  State state() const { return cursor_.state; }
  static std::string_view state_name(State state) { return state_names[static_cast<size_t>(state)]; }

  bool empty() const { return stack_.empty(); }
  size_t depth() const { return stack_.size(); }

  ScopeSegment& current() {
    if (stack_.empty()) {
      throw ScopeError("Scope lookup with an empty segment stack");
    }
    return *stack_.back();
  }

  // Opens a new query block nested in the current one. The two blocks see
  // each other as inline row sources.
  ScopeSegment* push_segment() {
    ScopeSegment* parent = stack_.empty() ? nullptr : stack_.back();
    auto* segment = new ScopeSegment(universe_, mint_, rng_, parent);
    segments_.push_back(segment);
    if (parent) {
      parent->set_child(segment);
      parent->add_inline_source(*segment, SourceKind::Child);
    }
    stack_.push_back(segment);
    ORION_LOG_TRACE("Enter {} (depth {})", segment->name(), stack_.size());
    return segment;
  }

  // Re-enters a segment created earlier in this run.
  void enter_segment(ScopeSegment* segment) {
    if (!segment) {
      throw ScopeError("Cannot enter a null scope segment");
    }
    stack_.push_back(segment);
  }

  void pop_segment() {
    if (stack_.empty()) {
      throw ScopeError("Scope pop with an empty segment stack");
    }
    ORION_LOG_TRACE("Leave {} (depth {})", stack_.back()->name(), stack_.size());
    stack_.pop_back();
  }

  void clear() {
    stack_.clear();
    for (ScopeSegment* segment : segments_) {
      delete segment;
    }
    segments_.clear();
    cursor_ = Cursor();
  }

  std::string add_schema() {
    ScopeSegment& segment = current();
    segment.set_flag(ScopeFlag::Schema);
    SourceDescriptor table = segment.add_table();
    segment.clear_flag(ScopeFlag::Schema);
    return table.schema.value_or(unknown_schema);
  }

  std::string add_table() {
    return current().add_table().name.value_or("");
  }

  std::string get_alias() {
    return current().get_table().alias.value_or("");
  }

  // Aliases the table that the preceding table name registered.
  std::string add_source_alias_for_table() {
    ScopeSegment& segment = current();
    SourceDescriptor table = segment.get_latest_table();
    return segment.add_source_alias(table.alias.value_or("")).alias.value_or("");
  }

  std::string choose_table() {
    ScopeSegment& segment = current();
    SourceDescriptor table = cursor_.state == State::AliasChosen
        ? segment.get_table(cursor_.alias)
        : segment.get_table();
    cursor_.alias = table.alias.value_or("");
    cursor_.name = table.name.value_or("");
    cursor_.state = State::NameResolved;
    return cursor_.name;
  }

  std::string choose_alias() {
    ScopeSegment& segment = current();
    switch (cursor_.state) {
      case State::AliasChosen:
        return cursor_.alias;
      case State::NameResolved:
        cursor_.state = State::None;
        return cursor_.alias;
      case State::None:
      case State::ColumnChosen:
        break;
    }
    SourceDescriptor table = segment.get_table();
    cursor_.alias = table.alias.value_or("");
    cursor_.name = table.name.value_or("");
    cursor_.state = State::AliasChosen;
    return cursor_.alias;
  }

  std::string choose_column() {
    ScopeSegment& segment = current();
    std::string alias;
    if (cursor_.state == State::AliasChosen || cursor_.state == State::NameResolved) {
      alias = cursor_.alias;
    } else {
      alias = segment.get_table().alias.value_or("");
    }

    ColumnDescriptor column = segment.get_source_column(alias);
    if (column.empty()) {
      column = segment.add_source_column(alias);
    }
    cursor_.alias = column.alias.value_or(alias);
    cursor_.column = column.column.value_or("");
    cursor_.state = State::ColumnChosen;
    return cursor_.column;
  }

  // The alias of the column chosen last. Only legal right after a column
  // was chosen; the result is empty if the column was never registered.
  std::optional<std::string> choose_column_alias() {
    if (cursor_.state != State::ColumnChosen) {
      throw ScopeError(std::format("choose_column_alias called in state {}", state_name(cursor_.state)));
    }
    ColumnDescriptor column = current().get_source_column_alias(cursor_.column, cursor_.alias);
    cursor_.state = State::None;
    return column.column_alias;
  }

  std::string choose_schema() {
    ScopeSegment& segment = current();
    cursor_.state = State::None;
    if (!segment.symtab().empty()) {
      const SourceEntry& entry = segment.symtab().at(segment.random_key());
      return entry.schema.value_or(unknown_schema);
    }
    std::vector<std::string> schemas = universe_.schemas();
    return schemas.empty() ? std::string(unknown_schema) : util::random_choice(rng_, schemas);
  }

  std::string choose_view() {
    return current().add_view().name.value_or("");
  }

  std::string choose_materialized_view() {
    return current().add_materialized_view().name.value_or("");
  }

  std::string choose_sequence() {
    return current().add_sequence().name.value_or("");
  }
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_SCOPECATALOG_HPP
