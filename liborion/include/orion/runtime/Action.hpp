// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_ACTION_HPP
#define ORION_RUNTIME_ACTION_HPP

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace orion {
namespace runtime {

// Side effect run when a node is expanded.
enum class GenAction {
  None = 0,
  SchemaName,
  TableName,
  TableAlias,
  SourceAlias,
  SubQuery,
  EndOfSubquery,
};

// Strategy used to turn a node (and its subtree) into text.
enum class RepAction {
  Default = 0,
  Text,
  TightConcat,
  TightOper,
  TightUnary,
  TightParen,
  BetterCommas,
  SqueezeBlanks,
  SubQuery,
  EndOfSubquery,
  SchemaName,
  TableName,
  TableAlias,
  TableRef,
  ViewName,
  MaterializedViewName,
  SequenceName,
  ColumnRef,
  ColumnTableRef,
  ColumnTableSchemaRef,
  ColumnAlias,
  QueryRef,
  TickKeyword,
  OrdIdent,
  QuoteIdent,
  TickString,
  IntegerLit,
  SmallInt,
  MediumInt,
  NumberLit,
  IeeeLit,
  FormatLit,
  NlsParam,
  Unimplemented,
};

// Stable identifiers used by grammar definition files.
inline constexpr std::array<std::pair<std::string_view, GenAction>, 7> gen_action_names = {{
  {"none", GenAction::None},
  {"schema_name", GenAction::SchemaName},
  {"table_name", GenAction::TableName},
  {"table_alias", GenAction::TableAlias},
  {"source_alias", GenAction::SourceAlias},
  {"sub_query", GenAction::SubQuery},
  {"end_of_subquery", GenAction::EndOfSubquery},
}};

inline constexpr std::array<std::pair<std::string_view, RepAction>, 34> rep_action_names = {{
  {"default", RepAction::Default},
  {"text", RepAction::Text},
  {"tight_concat", RepAction::TightConcat},
  {"tight_oper", RepAction::TightOper},
  {"tight_unary", RepAction::TightUnary},
  {"tight_paren", RepAction::TightParen},
  {"better_commas", RepAction::BetterCommas},
  {"squeeze_blanks", RepAction::SqueezeBlanks},
  {"sub_query", RepAction::SubQuery},
  {"end_of_subquery", RepAction::EndOfSubquery},
  {"schema_name", RepAction::SchemaName},
  {"table_name", RepAction::TableName},
  {"table_alias", RepAction::TableAlias},
  {"table_ref", RepAction::TableRef},
  {"view_name", RepAction::ViewName},
  {"materialized_view_name", RepAction::MaterializedViewName},
  {"sequence_name", RepAction::SequenceName},
  {"column_ref", RepAction::ColumnRef},
  {"column_table_ref", RepAction::ColumnTableRef},
  {"column_table_schema_ref", RepAction::ColumnTableSchemaRef},
  {"column_alias", RepAction::ColumnAlias},
  {"query_ref", RepAction::QueryRef},
  {"tick_keyword", RepAction::TickKeyword},
  {"ord_ident", RepAction::OrdIdent},
  {"quote_ident", RepAction::QuoteIdent},
  {"tick_string", RepAction::TickString},
  {"integer_lit", RepAction::IntegerLit},
  {"small_int", RepAction::SmallInt},
  {"medium_int", RepAction::MediumInt},
  {"number_lit", RepAction::NumberLit},
  {"ieee_lit", RepAction::IeeeLit},
  {"format_lit", RepAction::FormatLit},
  {"nls_param", RepAction::NlsParam},
  {"unimplemented", RepAction::Unimplemented},
}};

inline std::optional<GenAction> gen_action_from_name(std::string_view name) {
  for (const auto& [action_name, action] : gen_action_names) {
    if (action_name == name) {
      return action;
    }
  }
  return std::nullopt;
}

inline std::optional<RepAction> rep_action_from_name(std::string_view name) {
  for (const auto& [action_name, action] : rep_action_names) {
    if (action_name == name) {
      return action;
    }
  }
  return std::nullopt;
}

inline std::string_view gen_action_name(GenAction action) {
  return gen_action_names[static_cast<size_t>(action)].first;
}

inline std::string_view rep_action_name(RepAction action) {
  return rep_action_names[static_cast<size_t>(action)].first;
}

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_ACTION_HPP
