// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <orion/runtime.hpp>
#include <orion/tool/JsonGrammarLoader.hpp>
#include <orion/tool/JsonUniverseLoader.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace orion::runtime;
using namespace orion::tool;

namespace {

std::string body(const GenerationResult& result) {
  return result.text.substr(result.text.find("*/ ") + 3);
}

// Renders S -> rhs with the given representation.
std::string render_one(const std::vector<std::string>& rhs, RepAction rep, std::uint64_t seed = 0) {
  WeightedGrammar grammar;
  grammar.add_rule("S", rhs, 1, GenAction::None, rep);
  Universe universe;
  DerivationEngine engine(grammar, universe);
  GenerationResult result = engine.generate("S", seed);
  EXPECT_TRUE(result.success) << result.reason;
  return body(result);
}

// Q -> SELECT <select> FROM <from> E, a single query block over `dept`.
void build_query_grammar(WeightedGrammar& grammar, const std::vector<std::string>& select, const std::vector<std::string>& from) {
  std::vector<std::string> rhs{"SELECT"};
  rhs.insert(rhs.end(), select.begin(), select.end());
  rhs.push_back("FROM");
  rhs.insert(rhs.end(), from.begin(), from.end());
  rhs.push_back("E");
  grammar.add_rule("Q", rhs, 1, GenAction::SubQuery, RepAction::SubQuery);
  grammar.add_rule("E", {}, 1, GenAction::EndOfSubquery, RepAction::EndOfSubquery);
  grammar.add_rule("C", {}, 1, GenAction::None, RepAction::ColumnRef);
  grammar.add_rule("QC", {}, 1, GenAction::None, RepAction::ColumnTableRef);
  grammar.add_rule("A", {}, 1, GenAction::None, RepAction::ColumnAlias);
  grammar.add_rule("T", {}, 1, GenAction::TableName, RepAction::Text);
  grammar.add_rule("TA", {}, 1, GenAction::SourceAlias, RepAction::Text);
}

void add_dept(Universe& universe) {
  universe.add("dept", {"scott", "dept", "", SourceKind::Table, {"deptno"}});
}

} // namespace

TEST(DerivationEngineTest, SameSeedSameStatement) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"a"}, 1);
  grammar.add_rule("S", {"S", "b"}, 3);
  Universe universe;
  DerivationEngine engine(grammar, universe);

  GenerationResult first = engine.generate("S", 1234);
  GenerationResult second = engine.generate("S", 1234);
  EXPECT_EQ(first.text, second.text);
  EXPECT_EQ(first.text.rfind("/*1234*/ ", 0), 0u);
  EXPECT_TRUE(first.success);
  EXPECT_EQ(first.reason, "OK");
  EXPECT_EQ(first.start, "S");
  EXPECT_EQ(first.seed, 1234u);
}

TEST(DerivationEngineTest, DifferentSeedsVary) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"a"}, 1);
  grammar.add_rule("S", {"S", "b"}, 3);
  Universe universe;
  DerivationEngine engine(grammar, universe);

  std::set<std::string> statements;
  for (std::uint64_t seed = 0; seed < 30; ++seed) {
    statements.insert(body(engine.generate("S", seed)));
  }
  EXPECT_GT(statements.size(), 1u);
}

TEST(DerivationEngineTest, UnknownOrTerminalStartIsRejected) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"a"}, 1);
  Universe universe;
  DerivationEngine engine(grammar, universe);

  EXPECT_THROW(engine.generate("nope", 0), GrammarError);
  EXPECT_THROW(engine.generate("a", 0), GrammarError);
}

TEST(DerivationEngineTest, UnimplementedFallsBackToSafeStatement) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"x", "U"}, 1);
  grammar.add_rule("U", {}, 1, GenAction::None, RepAction::Unimplemented);
  Universe universe;
  DerivationEngine engine(grammar, universe);

  GenerationResult result = engine.generate("S", 3);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.reason, "unimplemented U");
  EXPECT_EQ(result.text, std::string("/*3*/ ") + DerivationEngine::fallback_statement);
}

TEST(DerivationEngineTest, ProductionCounts) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"T", "T", "T"}, 1);
  grammar.add_rule("T", {"t"}, 1);
  Universe universe;
  DerivationEngine engine(grammar, universe);

  EXPECT_TRUE(engine.generate("S", 0).production_counts.empty());
  GenerationResult result = engine.generate("S", 0, true);
  EXPECT_EQ(result.production_counts.at("Rule.S.0"), 1);
  EXPECT_EQ(result.production_counts.at("Rule.T.1"), 3);
  EXPECT_EQ(body(result), "t t t");
}

TEST(RepresentationTest, LayoutActions) {
  EXPECT_EQ(render_one({"a", "+", "b"}, RepAction::TightOper), "a+b");
  EXPECT_EQ(render_one({"-", "x"}, RepAction::TightUnary), "-x");
  EXPECT_EQ(render_one({"(", "x", ")"}, RepAction::TightParen), "(x)");
  EXPECT_EQ(render_one({"a", "b", "c"}, RepAction::TightConcat), "abc");
  EXPECT_EQ(render_one({"a", ",", "b"}, RepAction::BetterCommas), "a, b");
  EXPECT_EQ(render_one({"a", "b"}, RepAction::SqueezeBlanks), "ab");
  EXPECT_EQ(render_one({"a", "b"}, RepAction::Default), "a b");
}

TEST(RepresentationTest, MissingChildrenFail) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"a"}, 1, GenAction::None, RepAction::TightOper);
  Universe universe;
  DerivationEngine engine(grammar, universe);

  GenerationResult result = engine.generate("S", 0);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.reason.find("needs at least 3 children"), std::string::npos);
}

TEST(RepresentationTest, FixedLiterals) {
  EXPECT_EQ(render_one({}, RepAction::FormatLit), "'999'");
  EXPECT_EQ(render_one({}, RepAction::NlsParam), "'NLS_NUMERIC_CHARACTERS = '',.'''");
  EXPECT_EQ(render_one({}, RepAction::QueryRef), "CafeBabe");
  EXPECT_EQ(render_one({"&qSELECT"}, RepAction::TickKeyword), "SELECT");
}

TEST(RepresentationTest, RandomLiteralsHaveTheirShape) {
  for (std::uint64_t seed = 0; seed < 20; ++seed) {
    std::string integer = render_one({}, RepAction::IntegerLit, seed);
    EXPECT_GE(integer.size(), 1u);
    EXPECT_LE(integer.size(), 41u);
    EXPECT_EQ(integer.find_first_not_of("0123456789"), std::string::npos) << integer;

    std::string string = render_one({}, RepAction::TickString, seed);
    EXPECT_EQ(string.front(), '\'');
    EXPECT_EQ(string.back(), '\'');

    std::string quoted = render_one({}, RepAction::QuoteIdent, seed);
    EXPECT_EQ(quoted.front(), '"');
    EXPECT_EQ(quoted.back(), '"');

    std::string ident = render_one({}, RepAction::OrdIdent, seed);
    EXPECT_TRUE(ident.front() >= 'a' && ident.front() <= 'z') << ident;

    std::string number = render_one({}, RepAction::NumberLit, seed);
    EXPECT_NE(number.find('.'), std::string::npos);

    std::string ieee = render_one({}, RepAction::IeeeLit, seed);
    EXPECT_NE(ieee.find('E'), std::string::npos);

    int small = std::stoi(render_one({}, RepAction::SmallInt, seed));
    EXPECT_GE(small, 0);
    EXPECT_LE(small, 40);
    int medium = std::stoi(render_one({}, RepAction::MediumInt, seed));
    EXPECT_GE(medium, 0);
    EXPECT_LE(medium, 4009);
  }
}

TEST(ScopedGenerationTest, ColumnOfTheOnlyTable) {
  WeightedGrammar grammar;
  build_query_grammar(grammar, {"C"}, {"T"});
  Universe universe;
  add_dept(universe);
  DerivationEngine engine(grammar, universe);

  EXPECT_EQ(body(engine.generate("Q", 1)), "SELECT deptno FROM dept");
}

TEST(ScopedGenerationTest, ColumnAliasFollowsColumn) {
  WeightedGrammar grammar;
  build_query_grammar(grammar, {"C", "AS", "A"}, {"T"});
  Universe universe;
  add_dept(universe);
  DerivationEngine engine(grammar, universe);

  EXPECT_EQ(body(engine.generate("Q", 1)), "SELECT deptno AS deptno FROM dept");
}

TEST(ScopedGenerationTest, AliasedSourceQualifiesColumns) {
  WeightedGrammar grammar;
  build_query_grammar(grammar, {"QC"}, {"T", "TA"});
  Universe universe;
  add_dept(universe);
  DerivationEngine engine(grammar, universe);

  EXPECT_EQ(body(engine.generate("Q", 1)), "SELECT dept_1.deptno FROM dept dept_1");
}

TEST(ScopedGenerationTest, EachAliasFollowsItsOwnTable) {
  // FROM T TA , T TA over two tables: every alias must name the table
  // registered right before it.
  WeightedGrammar grammar;
  build_query_grammar(grammar, {"C"}, {"TS", ",", "TS"});
  grammar.add_rule("TS", {"T", "TA"}, 1);
  Universe universe;
  add_dept(universe);
  universe.add("emp", {"scott", "emp", "", SourceKind::Table, {"empno"}});
  DerivationEngine engine(grammar, universe);

  for (std::uint64_t seed = 0; seed < 40; ++seed) {
    GenerationResult result = engine.generate("Q", seed);
    ASSERT_TRUE(result.success) << result.reason;
    std::string text = body(result);
    std::istringstream from(text.substr(text.find(" FROM ") + 6));
    std::string table1, alias1, comma, table2, alias2;
    from >> table1 >> alias1 >> comma >> table2 >> alias2;
    EXPECT_EQ(comma, ",") << text;
    EXPECT_EQ(alias1.rfind(table1 + "_", 0), 0u) << text;
    EXPECT_EQ(alias2.rfind(table2 + "_", 0), 0u) << text;
    EXPECT_NE(alias1, alias2) << text;
  }
}

TEST(ScopedGenerationTest, ColumnAliasWithoutRegisteredColumnFallsBack) {
  WeightedGrammar grammar;
  build_query_grammar(grammar, {"C", "AS", "A"}, {"T"});
  Universe universe;
  DerivationEngine engine(grammar, universe);

  GenerationResult result = engine.generate("Q", 1);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(body(result), DerivationEngine::fallback_statement);
}

TEST(ScopedGenerationTest, MisplacedColumnAliasIsASequencingDefect) {
  WeightedGrammar grammar;
  build_query_grammar(grammar, {"A"}, {"T"});
  Universe universe;
  add_dept(universe);
  DerivationEngine engine(grammar, universe);

  EXPECT_THROW(engine.generate("Q", 1), ScopeError);
}

TEST(ScopedGenerationTest, SubqueryInFromClause) {
  // Q -> SELECT C FROM ( Q2 ) E ; the inner block reads dept, the outer
  // block sees the inner one as an inline source.
  WeightedGrammar grammar;
  build_query_grammar(grammar, {"C"}, {"(", "Q2", ")"});
  grammar.add_rule("Q2", {"SELECT", "C", "FROM", "T", "E"}, 1, GenAction::SubQuery, RepAction::SubQuery);
  Universe universe;
  add_dept(universe);
  DerivationEngine engine(grammar, universe);

  GenerationResult result = engine.generate("Q", 9);
  EXPECT_TRUE(result.success) << result.reason;
  std::string text = body(result);
  EXPECT_EQ(text.rfind("SELECT ", 0), 0u);
  EXPECT_NE(text.find("FROM ( SELECT deptno FROM dept )"), std::string::npos) << text;
}

TEST(AnalysisListenerTest, RecordsEveryExpansion) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"T", "x"}, 1);
  grammar.add_rule("T", {"t"}, 1);
  Universe universe;
  DerivationEngine engine(grammar, universe);
  auto* listener = new AnalysisListener();
  engine.add_listener(listener);

  engine.generate("S", 0);
  const std::vector<std::string>& lines = listener->lines();
  ASSERT_EQ(lines.size(), 6u);
  EXPECT_EQ(lines[0], "Rule: S ::= T x");
  EXPECT_EQ(lines[1], "      T x");
  EXPECT_EQ(lines[2], " ");
  EXPECT_EQ(lines[3], "Rule: T ::= t");
  EXPECT_EQ(lines[4], "      t x");

  // A new derivation starts a new record.
  engine.generate("S", 1);
  EXPECT_EQ(listener->lines().size(), 6u);
}

TEST(AnalysisListenerTest, FoldsLongFrontiers) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"aaaa", "bbbb", "cccc"}, 1);
  Universe universe;
  DerivationEngine engine(grammar, universe);
  auto* listener = new AnalysisListener(10);
  engine.add_listener(listener);

  engine.generate("S", 0);
  EXPECT_EQ(listener->format(), "Rule: S ::= aaaa bbbb cccc\n      aaaa bbbb\n      cccc\n \n");
}

TEST(DerivationTreeTest, FrontierAndFormat) {
  SymbolRegistry symbols;
  DerivationTree tree(symbols.intern("S"));
  size_t a = tree.add_child(DerivationTree::root, symbols.intern("A"));
  tree.add_child(DerivationTree::root, symbols.intern("b"));
  tree.add_child(a, symbols.intern("c"));

  EXPECT_EQ(tree.size(), 4u);
  EXPECT_EQ(tree.frontier(), "c b");
  EXPECT_EQ(tree.frontier(a), "c");
  EXPECT_EQ(tree.format(), "    c\n  A\n  b\nS");
}

TEST(SqlGrammarTest, GeneratesFromTheBundledGrammar) {
  WeightedGrammar grammar;
  JsonGrammarLoader grammar_loader;
  ASSERT_TRUE(grammar_loader.load(ORION_GRAMMARS_DIR "/sql.json", grammar));
  Universe universe;
  ASSERT_TRUE(JsonUniverseLoader().load(ORION_GRAMMARS_DIR "/scott.json", universe));
  EXPECT_TRUE(ConsistencyAnalyzer(grammar).consistent());

  DerivationEngine engine(grammar, universe);
  int successes = 0;
  std::set<std::string> statements;
  for (std::uint64_t seed = 0; seed < 50; ++seed) {
    GenerationResult result = engine.generate(grammar_loader.start(), seed);
    if (result.success) {
      ++successes;
      EXPECT_EQ(body(result).rfind("SELECT ", 0), 0u) << result.text;
    }
    statements.insert(body(result));
  }
  EXPECT_GT(successes, 40);
  EXPECT_GT(statements.size(), 10u);
}
