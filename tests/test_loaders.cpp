// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <orion/tool/Configuration.hpp>
#include <orion/tool/JsonGrammarLoader.hpp>
#include <orion/tool/JsonUniverseLoader.hpp>
#include <orion/tool/JsonWeightLoader.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace orion::runtime;
using namespace orion::tool;
using nlohmann::json;

namespace {

class TempFile {
private:
  std::filesystem::path path_;

public:
  TempFile(const std::string& name, const std::string& content = "")
      : path_(std::filesystem::temp_directory_path() / ("orion-loaders-" + name)) {
    if (!content.empty()) {
      std::ofstream(path_) << content;
    }
  }
  TempFile(const TempFile& other) = delete;
  TempFile& operator=(const TempFile& other) = delete;
  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  std::string path() const { return path_.string(); }
};

json grammar_definition() {
  return json::parse(R"({
    "start": "S",
    "symbols": [
      {"kind": "NT", "id": "S"},
      {"kind": "NT", "id": "U"},
      {"kind": "KW", "id": "SELECT"},
      {"kind": "T", "id": "comma", "text": ","},
      {"kind": "T", "id": "star"}
    ],
    "rules": [
      {"lhs": "S", "rhs": ["SELECT", "star"]},
      {"lhs": "S", "rhs": ["SELECT", "comma", "S"], "class": "L", "rep": "better_commas"},
      {"lhs": "S", "rhs": ["U"], "class": 3, "gen": "sub_query", "rep": "sub_query"},
      {"lhs": "S", "rhs": [], "class": "O"}
    ]
  })");
}

} // namespace

TEST(JsonGrammarLoaderTest, WeightClasses) {
  auto classes = JsonGrammarLoader::weight_classes();
  EXPECT_EQ(classes.at("N"), 1000000);
  EXPECT_EQ(classes.at("L"), 1001);
  EXPECT_EQ(classes.at("M"), 191059);
  EXPECT_EQ(classes.at("O"), 10);
}

TEST(JsonGrammarLoaderTest, ParsesSymbolsRulesAndActions) {
  WeightedGrammar grammar;
  JsonGrammarLoader loader;
  loader.parse(grammar_definition(), grammar);

  EXPECT_EQ(loader.start(), "S");
  ASSERT_EQ(grammar.rule_count(), 5u);
  EXPECT_EQ(grammar.to_weights(), (std::vector<Weight>{1000000, 1001, 3, 10, 1}));

  EXPECT_NE(grammar.symbols().find(","), nullptr);
  EXPECT_EQ(grammar.symbols().find("comma"), nullptr);
  EXPECT_NE(grammar.symbols().find("star"), nullptr);

  const auto& rules = grammar.rules();
  EXPECT_EQ(rules[1].production->format(), "S ::= SELECT , S");
  EXPECT_EQ(rules[1].rep, RepAction::BetterCommas);
  EXPECT_EQ(rules[2].gen, GenAction::SubQuery);
  EXPECT_EQ(rules[2].rep, RepAction::SubQuery);
  EXPECT_EQ(rules[3].production->format(), "S ::=");
  EXPECT_EQ(rules[0].gen, GenAction::None);
  EXPECT_EQ(rules[0].rep, RepAction::Default);

  // U is declared without rules.
  EXPECT_EQ(rules[4].production->format(), "U ::=");
  EXPECT_EQ(rules[4].rep, RepAction::Unimplemented);
}

TEST(JsonGrammarLoaderTest, WeightClassesCanBeOverridden) {
  json data = grammar_definition();
  data["weight_classes"] = {{"L", 50}};

  WeightedGrammar grammar;
  JsonGrammarLoader().parse(data, grammar);
  EXPECT_EQ(grammar.to_weights()[1], 50);
}

TEST(JsonGrammarLoaderTest, RejectsMalformedDefinitions) {
  {
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(json::parse(R"({"symbols": []})"), grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["symbols"].push_back({{"kind", "NT"}, {"id", "S"}});
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["symbols"].push_back({{"kind", "TOKEN"}, {"id", "X"}});
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back({{"lhs", "S"}, {"rhs", json::array({"missing"})}});
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back({{"lhs", "SELECT"}, {"rhs", json::array({"star"})}});
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back({{"lhs", "S"}, {"rhs", json::array({"star"})}, {"gen", "make_coffee"}});
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back({{"lhs", "S"}, {"rhs", json::array({"star"})}, {"rep", "make_coffee"}});
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back({{"lhs", "S"}, {"rhs", json::array({"star", "star"})}, {"class", "Q"}});
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back({{"lhs", "S"}, {"rhs", json::array({"SELECT", "star"})}});
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
}

TEST(JsonGrammarLoaderTest, MissingAndMistypedFieldsAreGrammarErrors) {
  {
    json data = grammar_definition();
    data["symbols"].push_back(json::parse(R"({"id": "X"})"));
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["symbols"].push_back("X");
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back(json::parse(R"({"rhs": ["star"]})"));
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back(json::parse(R"({"lhs": "S", "rhs": "star"})"));
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back(json::parse(R"({"lhs": "S", "rhs": ["star", 7]})"));
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["rules"].push_back(json::parse(R"({"lhs": "S", "rhs": ["star", "star"], "class": [1]})"));
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
  {
    json data = grammar_definition();
    data["weight_classes"] = json::parse(R"({"N": "heavy"})");
    WeightedGrammar grammar;
    EXPECT_THROW(JsonGrammarLoader().parse(data, grammar), GrammarError);
  }
}

TEST(JsonGrammarLoaderTest, LoadRaisesGrammarErrorForMistypedFields) {
  TempFile file("mistyped-grammar.json", R"({"symbols": [{"id": "S"}], "rules": []})");
  WeightedGrammar grammar;
  EXPECT_THROW(JsonGrammarLoader().load(file.path(), grammar), GrammarError);
}

TEST(JsonGrammarLoaderTest, LoadReportsUnreadableFiles) {
  WeightedGrammar grammar;
  JsonGrammarLoader loader;
  EXPECT_FALSE(loader.load("/nonexistent/orion/grammar.json", grammar));

  TempFile broken("broken-grammar.json", "{ \"symbols\": [");
  EXPECT_FALSE(loader.load(broken.path(), grammar));
}

TEST(JsonGrammarLoaderTest, LoadsBundledGrammar) {
  WeightedGrammar grammar;
  JsonGrammarLoader loader;
  ASSERT_TRUE(loader.load(ORION_GRAMMARS_DIR "/sql.json", grammar));
  EXPECT_EQ(loader.start(), "sql_statement");
  EXPECT_TRUE(grammar.is_nonterminal(grammar.symbols().find("sql_statement")));
  EXPECT_GT(grammar.rule_count(), 50u);
}

TEST(JsonUniverseLoaderTest, ParsesObjectsWithDefaults) {
  Universe universe;
  JsonUniverseLoader().parse(json::parse(R"({
    "emp": {"schema": "scott", "columns": ["empno", "ename"]},
    "v": {"name": "FeedBeef", "kind": "VIEW", "alias": "fb"},
    "s": {"kind": "SEQUENCE"}
  })"), universe);

  ASSERT_EQ(universe.size(), 3u);
  const CatalogObject& emp = universe.at("emp");
  EXPECT_EQ(emp.schema, "scott");
  EXPECT_EQ(emp.name, "emp");
  EXPECT_EQ(emp.alias, "emp");
  EXPECT_EQ(emp.kind, SourceKind::Table);
  EXPECT_EQ(emp.columns, (std::vector<std::string>{"empno", "ename"}));

  EXPECT_EQ(universe.at("v").name, "FeedBeef");
  EXPECT_EQ(universe.at("v").alias, "fb");
  EXPECT_EQ(universe.at("v").kind, SourceKind::View);
  EXPECT_TRUE(universe.at("s").columns.empty());
  EXPECT_EQ(universe.keys(SourceKind::Sequence), (std::vector<std::string>{"s"}));
}

TEST(JsonUniverseLoaderTest, RejectsUnknownAndInlineKinds) {
  Universe universe;
  EXPECT_THROW(JsonUniverseLoader().parse(json::parse(R"({"x": {"kind": "SYNONYM"}})"), universe), GrammarError);
  EXPECT_THROW(JsonUniverseLoader().parse(json::parse(R"({"x": {"kind": "PARENT"}})"), universe), GrammarError);
  EXPECT_TRUE(universe.empty());
}

TEST(JsonUniverseLoaderTest, NonObjectEntriesAreGrammarErrors) {
  Universe universe;
  EXPECT_THROW(JsonUniverseLoader().parse(json::parse(R"({"t": "x"})"), universe), GrammarError);
  EXPECT_THROW(JsonUniverseLoader().parse(json::parse(R"({"t": {"columns": "empno"}})"), universe), GrammarError);
  EXPECT_THROW(JsonUniverseLoader().parse(json::parse(R"({"t": {"kind": 3}})"), universe), GrammarError);
  EXPECT_THROW(JsonUniverseLoader().parse(json::parse("[1, 2]"), universe), GrammarError);
  EXPECT_TRUE(universe.empty());

  TempFile file("mistyped-universe.json", R"({"t": "x"})");
  EXPECT_THROW(JsonUniverseLoader().load(file.path(), universe), GrammarError);
}

TEST(JsonUniverseLoaderTest, LoadsBundledUniverse) {
  Universe universe;
  ASSERT_TRUE(JsonUniverseLoader().load(ORION_GRAMMARS_DIR "/scott.json", universe));
  EXPECT_EQ(universe.keys(SourceKind::Table).size(), 4u);
  EXPECT_EQ(universe.keys(SourceKind::View), (std::vector<std::string>{"FeedBeef"}));
  EXPECT_EQ(universe.keys(SourceKind::MaterializedView), (std::vector<std::string>{"DeafBabe"}));
  EXPECT_EQ(universe.keys(SourceKind::Sequence), (std::vector<std::string>{"FadedDad"}));
  EXPECT_FALSE(JsonUniverseLoader().load("/nonexistent/orion/universe.json", universe));
}

TEST(JsonWeightLoaderTest, SavedWeightsLoadBack) {
  WeightedGrammar grammar;
  grammar.add_rule("S", {"a"}, 3);
  grammar.add_rule("S", {"S", "b"}, 7);
  grammar.add_rule("T", {"c"}, 11);

  TempFile file("weights.json");
  JsonWeightLoader loader;
  ASSERT_TRUE(loader.save(file.path(), grammar));

  std::vector<Weight> weights;
  ASSERT_TRUE(loader.load(file.path(), weights));
  EXPECT_EQ(weights, (std::vector<Weight>{3, 7, 11}));
}

TEST(JsonWeightLoaderTest, RejectsMalformedFiles) {
  JsonWeightLoader loader;
  std::vector<Weight> weights;
  EXPECT_FALSE(loader.load("/nonexistent/orion/weights.json", weights));

  TempFile object("object-weights.json", R"({"weights": [1, 2]})");
  EXPECT_FALSE(loader.load(object.path(), weights));

  TempFile fractional("fractional-weights.json", "[1, 2.5]");
  EXPECT_FALSE(loader.load(fractional.path(), weights));

  TempFile commented("commented-weights.json", "[\n  4, // S ::= a\n  5  /* S ::= b */\n]\n");
  ASSERT_TRUE(loader.load(commented.path(), weights));
  EXPECT_EQ(weights, (std::vector<Weight>{4, 5}));
}

TEST(ConfigurationTest, Defaults) {
  Configuration config;
  EXPECT_EQ(config.value<std::string>("start"), "sql_statement");
  EXPECT_EQ(config.value<Weight>("top_weight"), 1000000);
  EXPECT_DOUBLE_EQ(config.value<double>("max_radius"), 1.0);
  EXPECT_FALSE(config.value<bool>("adjust_consistency"));
  EXPECT_EQ(config.value<int>("repair_attempts"), 20000);
  EXPECT_EQ(config.value<std::string>("breed_mutate"), "nonterminal");
  EXPECT_FALSE(config.has("seed"));
  EXPECT_THROW(config.value<int>("seed"), GrammarError);
  EXPECT_THROW(config.value<int>("start"), GrammarError);
}

TEST(ConfigurationTest, FileOverlaysDefaultsAndSetOverlaysFile) {
  TempFile file("config.json", "{\n  // comment\n  \"max_radius\": 0.9,\n  \"seed\": 42\n}\n");
  Configuration config;
  ASSERT_TRUE(config.load(file.path()));
  EXPECT_DOUBLE_EQ(config.value<double>("max_radius"), 0.9);
  EXPECT_EQ(config.value<int>("seed"), 42);
  EXPECT_EQ(config.value<std::string>("start"), "sql_statement");

  config.set("max_radius", 0.5);
  config.set<std::string>("breed_mate", "rule");
  EXPECT_DOUBLE_EQ(config.value<double>("max_radius"), 0.5);
  EXPECT_EQ(config.value<std::string>("breed_mate"), "rule");
}

TEST(ConfigurationTest, LoadRejectsNonObjects) {
  Configuration config;
  EXPECT_FALSE(config.load("/nonexistent/orion/config.json"));

  TempFile array("array-config.json", "[1, 2]");
  EXPECT_FALSE(config.load(array.path()));
  EXPECT_EQ(config.value<int>("repair_attempts"), 20000);
}

TEST(ConfigurationTest, BundledConfigurationLoads) {
  Configuration config;
  ASSERT_TRUE(config.load(ORION_GRAMMARS_DIR "/orion.json"));
  EXPECT_TRUE(config.value<bool>("adjust_consistency"));
  EXPECT_EQ(config.value<std::string>("breed_mate"), "rule");
}
