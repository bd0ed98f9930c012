// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <orion/tool/GeneratorTool.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace orion::runtime;
using namespace orion::tool;

namespace {

std::string read_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

class GeneratorToolTest : public ::testing::Test {
protected:
  WeightedGrammar grammar;
  Universe universe;
  std::filesystem::path dir;

  void SetUp() override {
    grammar.add_rule("S", {"a"}, 1);
    grammar.add_rule("S", {"b"}, 1);
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = std::filesystem::temp_directory_path() / (std::string("orion-generator-") + info->name());
    std::filesystem::remove_all(dir);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }
};

} // namespace

TEST_F(GeneratorToolTest, WritesOneFilePerTest) {
  DerivationEngine engine(grammar, universe);
  std::string out_format = (dir / "tests" / "test_%d.sql").string();
  GeneratorTool tool(engine, "S", out_format);

  for (int i = 0; i < 3; ++i) {
    GenerationResult result = tool.create_test(i, 100 + i);
    std::filesystem::path fn = dir / "tests" / ("test_" + std::to_string(i) + ".sql");
    ASSERT_TRUE(std::filesystem::exists(fn));
    EXPECT_EQ(read_file(fn), result.text);
    EXPECT_EQ(result.text.rfind("/*" + std::to_string(100 + i) + "*/ ", 0), 0u);
  }
  EXPECT_EQ(tool.failures(), 0);
}

TEST_F(GeneratorToolTest, BatchFileHoldsOneStatementPerLine) {
  DerivationEngine engine(grammar, universe);
  std::filesystem::path batch = dir / "batch.sql";
  {
    GeneratorTool tool(engine, "S", "", batch.string());
    for (int i = 0; i < 5; ++i) {
      tool.create_test(i, i);
    }
  }

  std::ifstream file(batch);
  std::vector<std::string> lines;
  for (std::string line; std::getline(file, line);) {
    lines.push_back(line);
  }
  ASSERT_EQ(lines.size(), 5u);
  for (size_t i = 0; i < lines.size(); ++i) {
    EXPECT_TRUE(lines[i] == "/*" + std::to_string(i) + "*/ a" || lines[i] == "/*" + std::to_string(i) + "*/ b") << lines[i];
  }
}

TEST_F(GeneratorToolTest, DryRunWritesNothing) {
  DerivationEngine engine(grammar, universe);
  GeneratorTool tool(engine, "S", (dir / "test_%d.sql").string(), "", 0, 2, false, true);
  GenerationResult result = tool.create_test(0, 1);
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(GeneratorToolTest, MemoEvictsOldestEntries) {
  DerivationEngine engine(grammar, universe);
  GeneratorTool tool(engine, "S", "", "", 2, 2, false, true);

  EXPECT_TRUE(tool.memoize_test("a", 1));
  EXPECT_FALSE(tool.memoize_test("a", 1));
  EXPECT_TRUE(tool.memoize_test("b", 1));
  EXPECT_TRUE(tool.memoize_test("c", 1));
  EXPECT_FALSE(tool.memoize_test("c", 1));
  EXPECT_TRUE(tool.memoize_test("a", 1));

  GeneratorTool unlimited(engine, "S", "", "", 0, 2, false, true);
  EXPECT_TRUE(unlimited.memoize_test("a", 1));
  EXPECT_TRUE(unlimited.memoize_test("a", 1));
}

TEST_F(GeneratorToolTest, DuplicateStatementsAreRetriedWithShiftedSeeds) {
  WeightedGrammar single;
  single.add_rule("S", {"a"}, 1);
  DerivationEngine engine(single, universe);
  GeneratorTool tool(engine, "S", "", "", 10, 3, false, true);

  GenerationResult first = tool.create_test(0, 7);
  EXPECT_EQ(first.seed, 7u);

  // Every attempt yields the same statement, so all three are used up.
  GenerationResult second = tool.create_test(1, 7);
  EXPECT_EQ(second.seed, 7u + (std::uint64_t{2} << 32));
  EXPECT_EQ(second.text, "/*" + std::to_string(second.seed) + "*/ a");
}

TEST_F(GeneratorToolTest, ProductionCountsAndFailuresAccumulate) {
  DerivationEngine engine(grammar, universe);
  GeneratorTool tool(engine, "S", "", "", 0, 1, true, true);
  for (int i = 0; i < 10; ++i) {
    tool.create_test(i, i);
  }

  int total = 0;
  for (const auto& [name, count] : tool.production_counts()) {
    EXPECT_TRUE(name == "Rule.S.0" || name == "Rule.S.1") << name;
    total += count;
  }
  EXPECT_EQ(total, 10);
  EXPECT_EQ(tool.failures(), 0);

  WeightedGrammar broken;
  broken.add_rule("S", {}, 1, GenAction::None, RepAction::Unimplemented);
  DerivationEngine broken_engine(broken, universe);
  GeneratorTool broken_tool(broken_engine, "S", "", "", 0, 1, false, true);
  GenerationResult result = broken_tool.create_test(0, 3);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.text, "/*3*/ select null from dual where 1 = 0");
  EXPECT_EQ(broken_tool.failures(), 1);
}

TEST_F(GeneratorToolTest, UnwritableOutputIsAGrammarError) {
  DerivationEngine engine(grammar, universe);
  std::filesystem::create_directories(dir);
  std::ofstream(dir / "blocker") << "x";
  EXPECT_THROW(GeneratorTool(engine, "S", (dir / "blocker" / "test_%d.sql").string()), GrammarError);
  EXPECT_THROW(GeneratorTool(engine, "S", "", (dir / "blocker" / "batch.sql").string()), GrammarError);

  // A directory in place of a test file is only found when writing it.
  std::filesystem::create_directories(dir / "tests" / "test_0.sql");
  GeneratorTool tool(engine, "S", (dir / "tests" / "test_%d.sql").string());
  EXPECT_THROW(tool.create_test(0, 1), GrammarError);
  EXPECT_NO_THROW(tool.create_test(1, 1));
}
