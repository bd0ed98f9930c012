// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <orion/runtime.hpp>
#include <orion/tool.hpp>
#include <orion/util/log.hpp>
#include <orion/util/print.hpp>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include "orion/config.hpp"

using namespace orion::runtime;
using namespace orion::tool;
using namespace orion::util;

int main(int argc, char **argv) {
  try {
    cxxopts::Options options(argv[0], "Orion: Generate SQL test statements");
    options.add_options()
      ("c,config",
       "JSON configuration file (command line options take precedence)",
       cxxopts::value<std::string>(),
       "FILE")
      ("g,grammar",
       "JSON grammar definition",
       cxxopts::value<std::string>(),
       "FILE")
      ("u,universe",
       "JSON catalog of the database objects to refer to",
       cxxopts::value<std::string>(),
       "FILE")
      ("w,weights",
       "JSON array of rule weights (default: the weights of the grammar definition)",
       cxxopts::value<std::string>(),
       "FILE")
      ("r,start",
       "name of the nonterminal to start generation from (default: the start of the grammar definition)",
       cxxopts::value<std::string>(),
       "NAME")
      ("o,out",
       "output file name pattern",
       cxxopts::value<std::string>()->default_value((std::filesystem::current_path() / "tests" / "test_%d.sql").string()),
       "FILE")
      ("stdout",
       "print test cases to stdout (alias for --out='')",
       cxxopts::value<bool>())
      ("batch-file",
       "write all test cases into one file, one per line",
       cxxopts::value<std::string>(),
       "FILE")
      ("n",
       "number of tests to generate",
       cxxopts::value<int>()->default_value("1"),
       "NUM")
      ("memo-size",
       "memoize the last NUM unique tests; if a memoized test case is generated again, it is discarded and generation of a unique test case is retried",
       cxxopts::value<int>()->default_value("0"),
       "NUM")
      ("unique-attempts",
       "limit on how many times to try to generate a unique (i.e., non-memoized) test case; no effect if --memo-size=0",
       cxxopts::value<int>()->default_value("2"),
       "NUM")
      ("production-counts",
       "write how many times each rule was used, summed over all tests, as JSON",
       cxxopts::value<std::string>(),
       "FILE")
      ("analyze",
       "print the sequence of rule applications of every test",
       cxxopts::value<bool>()->default_value("false"))
      ("random-seed",
       "seed of the first test; test i is generated from seed + i (not set by default)",
       cxxopts::value<std::uint64_t>(),
       "NUM")
      ("dry-run",
       "generate tests without writing them to file or printing to stdout",
       cxxopts::value<bool>()->default_value("false"))
      ("log-level",
       "verbosity of diagnostics (off, fatal, error, warn, info, debug, trace)",
       cxxopts::value<std::string>(),
       "LEVEL")
      ("version", "print version and exit")
      ("help", "print help and exit")
      ;
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
      pout(options.help());
      exit(0);
    }
    if (args.count("version")) {
      poutf("{} {}", argv[0], ORION_STRFY(ORION_VERSION));
      exit(0);
    }

    Configuration config;
    if (args.count("config") && !config.load(args["config"].as<std::string>())) {
      exit(1);
    }
    for (const char* key : {"grammar", "universe", "start", "log_level"}) {
      std::string option(key);
      std::replace(option.begin(), option.end(), '_', '-');
      if (args.count(option)) {
        config.set(key, args[option].as<std::string>());
      }
    }
    if (args.count("weights")) {
      config.set("weights_in", args["weights"].as<std::string>());
    }
    if (!set_log_level(config.value<std::string>("log_level"))) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'log-level'");
    }

    WeightedGrammar grammar;
    JsonGrammarLoader grammar_loader;
    if (config.value<std::string>("grammar").empty()) {
      throw cxxopts::exceptions::parsing("A grammar definition is required (--grammar)");
    }
    if (!grammar_loader.load(config.value<std::string>("grammar"), grammar)) {
      exit(1);
    }
    std::string start = args.count("start") || grammar_loader.start().empty()
        ? config.value<std::string>("start")
        : grammar_loader.start();

    Universe universe;
    if (!config.value<std::string>("universe").empty()
        && !JsonUniverseLoader().load(config.value<std::string>("universe"), universe)) {
      exit(1);
    }

    if (!config.value<std::string>("weights_in").empty()) {
      std::vector<Weight> weights;
      if (!JsonWeightLoader().load(config.value<std::string>("weights_in"), weights)) {
        exit(1);
      }
      grammar.set_weights(weights);
    }
    double radius = ConsistencyAnalyzer(grammar).spectral_radius();
    if (radius >= 1.0) {
      perrf("Grammar is inconsistent; radius = {}", radius);
      exit(1);
    }

    DerivationEngine engine(grammar, universe);
    AnalysisListener* analysis = nullptr;
    if (args["analyze"].as<bool>()) {
      analysis = new AnalysisListener();
      engine.add_listener(analysis);
    }

    std::uint64_t seed = args.count("random-seed") ? args["random-seed"].as<std::uint64_t>()
        : config.has("seed") ? config.value<std::uint64_t>("seed")
        : std::random_device()();
    bool count_productions = args.count("production-counts") > 0;
    GeneratorTool generator(engine,  // engine
                            start,  // start
                            args.count("stdout") ? "" : args["out"].as<std::string>(),  // out_format
                            args.count("batch-file") ? args["batch-file"].as<std::string>() : "",  // batch_file
                            args["memo-size"].as<int>(),  // memo_size
                            args["unique-attempts"].as<int>(),  // unique_attempts
                            count_productions,  // count_productions
                            args["dry-run"].as<bool>()  // dry_run
                            );

    for (int i = 0, n = args["n"].as<int>(); i < n; ++i) {
      GenerationResult result = generator.create_test(i, seed + i);
      if (!result.success) {
        ORION_LOG_INFO("Test case #{} replaced by the fallback statement: {}", i, result.reason);
      }
      if (analysis) {
        pout(analysis->format());
      }
    }
    if (generator.failures() > 0) {
      ORION_LOG_WARN("{} test case(s) fell back to the safe statement", generator.failures());
    }

    if (count_productions) {
      std::string fn = args["production-counts"].as<std::string>();
      if (!pfile(fn, nlohmann::json(generator.production_counts()).dump(2) + "\n")) {
        perrf("Failed to write the production counts file: {}", fn);
        exit(1);
      }
    }
  } catch (const cxxopts::exceptions::exception &e) {
    perrf("error parsing options: {}", e.what());
    exit(1);
  } catch (const GrammarError &e) {
    perrf("grammar error: {}", e.what());
    exit(1);
  } catch (const ScopeError &e) {
    perrf("scope error: {}", e.what());
    exit(1);
  }
}
