// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <orion/runtime.hpp>
#include <orion/tool.hpp>
#include <orion/util/print.hpp>
#include <orion/util/random.hpp>

#include <cxxopts.hpp>

#include <random>
#include <string>
#include <vector>

#include "orion/config.hpp"

using namespace orion::runtime;
using namespace orion::tool;
using namespace orion::util;

int main(int argc, char **argv) {
  try {
    cxxopts::Options options(argv[0], "Orion: Validate (and repair) grammar weights");
    options.add_options()
      ("c,config",
       "JSON configuration file (command line options take precedence)",
       cxxopts::value<std::string>(),
       "FILE")
      ("g,grammar",
       "JSON grammar definition",
       cxxopts::value<std::string>(),
       "FILE")
      ("w,weights",
       "JSON array of rule weights to validate (default: the weights of the grammar definition)",
       cxxopts::value<std::string>(),
       "FILE")
      ("o,out",
       "file to write the resulting weights to (default: stdout)",
       cxxopts::value<std::string>(),
       "FILE")
      ("top-weight",
       "largest weight of every nonterminal after adjustment",
       cxxopts::value<Weight>(),
       "NUM")
      ("max-radius",
       "bound on the spectral radius",
       cxxopts::value<double>(),
       "NUM")
      ("adjust",
       "shrink recursive rules until the radius is under the bound",
       cxxopts::value<bool>()->default_value("false"))
      ("repair-attempts",
       "limit on the number of weight shrinking steps",
       cxxopts::value<int>(),
       "NUM")
      ("dump-grammar",
       "print the rules of the grammar and exit",
       cxxopts::value<bool>()->default_value("false"))
      ("initial-weights",
       "print the weights of the grammar definition and exit",
       cxxopts::value<bool>()->default_value("false"))
      ("random-seed",
       "initialize random number generator with fixed seed (not set by default)",
       cxxopts::value<std::uint64_t>(),
       "NUM")
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
    if (args.count("grammar")) {
      config.set("grammar", args["grammar"].as<std::string>());
    }
    if (args.count("weights")) {
      config.set("weights_in", args["weights"].as<std::string>());
    }
    if (args.count("top-weight")) {
      config.set("top_weight", args["top-weight"].as<Weight>());
    }
    if (args.count("max-radius")) {
      config.set("max_radius", args["max-radius"].as<double>());
    }
    if (args["adjust"].as<bool>()) {
      config.set("adjust_consistency", true);
    }
    if (args.count("repair-attempts")) {
      config.set("repair_attempts", args["repair-attempts"].as<int>());
    }
    if (args.count("log-level")) {
      config.set("log_level", args["log-level"].as<std::string>());
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

    if (args["dump-grammar"].as<bool>()) {
      pout(grammar.format(grammar.symbols().find(grammar_loader.start())));
      exit(0);
    }
    if (args["initial-weights"].as<bool>()) {
      pout(grammar.human_weights());
      exit(0);
    }

    std::vector<Weight> weights = grammar.to_weights();
    if (!config.value<std::string>("weights_in").empty()
        && !JsonWeightLoader().load(config.value<std::string>("weights_in"), weights)) {
      exit(1);
    }

    RandomEngine rng(args.count("random-seed") ? args["random-seed"].as<std::uint64_t>()
                     : config.has("seed") ? config.value<std::uint64_t>("seed")
                     : std::random_device()());
    Weight top = config.value<Weight>("top_weight");
    double max_radius = config.value<double>("max_radius");
    bool adjust = config.value<bool>("adjust_consistency");
    ConsistencyAnalyzer analyzer(grammar);
    RepairReport report = analyzer.validate_and_repair(weights, top, max_radius,
                                                       adjust ? config.value<int>("repair_attempts") : 0, rng);

    perrf("Grammar is {}consistent; radius = {}", report.initial_radius >= 1.0 ? "in" : "", report.initial_radius);
    if (report.bounded) {
      perrf("Grammar is under bound {} (radius = {} after {} repair attempts). New weights written.", max_radius, report.radius, report.attempts);
    } else if (!adjust) {
      perrf("Grammar radius {} > bound {}. Adjustment is off; out of bounds weights written.", report.radius, max_radius);
    } else {
      perrf("Grammar radius {} is still over bound {} after {} attempts.", report.radius, max_radius, report.attempts);
    }

    if (args.count("out")) {
      if (!JsonWeightLoader().save(args["out"].as<std::string>(), grammar)) {
        exit(1);
      }
    } else {
      pout(grammar.human_weights());
    }

    if (adjust && !report.bounded) {
      exit(1);
    }
  } catch (const cxxopts::exceptions::exception &e) {
    perrf("error parsing options: {}", e.what());
    exit(1);
  } catch (const GrammarError &e) {
    perrf("grammar error: {}", e.what());
    exit(1);
  }
}
