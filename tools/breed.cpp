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

#include <cstdint>
#include <format>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <tuple>
#include <vector>

#include "orion/config.hpp"

using namespace orion::runtime;
using namespace orion::tool;
using namespace orion::util;

template<class T>
GenerationCodec* codec_factory() { return new T(); }

static const std::map<std::string, std::tuple<std::string, GenerationCodec*(*)()>> generation_formats = {
  {"flatbuffers", {"ogf", codec_factory<FlatBuffersGenerationCodec>}},
  {"json", {"ogj", codec_factory<NlohmannJsonGenerationCodec>}},
};

static GeneMode gene_mode_option(const Configuration& config, const std::string& key, const std::string& option) {
  std::optional<GeneMode> mode = gene_mode_from_name(config.value<std::string>(key));
  if (!mode) {
    throw cxxopts::exceptions::parsing("Invalid argument for option '" + option + "'");
  }
  return *mode;
}

int main(int argc, char **argv) {
  std::string format_choices;
  for (const auto& format : generation_formats) {
    if (!format_choices.empty()) {
      format_choices += ", ";
    }
    format_choices += format.first;
  }

  try {
    cxxopts::Options options(argv[0], "Orion: Breed the next generation of grammar weights");
    options.add_options()
      ("input",
       "scored generation snapshot to breed from",
       cxxopts::value<std::string>(),
       "FILE")
      ("c,config",
       "JSON configuration file (command line options take precedence)",
       cxxopts::value<std::string>(),
       "FILE")
      ("g,grammar",
       "JSON grammar definition",
       cxxopts::value<std::string>(),
       "FILE")
      ("w,weights",
       "JSON array of rule weights to seed the first generation with (default: the weights of the grammar definition)",
       cxxopts::value<std::string>(),
       "FILE")
      ("init",
       "create a first generation of NUM candidates instead of breeding",
       cxxopts::value<int>(),
       "NUM")
      ("o,out",
       "file to save the new generation to",
       cxxopts::value<std::string>(),
       "FILE")
      ("format",
       "format of the generation snapshots (choices: " + format_choices + ")",
       cxxopts::value<std::string>()->default_value(ORION_STRFY(ORION_GENERATION_FORMAT)),
       "NAME")
      ("mutate",
       "unit of mutation (choices: rule, nonterminal)",
       cxxopts::value<std::string>(),
       "NAME")
      ("mate",
       "unit of crossover (choices: rule, nonterminal)",
       cxxopts::value<std::string>(),
       "NAME")
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

    options.parse_positional({"input"});
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
      pout(options.help());
      exit(0);
    }
    if (args.count("version")) {
      poutf("{} {}", argv[0], ORION_STRFY(ORION_VERSION));
      poutf("generation format: {}", ORION_STRFY(ORION_GENERATION_FORMAT));
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
    if (args.count("mutate")) {
      config.set("breed_mutate", args["mutate"].as<std::string>());
    }
    if (args.count("mate")) {
      config.set("breed_mate", args["mate"].as<std::string>());
    }
    if (args.count("log-level")) {
      config.set("log_level", args["log-level"].as<std::string>());
    }
    if (!set_log_level(config.value<std::string>("log_level"))) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'log-level'");
    }
    GeneMode mutate_mode = gene_mode_option(config, "breed_mutate", "mutate");
    GeneMode mate_mode = gene_mode_option(config, "breed_mate", "mate");

    if (!args.count("out")) {
      throw cxxopts::exceptions::parsing("An output file is required (--out)");
    }
    if (!args.count("init") && !args.count("input")) {
      throw cxxopts::exceptions::parsing("Either an input snapshot or --init is required");
    }

    auto format_it = generation_formats.find(args["format"].as<std::string>());
    if (format_it == generation_formats.end()) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'format'");
    }

    WeightedGrammar grammar;
    if (config.value<std::string>("grammar").empty()) {
      throw cxxopts::exceptions::parsing("A grammar definition is required (--grammar)");
    }
    if (!JsonGrammarLoader().load(config.value<std::string>("grammar"), grammar)) {
      exit(1);
    }

    RandomEngine rng(args.count("random-seed") ? args["random-seed"].as<std::uint64_t>()
                     : config.has("seed") ? config.value<std::uint64_t>("seed")
                     : std::random_device()());

    GenerationCodec* codec = std::get<1>(format_it->second)();
    Generation next;
    if (args.count("init")) {
      int count = args["init"].as<int>();
      if (count < 1) {
        delete codec;
        throw cxxopts::exceptions::parsing("Invalid argument for option 'init'");
      }
      std::vector<Weight> weights = grammar.to_weights();
      if (!config.value<std::string>("weights_in").empty()
          && !JsonWeightLoader().load(config.value<std::string>("weights_in"), weights)) {
        delete codec;
        exit(1);
      }
      grammar.set_weights(weights);
      double radius = ConsistencyAnalyzer(grammar).spectral_radius();
      if (radius >= 1.0) {
        perrf("Initial weights are inconsistent; radius = {}", radius);
        delete codec;
        exit(1);
      }

      CandidateIds ids;
      Breeder breeder(grammar, rng, ids, mutate_mode, mate_mode);
      next.round = 0;
      next.candidates.push_back({ids.next(), weights});
      std::vector<Candidate> mutants;
      for (int i = 1; i < count; ++i) {
        mutants.push_back({ids.next(), weights});
      }
      breeder.mutate(mutants, true);
      next.candidates.insert(next.candidates.end(), mutants.begin(), mutants.end());
      poutf("Created generation 0 with {} candidate(s).", next.candidates.size());
    } else {
      std::string in_fn = args["input"].as<std::string>();
      Generation* current = codec->load(in_fn);
      if (!current) {
        perrf("File {} does not contain a valid generation.", in_fn);
        delete codec;
        exit(1);
      }
      for (const Candidate& candidate : current->candidates) {
        if (candidate.weights.size() != grammar.rule_count()) {
          perrf("Candidate {} has {} weights; the grammar has {} rules.", candidate.id, candidate.weights.size(), grammar.rule_count());
          delete current;
          delete codec;
          exit(1);
        }
      }

      CandidateIds ids(*current);
      Breeder breeder(grammar, rng, ids, mutate_mode, mate_mode);
      try {
        pout(format_scores(current->candidates, std::format("Scores of generation {}", current->round)));
        BreedResult result = breeder.breed(current->candidates);
        next.round = current->round + 1;
        next.candidates = std::move(result.generation);
        poutf("Winner of generation {}: candidate {} (score = {})", current->round, result.winner.id, result.winner.score);
      } catch (const GrammarError&) {
        delete current;
        delete codec;
        throw;
      }
      delete current;
    }

    std::string out_fn = args["out"].as<std::string>();
    bool saved = codec->save(out_fn, next);
    delete codec;
    if (!saved) {
      perrf("Failed to write generation {} to {}.", next.round, out_fn);
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
