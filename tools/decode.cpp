// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#include <orion/runtime.hpp>
#include <orion/tool.hpp>
#include <orion/util/print.hpp>

#include <cxxopts.hpp>

#include <filesystem>
#include <format>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "orion/config.hpp"

using namespace orion::runtime;
using namespace orion::tool;
using namespace orion::util;
namespace fs = std::filesystem;

template<class T>
GenerationCodec* codec_factory() { return new T(); }

static const std::map<std::string, std::tuple<std::string, GenerationCodec*(*)()>> generation_formats = {
  {"flatbuffers", {"ogf", codec_factory<FlatBuffersGenerationCodec>}},
  {"json", {"ogj", codec_factory<NlohmannJsonGenerationCodec>}},
};

// The format named by the extension of the file, or the fallback.
static std::string format_of(const fs::path& fn, const std::string& fallback) {
  for (const auto& format : generation_formats) {
    if (fn.extension() == "." + std::get<0>(format.second)) {
      return format.first;
    }
  }
  return fallback;
}

static bool write_text(const fs::path& fn, const std::string& text) {
  if (!pfile(fn.string(), text)) {
    perrf("Failed to write output file {}.", fn.string());
    return false;
  }
  return true;
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
    cxxopts::Options options(argv[0], "Orion: Decode generation snapshots");
    options.add_options()
      ("input",
       "generation snapshots to process",
       cxxopts::value<std::vector<std::string>>(),
       "PATH")
      ("o,out",
       "directory to save the decoded files",
       cxxopts::value<std::string>()->default_value((fs::current_path()).string()),
       "DIR")
      ("stdout",
       "print decoded snapshots to stdout (alias for --out='')",
       cxxopts::value<bool>())
      ("format",
       "format of the snapshots (choices: " + format_choices + "; default: guessed from the file extension)",
       cxxopts::value<std::string>(),
       "NAME")
      ("g,grammar",
       "JSON grammar definition; if given, the weights of every candidate are written annotated with their rules",
       cxxopts::value<std::string>(),
       "FILE")
      ("version", "print version and exit")
      ("help", "print help and exit");

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

    if (args.count("format") && !generation_formats.contains(args["format"].as<std::string>())) {
      throw cxxopts::exceptions::parsing("Invalid argument for option 'format'");
    }
    if (!args.count("input")) {
      throw cxxopts::exceptions::parsing("No input snapshot given");
    }

    fs::path out_dir = args.count("stdout") ? "" : args["out"].as<std::string>();
    if (!out_dir.empty()) {
      fs::create_directories(out_dir);
    }

    WeightedGrammar grammar;
    bool annotate = args.count("grammar") > 0;
    if (annotate && !JsonGrammarLoader().load(args["grammar"].as<std::string>(), grammar)) {
      exit(1);
    }

    int failures = 0;
    for (const auto &path_str : args["input"].as<std::vector<std::string>>()) {
      fs::path in_file{path_str};
      std::string format = args.count("format") ? args["format"].as<std::string>()
                                                : format_of(in_file, ORION_STRFY(ORION_GENERATION_FORMAT));
      GenerationCodec *codec = std::get<1>(generation_formats.at(format))();
      Generation *generation = codec->load(in_file.string());
      delete codec;
      if (!generation) {
        perrf("File {} does not contain a valid generation.", in_file.string());
        ++failures;
        continue;
      }

      if (!annotate) {
        std::string text = NlohmannJsonGenerationCodec::toJson(*generation).dump(2) + "\n";
        if (out_dir.empty()) {
          pout(text);
        } else if (!write_text(out_dir / (in_file.stem().string() + ".json"), text)) {
          ++failures;
        }
        delete generation;
        continue;
      }

      for (const Candidate& candidate : generation->candidates) {
        try {
          grammar.set_weights(candidate.weights, false);
        } catch (const GrammarError& e) {
          perrf("Candidate {} of {} does not fit the grammar: {}", candidate.id, in_file.string(), e.what());
          ++failures;
          continue;
        }
        if (out_dir.empty()) {
          poutf("// Candidate {} (score = {}{})", candidate.id, candidate.score, candidate.special ? ", special" : "");
          pout(grammar.human_weights());
        } else if (!write_text(out_dir / std::format("{}_{}.json", in_file.stem().string(), candidate.id), grammar.human_weights())) {
          ++failures;
        }
      }
      delete generation;
    }

    if (failures > 0) {
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
