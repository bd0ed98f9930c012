// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_POPULATION_HPP
#define ORION_RUNTIME_POPULATION_HPP

#include "Grammar.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <vector>

namespace orion {
namespace runtime {

// One weight vector competing in a round, with the score the external
// scorer gave it.
struct Candidate {
  int id;
  std::vector<Weight> weights;
  double score{0.0};
  bool special{false};  // A rare outcome was observed; keep it unchanged.
};

struct Generation {
  int round{0};
  std::vector<Candidate> candidates{};
};

// Hands out candidate ids, never reusing one within a run.
class CandidateIds {
private:
  int next_;

public:
  explicit CandidateIds(int first = 1) : next_(first) { }

  // Continues after the largest id of an existing generation.
  explicit CandidateIds(const Generation& generation) : next_(1) {
    for (const Candidate& candidate : generation.candidates) {
      next_ = std::max(next_, candidate.id + 1);
    }
  }

  int next() { return next_++; }
};

// Score table of a generation, one candidate per line.
inline std::string format_scores(const std::vector<Candidate>& candidates, const std::string& caption = "Scores") {
  int id_width = 1;
  for (const Candidate& candidate : candidates) {
    id_width = std::max(id_width, static_cast<int>(std::to_string(candidate.id).size()));
  }
  int count_width = std::max(2, static_cast<int>(std::to_string(candidates.size()).size()));

  std::string result = std::format("{}\n", caption);
  for (size_t i = 0; i < candidates.size(); ++i) {
    result += std::format("{:>{}}. Score({:>{}}) = {:8.2f}{}\n", i + 1, count_width, candidates[i].id, id_width,
                          candidates[i].score, candidates[i].special ? " *" : "");
  }
  return result;
}

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_POPULATION_HPP
