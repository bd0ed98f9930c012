// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_BREEDER_HPP
#define ORION_RUNTIME_BREEDER_HPP

#include "../util/log.hpp"
#include "../util/random.hpp"
#include "Consistency.hpp"
#include "Errors.hpp"
#include "Grammar.hpp"
#include "Population.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

namespace orion {
namespace runtime {

// Unit of inheritance: one rule weight, or the weight group of one nonterminal.
enum class GeneMode {
  RuleAsGene = 0,
  NonterminalAsGene,
};

inline constexpr std::array<std::string_view, 2> gene_mode_names = {"rule", "nonterminal"};

inline std::optional<GeneMode> gene_mode_from_name(std::string_view name) {
  for (size_t i = 0; i < gene_mode_names.size(); ++i) {
    if (gene_mode_names[i] == name) {
      return static_cast<GeneMode>(i);
    }
  }
  return std::nullopt;
}

struct BreedResult {
  std::vector<Candidate> generation;
  Candidate winner;
};

/*
 * Builds the next generation of weight vectors from a scored one. Every
 * offspring and mutant must pass the consistency check on the shared
 * grammar; the grammar is left armed with whatever vector was checked last.
 */
class Breeder {
public:
  static constexpr double pass_through_rate = 0.1;
  static constexpr double rule_mutate_rate = 0.2;
  static constexpr double nt_mutate_rate = 0.1;
  static constexpr double nt_gene_rate = 0.1;
  static constexpr double noise_mean = 1.0;
  static constexpr double noise_stddev = 0.1;
  static constexpr int mate_attempts = 20;

private:
  WeightedGrammar& grammar_;
  ConsistencyAnalyzer analyzer_;
  util::RandomEngine& rng_;
  CandidateIds& ids_;
  GeneMode mutate_mode_;
  GeneMode mate_mode_;

public:
  Breeder(WeightedGrammar& grammar, util::RandomEngine& rng, CandidateIds& ids,
          GeneMode mutate_mode = GeneMode::NonterminalAsGene, GeneMode mate_mode = GeneMode::NonterminalAsGene)
      : grammar_(grammar), analyzer_(grammar), rng_(rng), ids_(ids), mutate_mode_(mutate_mode), mate_mode_(mate_mode) { }

  Breeder(const Breeder& other) = delete;
  Breeder& operator=(const Breeder& other) = delete;
  Breeder(Breeder&& other) = delete;
  Breeder& operator=(Breeder&& other) = delete;
  ~Breeder() = default;

  BreedResult breed(std::vector<Candidate> current) {
    if (current.empty()) {
      throw GrammarError("Cannot breed an empty generation");
    }
    size_t size = current.size();
    std::stable_sort(current.begin(), current.end(), [](const Candidate& a, const Candidate& b) {
      return a.score < b.score;
    });
    ORION_LOG_DEBUG("{}", format_scores(current, "Sorted scores"));

    // Rank i (1 = worst) appears i times.
    std::vector<const Candidate*> fitness;
    for (size_t i = 1; i <= size; ++i) {
      fitness.insert(fitness.end(), i, &current[i - 1]);
    }

    // Special candidates pass first, then the winner if there is room. The
    // next generation never exceeds the size of the current one.
    std::vector<Candidate> next;
    for (const Candidate& candidate : current) {
      if (next.size() == size) {
        break;
      }
      if (candidate.special) {
        ORION_LOG_DEBUG("Special code pass thru candidate {}", candidate.id);
        next.push_back(offspring(candidate.weights));
      }
    }
    if (next.size() < size) {
      ORION_LOG_DEBUG("Winner pass thru candidate {}", current.back().id);
      next.push_back(offspring(current.back().weights));
    }

    size_t pass_count = static_cast<size_t>(static_cast<double>(size) * pass_through_rate + 1);
    pass_count = std::min(pass_count, size - std::min(size, next.size()));
    for (size_t i = 0; i < pass_count; ++i) {
      next.push_back(pass_through(fitness));
    }
    while (next.size() < size) {
      next.push_back(mate(fitness));
    }

    mutate(next);
    return {std::move(next), current.back()};
  }

  void mutate(std::vector<Candidate>& generation, bool mutate_all = false) {
    if (mutate_mode_ == GeneMode::RuleAsGene) {
      mutate_rule_as_gene(generation, mutate_all);
    } else {
      mutate_nt_as_gene(generation, mutate_all);
    }
  }

  Candidate mate(const std::vector<const Candidate*>& fitness) {
    return mate_mode_ == GeneMode::RuleAsGene ? mate_rule_as_gene(fitness) : mate_nt_as_gene(fitness);
  }

  Candidate pass_through(const std::vector<const Candidate*>& fitness) {
    const Candidate* parent = util::random_choice(rng_, fitness);
    ORION_LOG_DEBUG("Passed through candidate {}", parent->id);
    return offspring(parent->weights);
  }

  // Perturbs about 5% of the weights of a candidate. A candidate for which
  // no consistent perturbation is found keeps its weights.
  void mutate_rule_as_gene(std::vector<Candidate>& generation, bool mutate_all = false) {
    for (Candidate& candidate : generation) {
      if (!mutate_all && util::random_real(rng_, 0.0, 1.0) >= rule_mutate_rate) {
        continue;
      }
      ORION_LOG_DEBUG("Mutate candidate {}", candidate.id);
      const std::vector<Weight>& original = candidate.weights;
      size_t count = std::max<size_t>(1, original.size() / 20);
      bool success = false;
      for (size_t attempt = 0; attempt < generation.size() && !original.empty(); ++attempt) {
        std::vector<Weight> genes = original;
        for (size_t i = 0; i < count; ++i) {
          size_t index = util::random_index(rng_, genes.size());
          genes[index] = perturb(genes[index]);
        }
        if (consistent(genes)) {
          candidate.weights = std::move(genes);
          success = true;
          break;
        }
      }
      if (!success) {
        grammar_.set_weights(candidate.weights);
        ORION_LOG_WARN("Mutation failed for candidate {}", candidate.id);
      }
    }
  }

  // Regenerates the weight groups of about 10% of the nonterminals.
  void mutate_nt_as_gene(std::vector<Candidate>& generation, bool mutate_all = false) {
    size_t count = static_cast<size_t>(std::ceil(static_cast<double>(grammar_.nt_count()) * nt_gene_rate));
    for (Candidate& candidate : generation) {
      if (!mutate_all && util::random_real(rng_, 0.0, 1.0) >= nt_mutate_rate) {
        continue;
      }
      ORION_LOG_DEBUG("Mutate candidate {}", candidate.id);
      bool success = false;
      for (size_t attempt = 0; attempt < generation.size(); ++attempt) {
        grammar_.set_weights(candidate.weights);
        for (size_t i = 0; i < count; ++i) {
          NonterminalWeights group = grammar_.random_nt(rng_);
          for (Weight& weight : group.weights) {
            weight = perturb(weight);
          }
          grammar_.update_nt(group);
        }
        if (analyzer_.consistent()) {
          candidate.weights = grammar_.to_weights();
          success = true;
          break;
        }
      }
      if (!success) {
        grammar_.set_weights(candidate.weights);
        ORION_LOG_WARN("Mutation failed for candidate {}", candidate.id);
      }
    }
  }

  // Copies a random wrap-around run of the second parent's weights onto the
  // first parent's.
  Candidate mate_rule_as_gene(const std::vector<const Candidate*>& fitness) {
    auto [first, second] = choose_parents(fitness);
    if (!second) {
      return offspring(first->weights);
    }

    size_t length = first->weights.size();
    for (int attempt = 0; attempt < mate_attempts && length > 0; ++attempt) {
      std::vector<Weight> genes = first->weights;
      size_t start = util::random_index(rng_, length);
      size_t swap = static_cast<size_t>(std::max(0.0, util::random_gauss(rng_, 0.5, 0.1) * static_cast<double>(length)));
      swap = std::max<size_t>(swap, 1);
      if (swap >= length) {
        swap = std::max<size_t>(length / 2, 1);
      }
      for (size_t i = 0; i < swap; ++i) {
        size_t index = (start + i) % length;
        genes[index] = second->weights[index];
      }
      ORION_LOG_DEBUG("Cross over candidate {} with candidate {}; start = {}, len = {}", first->id, second->id, start, swap);
      if (consistent(genes)) {
        return offspring(std::move(genes));
      }
    }
    ORION_LOG_DEBUG("Crossover failed for candidates {} and {}", first->id, second->id);
    return offspring(first->weights);
  }

  // Copies the weight groups of more than half of the nonterminals of the
  // second parent onto the first parent.
  Candidate mate_nt_as_gene(const std::vector<const Candidate*>& fitness) {
    auto [first, second] = choose_parents(fitness);
    if (!second) {
      return offspring(first->weights);
    }
    ORION_LOG_DEBUG("Cross over candidate {} with candidate {}", first->id, second->id);

    for (int attempt = 0; attempt < mate_attempts; ++attempt) {
      grammar_.set_weights(second->weights);
      std::vector<NonterminalWeights> groups;
      std::set<const Symbol*> chosen;
      while (2 * chosen.size() <= grammar_.nt_count()) {
        NonterminalWeights group = grammar_.random_nt(rng_);
        if (chosen.insert(group.symbol).second) {
          groups.push_back(std::move(group));
        }
      }

      grammar_.set_weights(first->weights);
      for (const NonterminalWeights& group : groups) {
        grammar_.update_nt(group);
      }
      if (analyzer_.consistent()) {
        return offspring(grammar_.to_weights());
      }
    }
    ORION_LOG_DEBUG("Crossover failed for candidates {} and {}", first->id, second->id);
    return offspring(first->weights);
  }

private:
  Candidate offspring(std::vector<Weight> weights) {
    return {ids_.next(), std::move(weights)};
  }

  Weight perturb(Weight weight) {
    Weight result = static_cast<Weight>(static_cast<double>(weight) * util::random_gauss(rng_, noise_mean, noise_stddev));
    return std::max<Weight>(result, 1);
  }

  bool consistent(const std::vector<Weight>& weights) {
    grammar_.set_weights(weights);
    return analyzer_.consistent();
  }

  // Two parents with different ids drawn from the fitness multiset. The
  // second is null when the multiset holds a single candidate.
  std::pair<const Candidate*, const Candidate*> choose_parents(const std::vector<const Candidate*>& fitness) {
    if (fitness.empty()) {
      throw GrammarError("Cannot choose parents from an empty generation");
    }
    const Candidate* first = util::random_choice(rng_, fitness);
    bool distinct = std::any_of(fitness.begin(), fitness.end(), [&](const Candidate* c) { return c->id != first->id; });
    if (!distinct) {
      return {first, nullptr};
    }
    const Candidate* second;
    do {
      second = util::random_choice(rng_, fitness);
    } while (second->id == first->id);
    return {first, second};
  }
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_BREEDER_HPP
