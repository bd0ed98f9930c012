// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_CONSISTENCY_HPP
#define ORION_RUNTIME_CONSISTENCY_HPP

#include "../util/log.hpp"
#include "../util/random.hpp"
#include "Grammar.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <tuple>
#include <utility>
#include <vector>

namespace orion {
namespace runtime {

class Matrix {
private:
  size_t rows_;
  size_t cols_;
  std::vector<double> data_;

public:
  Matrix() : Matrix(0, 0) { }
  Matrix(size_t rows, size_t cols) : rows_(rows), cols_(cols), data_(rows * cols, 0.0) { }

  size_t rows() const { return rows_; }
  size_t cols() const { return cols_; }

  double& operator()(size_t row, size_t col) { return data_[row * cols_ + col]; }
  double operator()(size_t row, size_t col) const { return data_[row * cols_ + col]; }

  Matrix operator*(const Matrix& other) const {
    Matrix result(rows_, other.cols_);
    for (size_t i = 0; i < rows_; ++i) {
      result.set_row_product(i, *this, other);
    }
    return result;
  }

  // Recomputes one row of this = lhs * rhs, skipping the zeros of lhs.
  void set_row_product(size_t row, const Matrix& lhs, const Matrix& rhs) {
    std::fill(data_.begin() + row * cols_, data_.begin() + (row + 1) * cols_, 0.0);
    for (size_t k = 0; k < lhs.cols_; ++k) {
      double factor = lhs(row, k);
      if (factor == 0.0) {
        continue;
      }
      for (size_t j = 0; j < cols_; ++j) {
        (*this)(row, j) += factor * rhs(k, j);
      }
    }
  }

  // Dominant eigenvalue of a square nonnegative matrix by power iteration.
  // The iteration runs on (M + I), whose Perron root is the one of M plus 1
  // and which does not oscillate on periodic matrices.
  double spectral_radius(int max_iterations = 10000, double tolerance = 1e-10) const {
    if (rows_ == 0) {
      return 0.0;
    }

    std::vector<std::tuple<size_t, size_t, double>> nonzeros;
    for (size_t i = 0; i < rows_; ++i) {
      for (size_t j = 0; j < cols_; ++j) {
        if ((*this)(i, j) != 0.0) {
          nonzeros.emplace_back(i, j, (*this)(i, j));
        }
      }
    }

    std::vector<double> v(rows_, 1.0);
    std::vector<double> next(rows_);
    double ratio = 1.0;
    for (int iteration = 0; iteration < max_iterations; ++iteration) {
      next = v;
      for (const auto& [i, j, value] : nonzeros) {
        next[i] += value * v[j];
      }
      double norm = *std::max_element(next.begin(), next.end());
      if (norm == 0.0) {
        return 0.0;
      }
      for (double& x : next) {
        x /= norm;
      }
      double previous = ratio;
      ratio = norm;
      std::swap(v, next);
      if (iteration > 0 && std::abs(ratio - previous) <= tolerance * ratio) {
        break;
      }
    }
    return std::max(0.0, ratio - 1.0);
  }
};

struct GrammarMatrices {
  Matrix q;  // nonterminal x rule: probability of the rule given its left-hand side
  Matrix c;  // rule x nonterminal: occurrences of the nonterminal on the right-hand side
  Matrix a;  // nonterminal x nonterminal: expected children, Q * C
};

struct RepairReport {
  double initial_radius;
  double radius;
  int attempts;
  bool bounded;
};

/*
 * Decides whether a grammar's weights keep the expected derivation size
 * finite (spectral radius of the expected-children matrix below 1), and
 * pushes inconsistent weights below a bound by shrinking the rules that
 * contribute most to the recursion.
 */
class ConsistencyAnalyzer {
private:
  WeightedGrammar& grammar_;

public:
  explicit ConsistencyAnalyzer(WeightedGrammar& grammar) : grammar_(grammar) { }
  ConsistencyAnalyzer(const ConsistencyAnalyzer& other) = delete;
  ConsistencyAnalyzer& operator=(const ConsistencyAnalyzer& other) = delete;
  ConsistencyAnalyzer(ConsistencyAnalyzer&& other) = delete;
  ConsistencyAnalyzer& operator=(ConsistencyAnalyzer&& other) = delete;
  ~ConsistencyAnalyzer() = default;

  GrammarMatrices build_matrices() const {
    const auto& nonterminals = grammar_.nonterminals();
    const auto& rules = grammar_.rules();
    GrammarMatrices m{Matrix(nonterminals.size(), rules.size()), Matrix(rules.size(), nonterminals.size()), Matrix()};

    for (const Nonterminal& nt : nonterminals) {
      set_q_row(m.q, nt);
    }
    for (const RuleEntry& entry : rules) {
      for (const Symbol* symbol : entry.production->rhs) {
        if (grammar_.is_nonterminal(symbol)) {
          m.c(entry.index, grammar_.nonterminal(symbol).index) += 1.0;
        }
      }
    }
    m.a = m.q * m.c;
    return m;
  }

  double spectral_radius() const {
    return build_matrices().a.spectral_radius();
  }

  bool consistent() const {
    return spectral_radius() < 1.0;
  }

  // Rescales every nonterminal's weights so that the largest is `top`. The
  // only rule of a nonterminal and all-zero groups get `top`, the rest are
  // floored at 1% of `top`.
  void adjust_weights(Weight top) {
    Weight lowest = static_cast<Weight>(std::ceil(0.01 * static_cast<double>(top)));
    for (const Nonterminal& nt : grammar_.nonterminals()) {
      const auto& rules = grammar_.rules();
      if (nt.rules.size() == 1) {
        grammar_.set_rule_weight(nt.rules[0], top);
        continue;
      }

      Weight max = 0;
      for (size_t index : nt.rules) {
        max = std::max(max, rules[index].weight);
      }
      if (max == 0) {
        for (size_t index : nt.rules) {
          grammar_.set_rule_weight(index, top);
        }
        continue;
      }

      double ratio = static_cast<double>(top) / static_cast<double>(max);
      for (size_t index : nt.rules) {
        Weight scaled = std::llround(static_cast<double>(rules[index].weight) * ratio);
        grammar_.set_rule_weight(index, std::max(scaled, lowest));
      }
    }
    grammar_.recompute_totals();
  }

  RepairReport validate_and_repair(const std::vector<Weight>& weights, Weight top, double max_radius,
                                   int max_attempts, util::RandomEngine& rng) {
    grammar_.set_weights(weights, false);
    adjust_weights(top);

    GrammarMatrices m = build_matrices();
    double radius = m.a.spectral_radius();
    RepairReport report{radius, radius, 0, radius < max_radius};
    ORION_LOG_INFO("Grammar is {}consistent; radius = {}", radius >= 1.0 ? "in" : "", radius);
    if (report.bounded || max_attempts < 1) {
      return report;
    }

    // Entries of A worth shrinking. Nonterminals with a single rule are
    // skipped: their only rule cannot lose probability.
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < m.a.rows(); ++i) {
      if (grammar_.nonterminals()[i].rules.size() == 1) {
        continue;
      }
      for (size_t j = 0; j < m.a.cols(); ++j) {
        if (m.a(i, j) != 0.0) {
          pairs.emplace_back(i, j);
        }
      }
    }
    if (pairs.empty()) {
      ORION_LOG_WARN("Radius {} cannot be reduced: only single-rule nonterminals recurse", radius);
      return report;
    }

    const double hi_cutoff = 0.9;
    const double lo_cutoff = 0.1;
    const double shrinker = 0.99;
    double shrink = hi_cutoff;
    double old_radius = radius;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
      report.attempts = attempt;
      auto [left, right] = util::random_choice(rng, pairs);
      const Nonterminal& nt = grammar_.nonterminals()[left];

      size_t max_index = nt.rules.front();
      double max_product = -1.0;
      for (size_t index : nt.rules) {
        double product = m.q(left, index) * m.c(index, right);
        if (product != 0.0 && product >= max_product) {
          max_product = product;
          max_index = index;
        }
      }

      Weight old_weight = grammar_.rules()[max_index].weight;
      Weight new_weight = std::max(static_cast<Weight>(std::ceil(static_cast<double>(old_weight) * shrink)), Weight(1));
      grammar_.set_rule_weight(max_index, new_weight);
      grammar_.recompute_total(left);
      set_q_row(m.q, nt);
      m.a.set_row_product(left, m.q, m.c);
      radius = m.a.spectral_radius();

      if (radius < max_radius) {
        adjust_weights(top);
        report.radius = spectral_radius();
        report.bounded = report.radius < max_radius;
        ORION_LOG_INFO("Grammar weights under bound {} after {} attempts; new spectral radius = {}", max_radius, attempt, report.radius);
        return report;
      }

      const char* direction;
      if (radius > old_radius) {
        grammar_.set_rule_weight(max_index, old_weight);
        grammar_.recompute_total(left);
        set_q_row(m.q, nt);
        m.a.set_row_product(left, m.q, m.c);
        shrink = std::max(lo_cutoff, shrink * shrinker);
        direction = "Regress";
      } else {
        old_radius = radius;
        shrink = std::min(hi_cutoff, (shrink + hi_cutoff) / 2.0);
        direction = "Improve";
      }

      if (attempt % 1000 == 0) {
        ORION_LOG_INFO("{}: {} radius = {}; shrink = {}", attempt, direction, old_radius, shrink);
      }
    }

    report.radius = old_radius;
    report.bounded = false;
    ORION_LOG_WARN("Weight repair gave up after {} attempts at radius {}", max_attempts, old_radius);
    return report;
  }

private:
  void set_q_row(Matrix& q, const Nonterminal& nt) const {
    const auto& rules = grammar_.rules();
    double total = static_cast<double>(nt.total);
    for (size_t index : nt.rules) {
      q(nt.index, index) = total > 0.0 ? static_cast<double>(rules[index].weight) / total : 0.0;
    }
  }
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_CONSISTENCY_HPP
