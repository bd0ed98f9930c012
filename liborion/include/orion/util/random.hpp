// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_UTIL_RANDOM_HPP
#define ORION_UTIL_RANDOM_HPP

#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

namespace orion {
namespace util {

// There is no process-wide engine: every generation and breeding call is
// handed the engine it draws from, so equal seeds replay equal results.
using RandomEngine = std::mt19937_64;

template<class RealType = double>
RealType random_real(RandomEngine& engine, RealType a, RealType b) {
  std::uniform_real_distribution<RealType> dist(a, b);
  return dist(engine);
}

template<class IntType = int>
IntType random_int(RandomEngine& engine, IntType a, IntType b) {
  std::uniform_int_distribution<IntType> dist(a, b);
  return dist(engine);
}

inline bool random_bool(RandomEngine& engine) {
  std::uniform_int_distribution<int> dist(0, 1);
  return dist(engine) == 1;
}

inline double random_gauss(RandomEngine& engine, double mean, double stddev) {
  std::normal_distribution<double> dist(mean, stddev);
  return dist(engine);
}

// Uniform index in [0, size).
inline size_t random_index(RandomEngine& engine, size_t size) {
  if (size == 0) {
    throw std::out_of_range("random_index on an empty range");
  }
  return random_int<size_t>(engine, 0, size - 1);
}

template<class T>
const T& random_choice(RandomEngine& engine, const std::vector<T>& items) {
  return items[random_index(engine, items.size())];
}

} // namespace util
} // namespace orion

#endif // ORION_UTIL_RANDOM_HPP
