// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_ERRORS_HPP
#define ORION_RUNTIME_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace orion {
namespace runtime {

// Malformed grammar or weight input. The grammar must not be used afterwards.
class GrammarError : public std::runtime_error {
public:
  explicit GrammarError(const std::string& what) : std::runtime_error(what) { }
};

// A scope operation reached from a state the grammar wiring should never
// produce.
class ScopeError : public std::logic_error {
public:
  explicit ScopeError(const std::string& what) : std::logic_error(what) { }
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_ERRORS_HPP
