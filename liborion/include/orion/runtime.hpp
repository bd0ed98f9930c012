// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_HPP
#define ORION_RUNTIME_HPP

#include "runtime/Action.hpp"
#include "runtime/Breeder.hpp"
#include "runtime/Consistency.hpp"
#include "runtime/Derivation.hpp"
#include "runtime/DerivationTree.hpp"
#include "runtime/Errors.hpp"
#include "runtime/Grammar.hpp"
#include "runtime/Listener.hpp"
#include "runtime/Population.hpp"
#include "runtime/Production.hpp"
#include "runtime/Scope.hpp"
#include "runtime/ScopeCatalog.hpp"
#include "runtime/Symbol.hpp"

#endif // ORION_RUNTIME_HPP
