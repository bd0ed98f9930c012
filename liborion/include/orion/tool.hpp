// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_HPP
#define ORION_TOOL_HPP

#include "tool/Configuration.hpp"
#include "tool/FlatBuffersGenerationCodec.hpp"
#include "tool/GenerationCodec.hpp"
#include "tool/GeneratorTool.hpp"
#include "tool/JsonGrammarLoader.hpp"
#include "tool/JsonUniverseLoader.hpp"
#include "tool/JsonWeightLoader.hpp"
#include "tool/NlohmannJsonGenerationCodec.hpp"

#endif // ORION_TOOL_HPP
