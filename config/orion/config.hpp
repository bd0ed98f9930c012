// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_VERSION
#define ORION_VERSION "0.0 (unknown)"
#endif

// Default encoding of generation snapshots (see the tools' --format option).
#ifndef ORION_GENERATION_FORMAT
#define ORION_GENERATION_FORMAT flatbuffers
#endif

#define ORION_STRFY_INTERNAL(MACRO) #MACRO
#define ORION_STRFY(MACRO) ORION_STRFY_INTERNAL(MACRO)
