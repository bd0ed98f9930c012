// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_FLATBUFFERSGENERATIONCODEC_HPP
#define ORION_TOOL_FLATBUFFERSGENERATIONCODEC_HPP

#include "../util/print.hpp"
#include "GenerationCodec.hpp"

#include "orion/tool/fbs/FBGeneration_generated.h"

#include <cstdint>
#include <vector>

namespace orion {
namespace tool {

class FlatBuffersGenerationCodec : public GenerationCodec {
public:
  FlatBuffersGenerationCodec() = default;
  FlatBuffersGenerationCodec(const FlatBuffersGenerationCodec& other) = delete;
  FlatBuffersGenerationCodec& operator=(const FlatBuffersGenerationCodec& other) = delete;
  FlatBuffersGenerationCodec(FlatBuffersGenerationCodec&& other) = delete;
  FlatBuffersGenerationCodec& operator=(FlatBuffersGenerationCodec&& other) = delete;
  ~FlatBuffersGenerationCodec() override = default;

  using GenerationCodec::decode;

  std::vector<uint8_t> encode(const runtime::Generation& generation) const override {
    flatbuffers::FlatBufferBuilder builder;
    std::vector<flatbuffers::Offset<fbs::FBCandidate>> candidates;
    candidates.reserve(generation.candidates.size());
    for (const runtime::Candidate& candidate : generation.candidates) {
      std::vector<int64_t> weights(candidate.weights.begin(), candidate.weights.end());
      candidates.push_back(fbs::CreateFBCandidateDirect(builder, candidate.id, &weights, candidate.score, candidate.special));
    }
    builder.Finish(fbs::CreateFBGenerationDirect(builder, generation.round, &candidates));

    const uint8_t* buf = builder.GetBufferPointer();
    size_t size = builder.GetSize();
    return std::vector<uint8_t>(buf, buf + size);
  }

  runtime::Generation* decode(const uint8_t* buffer, size_t size) const override {
    if (size < FLATBUFFERS_MIN_BUFFER_SIZE)
      return nullptr;
    flatbuffers::Verifier verifier(buffer, size);
    if (!fbs::VerifyFBGenerationBuffer(verifier)) {
      util::perrf("Flatbuffer verification failed (maxsize: {}).", size);
      return nullptr;
    }

    const fbs::FBGeneration* fb_generation = fbs::GetFBGeneration(buffer);
    auto* generation = new runtime::Generation();
    generation->round = fb_generation->round();
    if (fb_generation->candidates()) {
      for (const fbs::FBCandidate* fb_candidate : *fb_generation->candidates()) {
        runtime::Candidate candidate{fb_candidate->id(), {}, fb_candidate->score(), fb_candidate->special()};
        if (fb_candidate->weights()) {
          candidate.weights.assign(fb_candidate->weights()->begin(), fb_candidate->weights()->end());
        }
        generation->candidates.push_back(std::move(candidate));
      }
    }
    return generation;
  }
};

} // namespace tool
} // namespace orion

#endif  // ORION_TOOL_FLATBUFFERSGENERATIONCODEC_HPP
