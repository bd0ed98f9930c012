// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_NLOHMANNJSONGENERATIONCODEC_HPP
#define ORION_TOOL_NLOHMANNJSONGENERATIONCODEC_HPP

#include "../util/print.hpp"
#include "GenerationCodec.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace orion {
namespace tool {

class NlohmannJsonGenerationCodec : public GenerationCodec {
public:
  NlohmannJsonGenerationCodec() = default;
  NlohmannJsonGenerationCodec(const NlohmannJsonGenerationCodec& other) = delete;
  NlohmannJsonGenerationCodec& operator=(const NlohmannJsonGenerationCodec& other) = delete;
  NlohmannJsonGenerationCodec(NlohmannJsonGenerationCodec&& other) = delete;
  NlohmannJsonGenerationCodec& operator=(NlohmannJsonGenerationCodec&& other) = delete;
  ~NlohmannJsonGenerationCodec() override = default;

  using GenerationCodec::decode;

  std::vector<uint8_t> encode(const runtime::Generation& generation) const override {
    std::string str = toJson(generation).dump(2);
    return std::vector<uint8_t>(str.data(), str.data() + str.size());
  }

  runtime::Generation* decode(const uint8_t* buffer, size_t size) const override {
    std::string src(reinterpret_cast<const char*>(buffer), size);
    auto jsonObj = nlohmann::json::parse(src, nullptr, false);
    if (jsonObj.is_discarded() || !jsonObj.is_object()) {
      return nullptr;
    }
    try {
      return fromJson(jsonObj);
    } catch (const nlohmann::json::exception& e) {
      util::perrf("Invalid generation JSON: {}", e.what());
      return nullptr;
    }
  }

  static nlohmann::json toJson(const runtime::Generation& generation) {
    nlohmann::json j;
    j["round"] = generation.round;
    j["candidates"] = nlohmann::json::array();
    for (const runtime::Candidate& candidate : generation.candidates) {
      j["candidates"].push_back({
        {"id", candidate.id},
        {"weights", candidate.weights},
        {"score", candidate.score},
        {"special", candidate.special},
      });
    }
    return j;
  }

private:
  static runtime::Generation* fromJson(const nlohmann::json& j) {
    runtime::Generation generation;
    generation.round = j.value("round", 0);
    for (const auto& c : j.value("candidates", nlohmann::json::array())) {
      generation.candidates.push_back({
        c.at("id").get<int>(),
        c.at("weights").get<std::vector<runtime::Weight>>(),
        c.value("score", 0.0),
        c.value("special", false),
      });
    }
    return new runtime::Generation(std::move(generation));
  }
};

} // namespace tool
} // namespace orion

#endif  // ORION_TOOL_NLOHMANNJSONGENERATIONCODEC_HPP
