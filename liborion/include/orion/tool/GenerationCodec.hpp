// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_GENERATIONCODEC_HPP
#define ORION_TOOL_GENERATIONCODEC_HPP

#include "../runtime/Population.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace orion {
namespace tool {

class GenerationCodec {
public:
  GenerationCodec() = default;
  GenerationCodec(const GenerationCodec& other) = delete;
  GenerationCodec& operator=(const GenerationCodec& other) = delete;
  GenerationCodec(GenerationCodec&& other) = delete;
  GenerationCodec& operator=(GenerationCodec&& other) = delete;
  virtual ~GenerationCodec() = default;

  virtual std::vector<uint8_t> encode(const runtime::Generation& generation) const = 0;

  // Returns a new generation owned by the caller, or nullptr if the buffer
  // does not hold a valid one.
  virtual runtime::Generation* decode(const uint8_t* buffer, size_t size) const = 0;

  virtual runtime::Generation* decode(const std::vector<uint8_t>& buffer) const { return decode(buffer.data(), buffer.size()); }

  bool save(const std::string& fn, const runtime::Generation& generation) const {
    std::ofstream file(fn, std::ios::binary);
    if (!file) {
      return false;
    }
    std::vector<uint8_t> buffer = encode(generation);
    file.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    return static_cast<bool>(file);
  }

  runtime::Generation* load(const std::string& fn) const {
    std::ifstream file(fn, std::ios::binary);
    if (!file) {
      return nullptr;
    }
    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return decode(buffer);
  }
};

} // namespace tool
} // namespace orion

#endif  // ORION_TOOL_GENERATIONCODEC_HPP
