// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_LISTENER_HPP
#define ORION_RUNTIME_LISTENER_HPP

#include "DerivationTree.hpp"
#include "Grammar.hpp"

#include <format>
#include <string>
#include <vector>

namespace orion {
namespace runtime {

class Listener {
public:
  Listener() = default;
  Listener(const Listener& other) = delete;
  Listener& operator=(const Listener& other) = delete;
  Listener(Listener&& other) = delete;
  Listener& operator=(Listener&& other) = delete;
  virtual ~Listener() = default;

  virtual void start_derivation(const DerivationTree& tree) {}
  virtual void enter_rule(const DerivationTree& tree, size_t node, const RuleEntry& rule) {}
  virtual void exit_rule(const DerivationTree& tree, size_t node, const RuleEntry& rule) {}
};

// Records, for every expansion, the rule applied and the frontier of the
// tree right after it.
class AnalysisListener : public Listener {
private:
  size_t width_;
  std::vector<std::string> lines_{};

public:
  explicit AnalysisListener(size_t width = 90) : width_(width) { }
  ~AnalysisListener() override = default;

  void start_derivation(const DerivationTree& tree) override {
    lines_.clear();
  }

  void exit_rule(const DerivationTree& tree, size_t node, const RuleEntry& rule) override {
    lines_.push_back(std::format("Rule: {}", rule.production->format()));
    fold(tree.frontier(), "      ");
    lines_.push_back(" ");
  }

  const std::vector<std::string>& lines() const { return lines_; }

  std::string format() const {
    std::string result;
    for (const auto& line : lines_) {
      result += line + "\n";
    }
    return result;
  }

private:
  void fold(const std::string& text, const std::string& pad) {
    std::string line;
    size_t start = 0;
    while (start < text.size()) {
      size_t end = text.find(' ', start);
      if (end == std::string::npos) {
        end = text.size();
      }
      std::string word = text.substr(start, end - start);
      if (!line.empty() && line.size() + 1 + word.size() > width_) {
        lines_.push_back(pad + line);
        line.clear();
      }
      line += (line.empty() ? "" : " ") + word;
      start = end + 1;
    }
    if (!line.empty()) {
      lines_.push_back(pad + line);
    }
  }
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_LISTENER_HPP
