// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_TOOL_GENERATORTOOL_HPP
#define ORION_TOOL_GENERATORTOOL_HPP

#include "../runtime/Derivation.hpp"
#include "../util/log.hpp"
#include "../util/print.hpp"

#include <xxhash.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <fstream>
#include <list>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace orion {
namespace tool {

/*
 * Drives a derivation engine to produce a batch of test statements: one
 * file per statement (out_format, %d is the index), all of them in one batch
 * file (one statement per line), or stdout.
 */
class GeneratorTool {
private:
  const runtime::DerivationEngine& engine_;
  std::string start_;
  std::string out_format_;
  std::ofstream batch_;
  bool use_batch_;
  int unique_attempts_;
  bool count_productions_;
  bool dry_run_;

  int memo_size_;
  std::set<XXH64_hash_t> memo_;
  std::list<std::set<XXH64_hash_t>::iterator> memo_order_;

  std::map<std::string, int> production_counts_;
  int failures_{0};

public:
  GeneratorTool(const runtime::DerivationEngine& engine, const std::string& start, const std::string& out_format,
                const std::string& batch_file = "", int memo_size = 0, int unique_attempts = 2,
                bool count_productions = false, bool dry_run = false)
      : engine_(engine), start_(start), out_format_(out_format), use_batch_(!batch_file.empty()),
        unique_attempts_(std::max(unique_attempts, 1)), count_productions_(count_productions), dry_run_(dry_run),
        memo_size_(memo_size) {
    if (dry_run_) {
      return;
    }
    if (use_batch_) {
      if (util::create_parent_directory(batch_file)) {
        batch_.open(batch_file);
      }
      if (!batch_.is_open()) {
        throw runtime::GrammarError(std::format("Failed to open the batch file for writing: {}", batch_file));
      }
    } else if (!out_format_.empty() && !util::create_parent_directory(out_format_)) {
      throw runtime::GrammarError(std::format("Failed to create the output directory of {}", out_format_));
    }
  }

  GeneratorTool(const GeneratorTool& other) = delete;
  GeneratorTool& operator=(const GeneratorTool& other) = delete;
  GeneratorTool(GeneratorTool&& other) = delete;
  GeneratorTool& operator=(GeneratorTool&& other) = delete;
  ~GeneratorTool() = default;

  // Generates the statement of the given index from `seed`. A statement seen
  // among the last memo_size ones is regenerated from seed + attempt * 2^32.
  runtime::GenerationResult create_test(int index, std::uint64_t seed) {
    runtime::GenerationResult result;
    for (int attempt = 1; attempt <= unique_attempts_; ++attempt) {
      result = engine_.generate(start_, seed + (static_cast<std::uint64_t>(attempt - 1) << 32), count_productions_);

      // The seed comment differs for every attempt; only the statement counts.
      std::string_view statement(result.text);
      size_t body = statement.find("*/ ");
      if (body != std::string_view::npos) {
        statement.remove_prefix(body + 3);
      }
      if (memoize_test(statement.data(), statement.size())) {
        break;
      }
      ORION_LOG_INFO("test case #{}, attempt {}/{}: already generated among the last {} unique test cases", index, attempt, unique_attempts_, memo_.size());
    }

    if (!result.success) {
      ++failures_;
    }
    for (const auto& [name, count] : result.production_counts) {
      production_counts_[name] += count;
    }

    if (!dry_run_) {
      if (use_batch_) {
        batch_ << result.text << "\n";
      } else if (!out_format_.empty()) {
        std::string test_fn = out_format_;
        size_t pos = test_fn.find("%d");
        if (pos != std::string::npos) {
          test_fn.replace(pos, 2, std::to_string(index));
        }
        if (!util::pfile(test_fn, result.text)) {
          throw runtime::GrammarError(std::format("Failed to write test case #{} to {}", index, test_fn));
        }
      } else {
        util::pout(result.text);
      }
    }
    return result;
  }

  // Memoizes the (hash of the) test case, keeping at most memo_size entries
  // and evicting the oldest. Returns false if the test case was already in
  // the memo, true if it got added (or memoization is disabled).
  bool memoize_test(const void* input, size_t length) {
    if (memo_size_ < 1) {
      return true;
    }

    auto test = XXH3_64bits(input, length);
    auto inserted = memo_.insert(test);  // {iterator, success}
    if (!inserted.second) {
      return false;
    }
    memo_order_.push_back(inserted.first);

    if (memo_.size() > static_cast<size_t>(memo_size_)) {
      memo_.erase(memo_order_.front());
      memo_order_.pop_front();
    }
    return true;
  }

  const std::map<std::string, int>& production_counts() const { return production_counts_; }
  int failures() const { return failures_; }
};

} // namespace tool
} // namespace orion

#endif // ORION_TOOL_GENERATORTOOL_HPP
