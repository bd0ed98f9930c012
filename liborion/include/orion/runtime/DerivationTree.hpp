// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_RUNTIME_DERIVATIONTREE_HPP
#define ORION_RUNTIME_DERIVATIONTREE_HPP

#include "Action.hpp"
#include "Grammar.hpp"
#include "Scope.hpp"
#include "Symbol.hpp"

#include <string>
#include <vector>

namespace orion {
namespace runtime {

struct DerivationNode {
  const Symbol* symbol;
  std::vector<size_t> children{};
  std::string text{};
  bool has_text{false};
  ScopeSegment* scope{nullptr};  // Owned by the scope catalog of the run.
  GenAction gen{GenAction::None};
  RepAction rep{RepAction::Default};
  const RuleEntry* rule{nullptr};  // The rule that expanded the node, if any.
};

/*
 * Arena of the nodes of one derivation. Nodes refer to their children by
 * index; the root is always node 0.
 */
class DerivationTree {
private:
  std::vector<DerivationNode> nodes_;

public:
  explicit DerivationTree(const Symbol* root) {
    nodes_.push_back({root});
  }

  DerivationTree(const DerivationTree& other) = delete;
  DerivationTree& operator=(const DerivationTree& other) = delete;
  DerivationTree(DerivationTree&& other) = delete;
  DerivationTree& operator=(DerivationTree&& other) = delete;
  ~DerivationTree() = default;

  static constexpr size_t root = 0;

  size_t size() const { return nodes_.size(); }

  DerivationNode& operator[](size_t index) { return nodes_[index]; }
  const DerivationNode& operator[](size_t index) const { return nodes_[index]; }

  // References into the arena are invalidated by this call.
  size_t add_child(size_t parent, const Symbol* symbol) {
    size_t index = nodes_.size();
    nodes_.push_back({symbol});
    nodes_[parent].children.push_back(index);
    return index;
  }

  // Symbol names along the leaves, separated by spaces.
  std::string frontier(size_t index = root) const {
    std::string result;
    append_frontier(index, result);
    return result;
  }

  // Indented listing, one symbol per line, children before their parent.
  std::string format(size_t index = root, const std::string& offset = "") const {
    std::string result;
    for (size_t child : nodes_[index].children) {
      result += format(child, offset + "  ") + "\n";
    }
    result += offset + nodes_[index].symbol->name;
    return result;
  }

private:
  void append_frontier(size_t index, std::string& result) const {
    const DerivationNode& node = nodes_[index];
    if (node.children.empty()) {
      if (!result.empty()) {
        result += ' ';
      }
      result += node.symbol->name;
      return;
    }
    for (size_t child : node.children) {
      append_frontier(child, result);
    }
  }
};

} // namespace runtime
} // namespace orion

#endif // ORION_RUNTIME_DERIVATIONTREE_HPP
