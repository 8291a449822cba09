#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/record/Errors.hpp"
#include "core/record/Identifier.hpp"

namespace premis {

// Holds the nodes of one kind in insertion order and indexes each node under
// every identifier identifiersOf(node) yields. Insertion is all-or-nothing:
// a colliding identifier leaves the registry untouched.
//
// Not thread-safe. Lookups return pointers into the node vector, so they are
// invalidated by the next insert().
template <typename Node>
class NodeRegistry {
public:
  void insert(Node node) {
    const IdentifierList keys(identifiersOf(node));
    if (keys.empty()) {
      throw std::invalid_argument("node has no identifiers");
    }

    // Check everything before touching state.
    std::unordered_set<Identifier, IdentifierHash> seen;
    for (const auto& key : keys) {
      if (index_.count(key) != 0 || !seen.insert(key).second) {
        spdlog::warn("rejecting node, identifier {} already registered", key.toString());
        throw DuplicateIdentifierError(key);
      }
    }

    const std::size_t pos = nodes_.size();
    nodes_.push_back(std::move(node));
    try {
      for (const auto& key : keys) index_.emplace(key, pos);
    } catch (...) {
      // Allocation failed part way; undo so the insert stays all-or-nothing.
      for (const auto& key : keys) {
        auto it = index_.find(key);
        if (it != index_.end() && it->second == pos) index_.erase(it);
      }
      nodes_.pop_back();
      throw;
    }
    spdlog::debug("registered node #{} under {} identifier(s)", pos, keys.size());
  }

  // nullptr when the identifier is unknown.
  const Node* find(const Identifier& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &nodes_[it->second];
  }

  // All-or-nothing: std::nullopt if any identifier is unknown.
  std::optional<std::vector<const Node*>> find(const IdentifierList& ids) const {
    std::vector<const Node*> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
      const Node* n = find(id);
      if (!n) return std::nullopt;
      out.push_back(n);
    }
    return out;
  }

  const Node& at(const Identifier& id) const {
    if (const Node* n = find(id)) return *n;
    throw NodeNotFoundError(id);
  }

  bool contains(const Identifier& id) const { return index_.count(id) != 0; }

  const std::vector<Node>& all() const { return nodes_; }
  std::size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }

private:
  std::vector<Node> nodes_;
  std::unordered_map<Identifier, std::size_t, IdentifierHash> index_;
};

} // namespace premis
