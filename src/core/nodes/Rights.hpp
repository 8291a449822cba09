#pragma once
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "core/nodes/Linking.hpp"
#include "core/record/Identifier.hpp"

namespace premis {

struct RightsGranted {
  std::string act;
  std::vector<std::string> restrictions;
  std::optional<std::string> note;
};

inline bool operator==(const RightsGranted& a, const RightsGranted& b) {
  return std::tie(a.act, a.restrictions, a.note) == std::tie(b.act, b.restrictions, b.note);
}

struct RightsStatement {
  Identifier identifier;
  std::string basis; // copyright, license, statute, other
  std::vector<RightsGranted> granted;
  std::vector<LinkingObject> linkingObjects;
  std::vector<LinkingAgent> linkingAgents;
};

inline bool operator==(const RightsStatement& a, const RightsStatement& b) {
  return std::tie(a.identifier, a.basis, a.granted, a.linkingObjects, a.linkingAgents) ==
         std::tie(b.identifier, b.basis, b.granted, b.linkingObjects, b.linkingAgents);
}

// A rights entry may hold several independently identified statements.
struct Rights {
  std::vector<RightsStatement> statements;
};

inline bool operator==(const Rights& a, const Rights& b) { return a.statements == b.statements; }
inline bool operator!=(const Rights& a, const Rights& b) { return !(a == b); }

inline IdentifierList identifiersOf(const Rights& r) {
  IdentifierList ids;
  ids.reserve(r.statements.size());
  for (const auto& s : r.statements) ids.push_back(s.identifier);
  return ids;
}

} // namespace premis
