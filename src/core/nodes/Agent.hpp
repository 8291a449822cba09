#pragma once
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "core/record/Identifier.hpp"

namespace premis {

struct Agent {
  IdentifierList identifiers;
  std::vector<std::string> names;
  std::optional<std::string> type;
  std::vector<std::string> notes;
  IdentifierList linkingEventIdentifiers;
  IdentifierList linkingRightsStatementIdentifiers;
};

inline bool operator==(const Agent& a, const Agent& b) {
  return std::tie(a.identifiers, a.names, a.type, a.notes,
                  a.linkingEventIdentifiers, a.linkingRightsStatementIdentifiers) ==
         std::tie(b.identifiers, b.names, b.type, b.notes,
                  b.linkingEventIdentifiers, b.linkingRightsStatementIdentifiers);
}
inline bool operator!=(const Agent& a, const Agent& b) { return !(a == b); }

inline const IdentifierList& identifiersOf(const Agent& a) { return a.identifiers; }

} // namespace premis
