#pragma once
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "core/nodes/Linking.hpp"
#include "core/record/Identifier.hpp"

namespace premis {

struct EventOutcome {
  std::string outcome;
  std::optional<std::string> detailNote;
};

inline bool operator==(const EventOutcome& a, const EventOutcome& b) {
  return std::tie(a.outcome, a.detailNote) == std::tie(b.outcome, b.detailNote);
}

struct Event {
  Identifier identifier;
  std::string type;
  std::string dateTime;
  std::optional<std::string> detail;
  std::vector<EventOutcome> outcomes;
  std::vector<LinkingAgent> linkingAgents;
  std::vector<LinkingObject> linkingObjects;
};

inline bool operator==(const Event& a, const Event& b) {
  return std::tie(a.identifier, a.type, a.dateTime, a.detail, a.outcomes,
                  a.linkingAgents, a.linkingObjects) ==
         std::tie(b.identifier, b.type, b.dateTime, b.detail, b.outcomes,
                  b.linkingAgents, b.linkingObjects);
}
inline bool operator!=(const Event& a, const Event& b) { return !(a == b); }

inline IdentifierList identifiersOf(const Event& e) { return {e.identifier}; }

} // namespace premis
