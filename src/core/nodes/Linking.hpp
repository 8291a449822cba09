#pragma once
#include <string>
#include <tuple>
#include <vector>

#include "core/record/Identifier.hpp"

namespace premis {

// linkingAgentIdentifier / linkingObjectIdentifier share this shape.
struct RoleLink {
  Identifier identifier;
  std::vector<std::string> roles;
};

inline bool operator==(const RoleLink& a, const RoleLink& b) {
  return std::tie(a.identifier, a.roles) == std::tie(b.identifier, b.roles);
}
inline bool operator!=(const RoleLink& a, const RoleLink& b) { return !(a == b); }

using LinkingAgent = RoleLink;
using LinkingObject = RoleLink;

} // namespace premis
