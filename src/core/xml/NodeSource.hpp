#pragma once
#include <vector>

#include "core/nodes/Record.hpp"

namespace premis {

// Supplies fully decoded nodes of each kind from some serialization.
// PremisRecord calls these in the order events, agents, rights, objects.
class NodeSource {
public:
  virtual ~NodeSource() = default;

  virtual std::vector<Event> findEvents() = 0;
  virtual std::vector<Agent> findAgents() = 0;
  virtual std::vector<Rights> findRights() = 0;
  virtual std::vector<Object> findObjects() = 0;
};

} // namespace premis
