#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/nodes/Record.hpp"
#include "core/record/NodeRegistry.hpp"
#include "core/xml/ExportOptions.hpp"
#include "core/xml/XmlDocument.hpp"

namespace premis {

class NodeSource;

// Exactly one of {some node lists, fromPath} must be set.
struct RecordInit {
  std::vector<Object> objects;
  std::vector<Event> events;
  std::vector<Agent> agents;
  std::vector<Rights> rights;
  std::optional<std::string> fromPath;
};

struct ValidationReport {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  bool ok() const { return errors.empty(); }
};

// Holds the objects, events, agents and rights of one PREMIS document, each
// kind indexed by its identifiers. Nodes are only ever added.
class PremisRecord {
public:
  // Throws ConfigurationError if init names neither or both sources, and
  // DuplicateIdentifierError / XmlError from the initial population.
  explicit PremisRecord(RecordInit init);

  static PremisRecord fromFile(const std::string& path);

  // ---------- nodes ----------
  void addObject(Object obj);
  void addEvent(Event event);
  void addAgent(Agent agent);
  void addRights(Rights rights);

  // nullptr when no node of that kind has the identifier.
  const Object* getObject(const Identifier& id) const { return objects_.find(id); }
  const Event* getEvent(const Identifier& id) const { return events_.find(id); }
  const Agent* getAgent(const Identifier& id) const { return agents_.find(id); }
  const Rights* getRights(const Identifier& id) const { return rights_.find(id); }

  const std::vector<Object>& listObjects() const { return objects_.all(); }
  const std::vector<Event>& listEvents() const { return events_.all(); }
  const std::vector<Agent>& listAgents() const { return agents_.all(); }
  const std::vector<Rights>& listRights() const { return rights_.all(); }

  const NodeRegistry<Object>& objects() const { return objects_; }
  const NodeRegistry<Event>& events() const { return events_; }
  const NodeRegistry<Agent>& agents() const { return agents_; }
  const NodeRegistry<Rights>& rights() const { return rights_; }

  // Calls f(node) for objects, events, rights, then agents.
  template <typename F>
  void forEachRecord(F&& f) const {
    for (const auto& n : objects_.all()) f(n);
    for (const auto& n : events_.all()) f(n);
    for (const auto& n : rights_.all()) f(n);
    for (const auto& n : agents_.all()) f(n);
  }

  std::vector<Record> records() const;
  std::size_t size() const;

  // ---------- source document ----------
  const std::optional<std::string>& filepath() const { return filepath_; }
  void setFilepath(std::string path) { filepath_ = std::move(path); }

  // Import from path, or from filepath() if none is given. A duplicate part
  // way through leaves the nodes added so far in place.
  void populateFromFile(const std::optional<std::string>& path = std::nullopt);
  void populateFromSource(NodeSource& source);

  // Structural checks only, no XSD validation.
  ValidationReport validate() const;

  // ---------- export ----------
  XmlDocument toXmlDocument(const ExportOptions& opts = {}) const;
  std::string toXml(const ExportOptions& opts = {}) const;
  void writeToFile(const std::string& path, const ExportOptions& opts = {}) const;

private:
  NodeRegistry<Object> objects_;
  NodeRegistry<Event> events_;
  NodeRegistry<Agent> agents_;
  NodeRegistry<Rights> rights_;
  std::optional<std::string> filepath_;
};

// Set equivalence: every node of one is value-equal to some node of the
// other and vice versa. Expected O(n): candidates are found through the
// identifier index, and a registry holds at most one node per identifier.
bool operator==(const PremisRecord& a, const PremisRecord& b);
inline bool operator!=(const PremisRecord& a, const PremisRecord& b) { return !(a == b); }

} // namespace premis
