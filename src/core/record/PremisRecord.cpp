#include "PremisRecord.hpp"

#include <spdlog/spdlog.h>

#include "core/record/Errors.hpp"
#include "core/xml/NodeSource.hpp"
#include "core/xml/XmlNodeSource.hpp"
#include "core/xml/XmlRecordWriter.hpp"

namespace premis {

PremisRecord::PremisRecord(RecordInit init) {
  const bool haveNodes = !init.objects.empty() || !init.events.empty() ||
                         !init.agents.empty() || !init.rights.empty();
  const bool havePath = init.fromPath.has_value() && !init.fromPath->empty();
  if (haveNodes == havePath) {
    throw ConfigurationError("Must supply either a valid file or at least one list of PREMIS nodes");
  }

  if (havePath) {
    filepath_ = std::move(init.fromPath);
    populateFromFile();
    return;
  }
  for (auto& n : init.objects) addObject(std::move(n));
  for (auto& n : init.events) addEvent(std::move(n));
  for (auto& n : init.agents) addAgent(std::move(n));
  for (auto& n : init.rights) addRights(std::move(n));
}

PremisRecord PremisRecord::fromFile(const std::string& path) {
  RecordInit init;
  init.fromPath = path;
  return PremisRecord(std::move(init));
}

void PremisRecord::addObject(Object obj) { objects_.insert(std::move(obj)); }
void PremisRecord::addEvent(Event event) { events_.insert(std::move(event)); }
void PremisRecord::addAgent(Agent agent) { agents_.insert(std::move(agent)); }
void PremisRecord::addRights(Rights rights) { rights_.insert(std::move(rights)); }

std::vector<Record> PremisRecord::records() const {
  std::vector<Record> out;
  out.reserve(size());
  forEachRecord([&](const auto& n) { out.emplace_back(n); });
  return out;
}

std::size_t PremisRecord::size() const {
  return objects_.size() + events_.size() + agents_.size() + rights_.size();
}

// ---------- import ----------

void PremisRecord::populateFromFile(const std::optional<std::string>& path) {
  const std::optional<std::string>& source = path ? path : filepath_;
  if (!source || source->empty()) throw ConfigurationError("No supplied filepath.");
  XmlNodeSource nodes = XmlNodeSource::fromFile(*source);
  populateFromSource(nodes);
  spdlog::info("loaded {}: {} object(s), {} event(s), {} agent(s), {} rights",
               *source, objects_.size(), events_.size(), agents_.size(), rights_.size());
}

void PremisRecord::populateFromSource(NodeSource& source) {
  // Kind order is fixed; a failure leaves earlier kinds populated.
  for (auto& n : source.findEvents()) addEvent(std::move(n));
  for (auto& n : source.findAgents()) addAgent(std::move(n));
  for (auto& n : source.findRights()) addRights(std::move(n));
  for (auto& n : source.findObjects()) addObject(std::move(n));
}

// ---------- validation ----------

static void checkIdentifier(const Identifier& id, const std::string& where, ValidationReport& report) {
  if (id.type.empty()) report.errors.push_back(where + ": identifier type is empty");
  if (id.value.empty()) report.errors.push_back(where + ": identifier value is empty");
}

template <typename Node>
static void checkLinks(const IdentifierList& ids, const NodeRegistry<Node>& target,
                       const std::string& where, const char* what, ValidationReport& report) {
  for (const auto& id : ids) {
    if (!target.contains(id)) {
      report.warnings.push_back(where + ": linked " + what + " " + id.toString() + " is not in this record");
    }
  }
}

template <typename Node>
static void checkRoleLinks(const std::vector<RoleLink>& links, const NodeRegistry<Node>& target,
                           const std::string& where, const char* what, ValidationReport& report) {
  for (const auto& link : links) {
    checkIdentifier(link.identifier, where, report);
    if (!target.contains(link.identifier)) {
      report.warnings.push_back(where + ": linked " + what + " " + link.identifier.toString() +
                                " is not in this record");
    }
  }
}

// Rights are linked by statement identifier, which is what rights_ indexes.
ValidationReport PremisRecord::validate() const {
  ValidationReport report;

  for (const auto& o : objects_.all()) {
    const std::string where = "object " + o.identifiers.front().toString();
    for (const auto& id : o.identifiers) checkIdentifier(id, where, report);
    if (o.category.empty()) report.errors.push_back(where + ": category is empty");
    for (const auto& oc : o.characteristics) {
      for (const auto& f : oc.fixity) {
        if (f.algorithm.empty() || f.digest.empty())
          report.errors.push_back(where + ": fixity needs both algorithm and digest");
      }
      if (oc.size && *oc.size < 0) report.errors.push_back(where + ": negative size");
    }
    checkLinks(o.linkingEventIdentifiers, events_, where, "event", report);
    checkLinks(o.linkingRightsStatementIdentifiers, rights_, where, "rights statement", report);
  }

  for (const auto& e : events_.all()) {
    const std::string where = "event " + e.identifier.toString();
    checkIdentifier(e.identifier, where, report);
    if (e.type.empty()) report.errors.push_back(where + ": eventType is empty");
    if (e.dateTime.empty()) report.errors.push_back(where + ": eventDateTime is empty");
    checkRoleLinks(e.linkingAgents, agents_, where, "agent", report);
    checkRoleLinks(e.linkingObjects, objects_, where, "object", report);
  }

  for (const auto& a : agents_.all()) {
    const std::string where = "agent " + a.identifiers.front().toString();
    for (const auto& id : a.identifiers) checkIdentifier(id, where, report);
    checkLinks(a.linkingEventIdentifiers, events_, where, "event", report);
    checkLinks(a.linkingRightsStatementIdentifiers, rights_, where, "rights statement", report);
  }

  for (const auto& r : rights_.all()) {
    for (const auto& s : r.statements) {
      const std::string where = "rights statement " + s.identifier.toString();
      checkIdentifier(s.identifier, where, report);
      if (s.basis.empty()) report.errors.push_back(where + ": rightsBasis is empty");
      for (const auto& g : s.granted) {
        if (g.act.empty()) report.errors.push_back(where + ": rightsGranted without act");
      }
      checkRoleLinks(s.linkingObjects, objects_, where, "object", report);
      checkRoleLinks(s.linkingAgents, agents_, where, "agent", report);
    }
  }
  return report;
}

// ---------- export ----------

XmlDocument PremisRecord::toXmlDocument(const ExportOptions& opts) const {
  return buildPremisDocument(*this, opts);
}

std::string PremisRecord::toXml(const ExportOptions& opts) const {
  return toXmlDocument(opts).toString(opts.save);
}

void PremisRecord::writeToFile(const std::string& path, const ExportOptions& opts) const {
  toXmlDocument(opts).saveFile(path, opts.save);
  spdlog::info("wrote {} node(s) to {}", size(), path);
}

// ---------- equality ----------

template <typename Node>
static bool allPresentIn(const NodeRegistry<Node>& from, const NodeRegistry<Node>& in) {
  for (const auto& node : from.all()) {
    const Node* candidate = in.find(IdentifierList(identifiersOf(node)).front());
    if (!candidate || *candidate != node) return false;
  }
  return true;
}

template <typename Node>
static bool sameNodes(const NodeRegistry<Node>& a, const NodeRegistry<Node>& b) {
  return allPresentIn(a, b) && allPresentIn(b, a);
}

bool operator==(const PremisRecord& a, const PremisRecord& b) {
  return sameNodes(a.objects(), b.objects()) && sameNodes(a.events(), b.events()) &&
         sameNodes(a.agents(), b.agents()) && sameNodes(a.rights(), b.rights());
}

} // namespace premis
