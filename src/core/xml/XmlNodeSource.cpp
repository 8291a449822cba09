#include "XmlNodeSource.hpp"

#include <spdlog/spdlog.h>

#include "core/record/Errors.hpp"
#include "core/xml/NodeCodec.hpp"

namespace premis {

XmlNodeSource::XmlNodeSource(XmlDocument doc) : doc_(std::move(doc)) {
  xmlNodePtr root = doc_.root();
  if (!root) throw XmlError("document has no root element");
  if (!isPremisElement(root, "premis")) {
    throw XmlError("not a PREMIS document, root element is <" + localName(root) + ">");
  }
}

XmlNodeSource XmlNodeSource::fromFile(const std::string& path) {
  return XmlNodeSource(XmlDocument::parseFile(path));
}

XmlNodeSource XmlNodeSource::fromString(const std::string& xml) {
  return XmlNodeSource(XmlDocument::parseString(xml));
}

template <typename Node, typename Decode>
std::vector<Node> XmlNodeSource::collect(const char* name, Decode decode) const {
  std::vector<Node> nodes;
  for (xmlNodePtr el : premisChildren(doc_.root(), name)) nodes.push_back(decode(el));
  spdlog::debug("found {} <{}> element(s)", nodes.size(), name);
  return nodes;
}

std::vector<Event> XmlNodeSource::findEvents() { return collect<Event>("event", eventFromXml); }
std::vector<Agent> XmlNodeSource::findAgents() { return collect<Agent>("agent", agentFromXml); }
std::vector<Rights> XmlNodeSource::findRights() { return collect<Rights>("rights", rightsFromXml); }
std::vector<Object> XmlNodeSource::findObjects() { return collect<Object>("object", objectFromXml); }

} // namespace premis
