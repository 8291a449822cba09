#pragma once
#include <string>

#include <libxml/tree.h>

#include "core/nodes/Record.hpp"

namespace premis {

// Namespaces declared on the document root that node projections attach to.
struct XmlNamespaces {
  xmlNsPtr premis = nullptr;
  xmlNsPtr xsi = nullptr;
};

// Project a node into a child element of parent.
xmlNodePtr toXml(const Object& node, xmlNodePtr parent, const XmlNamespaces& ns);
xmlNodePtr toXml(const Event& node, xmlNodePtr parent, const XmlNamespaces& ns);
xmlNodePtr toXml(const Agent& node, xmlNodePtr parent, const XmlNamespaces& ns);
xmlNodePtr toXml(const Rights& node, xmlNodePtr parent, const XmlNamespaces& ns);
xmlNodePtr toXml(const Record& record, xmlNodePtr parent, const XmlNamespaces& ns);

// Decode an <object>/<event>/<agent>/<rights> element. Throw XmlError on
// missing required elements or malformed numbers.
Object objectFromXml(xmlNodePtr el);
Event eventFromXml(xmlNodePtr el);
Agent agentFromXml(xmlNodePtr el);
Rights rightsFromXml(xmlNodePtr el);

} // namespace premis
