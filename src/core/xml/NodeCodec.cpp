#include "NodeCodec.hpp"

#include <cstring>
#include <initializer_list>
#include <stdexcept>
#include <variant>

#include <spdlog/spdlog.h>

#include "core/record/Errors.hpp"
#include "core/xml/XmlDocument.hpp"

namespace premis {

// ---------- decoding ----------

// <fooIdentifier><fooIdentifierType/><fooIdentifierValue/></fooIdentifier>
static Identifier identifierFromXml(xmlNodePtr el, const std::string& prefix) {
  return Identifier(requiredText(el, (prefix + "Type").c_str()),
                    requiredText(el, (prefix + "Value").c_str()));
}

static IdentifierList identifiersFromXml(xmlNodePtr parent, const char* name) {
  IdentifierList ids;
  for (xmlNodePtr n : premisChildren(parent, name)) ids.push_back(identifierFromXml(n, name));
  return ids;
}

static std::vector<RoleLink> roleLinksFromXml(xmlNodePtr parent, const char* name, const char* roleName) {
  std::vector<RoleLink> links;
  for (xmlNodePtr n : premisChildren(parent, name)) {
    links.push_back(RoleLink{identifierFromXml(n, name), allText(n, roleName)});
  }
  return links;
}

// Children outside the modelled subset are dropped; say so.
static void warnUnmodelled(xmlNodePtr el, std::initializer_list<const char*> known) {
  for (xmlNodePtr n = el->children; n; n = n->next) {
    if (n->type != XML_ELEMENT_NODE) continue;
    bool modelled = false;
    for (const char* name : known) {
      if (isPremisElement(n, name)) { modelled = true; break; }
    }
    if (!modelled) {
      spdlog::warn("dropping unsupported <{}> inside <{}> (line {})",
                   localName(n), localName(el), xmlGetLineNo(n));
    }
  }
}

template <typename T, typename Parse>
static T parseNumber(const std::string& text, const char* what, Parse parse) {
  try {
    size_t used = 0;
    T v = parse(text, &used);
    if (used != text.size()) throw std::invalid_argument(text);
    return v;
  } catch (const std::logic_error&) {
    throw XmlError(std::string("invalid <") + what + "> value '" + text + "'");
  }
}

// xsi:type="premis:file" -> "file". The prefix is only stripped when it is
// bound to the PREMIS namespace at this element.
static std::string objectCategory(xmlNodePtr el) {
  xmlChar* raw = xmlGetNsProp(el, BAD_CAST "type", BAD_CAST kXsiNamespace);
  if (!raw) {
    if (auto legacy = optionalText(el, "objectCategory")) return *legacy;
    throw XmlError("<object> has neither xsi:type nor <objectCategory>");
  }
  std::string type(reinterpret_cast<const char*>(raw));
  xmlFree(raw);
  const auto colon = type.find(':');
  if (colon == std::string::npos) return type;

  const std::string prefix = type.substr(0, colon);
  xmlNsPtr ns = xmlSearchNs(el->doc, el, BAD_CAST prefix.c_str());
  if (ns && ns->href &&
      std::strcmp(reinterpret_cast<const char*>(ns->href), kPremisNamespace) == 0) {
    return type.substr(colon + 1);
  }
  return type;
}

Object objectFromXml(xmlNodePtr el) {
  warnUnmodelled(el, {"objectIdentifier", "objectCategory", "objectCharacteristics",
                      "originalName", "storage", "linkingEventIdentifier",
                      "linkingRightsStatementIdentifier"});
  Object o;
  o.identifiers = identifiersFromXml(el, "objectIdentifier");
  if (o.identifiers.empty()) throw XmlError("<object> has no <objectIdentifier>");
  o.category = objectCategory(el);

  for (xmlNodePtr c : premisChildren(el, "objectCharacteristics")) {
    ObjectCharacteristics oc;
    if (auto level = optionalText(c, "compositionLevel")) {
      oc.compositionLevel = parseNumber<int>(*level, "compositionLevel",
          [](const std::string& s, size_t* n) { return std::stoi(s, n); });
    }
    for (xmlNodePtr f : premisChildren(c, "fixity")) {
      oc.fixity.push_back(Fixity{requiredText(f, "messageDigestAlgorithm"),
                                 requiredText(f, "messageDigest"),
                                 optionalText(f, "messageDigestOriginator")});
    }
    if (auto size = optionalText(c, "size")) {
      oc.size = parseNumber<std::int64_t>(*size, "size",
          [](const std::string& s, size_t* n) { return static_cast<std::int64_t>(std::stoll(s, n)); });
    }
    for (xmlNodePtr f : premisChildren(c, "format")) {
      xmlNodePtr designation = firstPremisChild(f, "formatDesignation");
      if (!designation) {
        spdlog::warn("dropping <format> without <formatDesignation> (line {})", xmlGetLineNo(f));
        continue;
      }
      oc.formats.push_back(Format{requiredText(designation, "formatName"),
                                  optionalText(designation, "formatVersion")});
    }
    o.characteristics.push_back(std::move(oc));
  }

  o.originalName = optionalText(el, "originalName");

  for (xmlNodePtr s : premisChildren(el, "storage")) {
    Storage st;
    if (xmlNodePtr loc = firstPremisChild(s, "contentLocation")) {
      st.contentLocationType = requiredText(loc, "contentLocationType");
      st.contentLocationValue = requiredText(loc, "contentLocationValue");
    }
    st.storageMedium = optionalText(s, "storageMedium");
    o.storage.push_back(std::move(st));
  }

  o.linkingEventIdentifiers = identifiersFromXml(el, "linkingEventIdentifier");
  o.linkingRightsStatementIdentifiers = identifiersFromXml(el, "linkingRightsStatementIdentifier");
  return o;
}

Event eventFromXml(xmlNodePtr el) {
  warnUnmodelled(el, {"eventIdentifier", "eventType", "eventDateTime",
                      "eventDetailInformation", "eventOutcomeInformation",
                      "linkingAgentIdentifier", "linkingObjectIdentifier"});
  Event e;
  xmlNodePtr id = firstPremisChild(el, "eventIdentifier");
  if (!id) throw XmlError("<event> has no <eventIdentifier>");
  e.identifier = identifierFromXml(id, "eventIdentifier");
  e.type = requiredText(el, "eventType");
  e.dateTime = requiredText(el, "eventDateTime");
  if (xmlNodePtr info = firstPremisChild(el, "eventDetailInformation")) {
    e.detail = optionalText(info, "eventDetail");
  }
  for (xmlNodePtr info : premisChildren(el, "eventOutcomeInformation")) {
    EventOutcome out;
    out.outcome = optionalText(info, "eventOutcome").value_or("");
    if (xmlNodePtr detail = firstPremisChild(info, "eventOutcomeDetail")) {
      out.detailNote = optionalText(detail, "eventOutcomeDetailNote");
    }
    e.outcomes.push_back(std::move(out));
  }
  e.linkingAgents = roleLinksFromXml(el, "linkingAgentIdentifier", "linkingAgentRole");
  e.linkingObjects = roleLinksFromXml(el, "linkingObjectIdentifier", "linkingObjectRole");
  return e;
}

Agent agentFromXml(xmlNodePtr el) {
  warnUnmodelled(el, {"agentIdentifier", "agentName", "agentType", "agentNote",
                      "linkingEventIdentifier", "linkingRightsStatementIdentifier"});
  Agent a;
  a.identifiers = identifiersFromXml(el, "agentIdentifier");
  if (a.identifiers.empty()) throw XmlError("<agent> has no <agentIdentifier>");
  a.names = allText(el, "agentName");
  a.type = optionalText(el, "agentType");
  a.notes = allText(el, "agentNote");
  a.linkingEventIdentifiers = identifiersFromXml(el, "linkingEventIdentifier");
  a.linkingRightsStatementIdentifiers = identifiersFromXml(el, "linkingRightsStatementIdentifier");
  return a;
}

Rights rightsFromXml(xmlNodePtr el) {
  warnUnmodelled(el, {"rightsStatement"});
  Rights r;
  for (xmlNodePtr s : premisChildren(el, "rightsStatement")) {
    warnUnmodelled(s, {"rightsStatementIdentifier", "rightsBasis", "rightsGranted",
                       "linkingObjectIdentifier", "linkingAgentIdentifier"});
    RightsStatement rs;
    xmlNodePtr id = firstPremisChild(s, "rightsStatementIdentifier");
    if (!id) throw XmlError("<rightsStatement> has no <rightsStatementIdentifier>");
    rs.identifier = identifierFromXml(id, "rightsStatementIdentifier");
    rs.basis = requiredText(s, "rightsBasis");
    for (xmlNodePtr g : premisChildren(s, "rightsGranted")) {
      rs.granted.push_back(RightsGranted{requiredText(g, "act"),
                                         allText(g, "restriction"),
                                         optionalText(g, "rightsGrantedNote")});
    }
    rs.linkingObjects = roleLinksFromXml(s, "linkingObjectIdentifier", "linkingObjectRole");
    rs.linkingAgents = roleLinksFromXml(s, "linkingAgentIdentifier", "linkingAgentRole");
    r.statements.push_back(std::move(rs));
  }
  if (r.statements.empty()) throw XmlError("<rights> has no <rightsStatement>");
  return r;
}

// ---------- encoding ----------

static void addIdentifier(xmlNodePtr parent, xmlNsPtr ns, const std::string& name, const Identifier& id) {
  xmlNodePtr n = addElement(parent, ns, name.c_str());
  addTextElement(n, ns, (name + "Type").c_str(), id.type);
  addTextElement(n, ns, (name + "Value").c_str(), id.value);
}

static void addRoleLinks(xmlNodePtr parent, xmlNsPtr ns, const std::string& name,
                         const char* roleName, const std::vector<RoleLink>& links) {
  for (const auto& link : links) {
    xmlNodePtr n = addElement(parent, ns, name.c_str());
    addTextElement(n, ns, (name + "Type").c_str(), link.identifier.type);
    addTextElement(n, ns, (name + "Value").c_str(), link.identifier.value);
    for (const auto& role : link.roles) addTextElement(n, ns, roleName, role);
  }
}

xmlNodePtr toXml(const Object& node, xmlNodePtr parent, const XmlNamespaces& ns) {
  xmlNodePtr el = addElement(parent, ns.premis, "object");
  const std::string prefix = ns.premis && ns.premis->prefix
      ? reinterpret_cast<const char*>(ns.premis->prefix) : "";
  const std::string type = prefix.empty() ? node.category : prefix + ":" + node.category;
  xmlNewNsProp(el, ns.xsi, BAD_CAST "type", BAD_CAST type.c_str());

  for (const auto& id : node.identifiers) addIdentifier(el, ns.premis, "objectIdentifier", id);

  for (const auto& oc : node.characteristics) {
    xmlNodePtr c = addElement(el, ns.premis, "objectCharacteristics");
    addTextElement(c, ns.premis, "compositionLevel", std::to_string(oc.compositionLevel));
    for (const auto& f : oc.fixity) {
      xmlNodePtr fx = addElement(c, ns.premis, "fixity");
      addTextElement(fx, ns.premis, "messageDigestAlgorithm", f.algorithm);
      addTextElement(fx, ns.premis, "messageDigest", f.digest);
      if (f.originator) addTextElement(fx, ns.premis, "messageDigestOriginator", *f.originator);
    }
    if (oc.size) addTextElement(c, ns.premis, "size", std::to_string(*oc.size));
    for (const auto& f : oc.formats) {
      xmlNodePtr d = addElement(addElement(c, ns.premis, "format"), ns.premis, "formatDesignation");
      addTextElement(d, ns.premis, "formatName", f.name);
      if (f.version) addTextElement(d, ns.premis, "formatVersion", *f.version);
    }
  }

  if (node.originalName) addTextElement(el, ns.premis, "originalName", *node.originalName);

  for (const auto& st : node.storage) {
    xmlNodePtr s = addElement(el, ns.premis, "storage");
    xmlNodePtr loc = addElement(s, ns.premis, "contentLocation");
    addTextElement(loc, ns.premis, "contentLocationType", st.contentLocationType);
    addTextElement(loc, ns.premis, "contentLocationValue", st.contentLocationValue);
    if (st.storageMedium) addTextElement(s, ns.premis, "storageMedium", *st.storageMedium);
  }

  for (const auto& id : node.linkingEventIdentifiers)
    addIdentifier(el, ns.premis, "linkingEventIdentifier", id);
  for (const auto& id : node.linkingRightsStatementIdentifiers)
    addIdentifier(el, ns.premis, "linkingRightsStatementIdentifier", id);
  return el;
}

xmlNodePtr toXml(const Event& node, xmlNodePtr parent, const XmlNamespaces& ns) {
  xmlNodePtr el = addElement(parent, ns.premis, "event");
  addIdentifier(el, ns.premis, "eventIdentifier", node.identifier);
  addTextElement(el, ns.premis, "eventType", node.type);
  addTextElement(el, ns.premis, "eventDateTime", node.dateTime);
  if (node.detail) {
    addTextElement(addElement(el, ns.premis, "eventDetailInformation"), ns.premis, "eventDetail", *node.detail);
  }
  for (const auto& out : node.outcomes) {
    xmlNodePtr info = addElement(el, ns.premis, "eventOutcomeInformation");
    addTextElement(info, ns.premis, "eventOutcome", out.outcome);
    if (out.detailNote) {
      addTextElement(addElement(info, ns.premis, "eventOutcomeDetail"), ns.premis,
                     "eventOutcomeDetailNote", *out.detailNote);
    }
  }
  addRoleLinks(el, ns.premis, "linkingAgentIdentifier", "linkingAgentRole", node.linkingAgents);
  addRoleLinks(el, ns.premis, "linkingObjectIdentifier", "linkingObjectRole", node.linkingObjects);
  return el;
}

xmlNodePtr toXml(const Agent& node, xmlNodePtr parent, const XmlNamespaces& ns) {
  xmlNodePtr el = addElement(parent, ns.premis, "agent");
  for (const auto& id : node.identifiers) addIdentifier(el, ns.premis, "agentIdentifier", id);
  for (const auto& name : node.names) addTextElement(el, ns.premis, "agentName", name);
  if (node.type) addTextElement(el, ns.premis, "agentType", *node.type);
  for (const auto& note : node.notes) addTextElement(el, ns.premis, "agentNote", note);
  for (const auto& id : node.linkingEventIdentifiers)
    addIdentifier(el, ns.premis, "linkingEventIdentifier", id);
  for (const auto& id : node.linkingRightsStatementIdentifiers)
    addIdentifier(el, ns.premis, "linkingRightsStatementIdentifier", id);
  return el;
}

xmlNodePtr toXml(const Rights& node, xmlNodePtr parent, const XmlNamespaces& ns) {
  xmlNodePtr el = addElement(parent, ns.premis, "rights");
  for (const auto& rs : node.statements) {
    xmlNodePtr s = addElement(el, ns.premis, "rightsStatement");
    addIdentifier(s, ns.premis, "rightsStatementIdentifier", rs.identifier);
    addTextElement(s, ns.premis, "rightsBasis", rs.basis);
    for (const auto& g : rs.granted) {
      xmlNodePtr gr = addElement(s, ns.premis, "rightsGranted");
      addTextElement(gr, ns.premis, "act", g.act);
      for (const auto& r : g.restrictions) addTextElement(gr, ns.premis, "restriction", r);
      if (g.note) addTextElement(gr, ns.premis, "rightsGrantedNote", *g.note);
    }
    addRoleLinks(s, ns.premis, "linkingObjectIdentifier", "linkingObjectRole", rs.linkingObjects);
    addRoleLinks(s, ns.premis, "linkingAgentIdentifier", "linkingAgentRole", rs.linkingAgents);
  }
  return el;
}

xmlNodePtr toXml(const Record& record, xmlNodePtr parent, const XmlNamespaces& ns) {
  return std::visit([&](const auto& node) { return toXml(node, parent, ns); }, record);
}

} // namespace premis
