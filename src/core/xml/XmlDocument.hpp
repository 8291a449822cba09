#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <libxml/tree.h>

namespace premis {

inline constexpr const char* kPremisNamespace = "http://www.loc.gov/premis/v3";
inline constexpr const char* kXsiNamespace = "http://www.w3.org/2001/XMLSchema-instance";
inline constexpr const char* kPremisVersion = "3.0";

struct SaveOptions {
  std::string encoding = "UTF-8";
  bool xmlDeclaration = true;
  bool pretty = true;
};

// Owns a libxml2 document. Nodes handed out by root() live as long as this.
class XmlDocument {
public:
  XmlDocument();
  explicit XmlDocument(xmlDocPtr doc);

  static XmlDocument parseFile(const std::string& path);
  static XmlDocument parseString(const std::string& xml);

  xmlNodePtr root() const { return xmlDocGetRootElement(doc_.get()); }
  void setRoot(xmlNodePtr node) { xmlDocSetRootElement(doc_.get(), node); }
  xmlDocPtr get() const { return doc_.get(); }

  void saveFile(const std::string& path, const SaveOptions& opts = {}) const;
  std::string toString(const SaveOptions& opts = {}) const;

private:
  struct Free {
    void operator()(xmlDocPtr d) const { xmlFreeDoc(d); }
  };
  std::unique_ptr<xmlDoc, Free> doc_;
};

// ---------- node helpers ----------

std::string localName(xmlNodePtr node);

// Element in the PREMIS namespace with the given local name.
bool isPremisElement(xmlNodePtr node, const char* name);

std::vector<xmlNodePtr> premisChildren(xmlNodePtr parent, const char* name);
xmlNodePtr firstPremisChild(xmlNodePtr parent, const char* name);

std::string textOf(xmlNodePtr node);

// Throws XmlError naming the missing element.
std::string requiredText(xmlNodePtr parent, const char* name);
std::optional<std::string> optionalText(xmlNodePtr parent, const char* name);
std::vector<std::string> allText(xmlNodePtr parent, const char* name);

xmlNodePtr addElement(xmlNodePtr parent, xmlNsPtr ns, const char* name);
xmlNodePtr addTextElement(xmlNodePtr parent, xmlNsPtr ns, const char* name, const std::string& text);

} // namespace premis
