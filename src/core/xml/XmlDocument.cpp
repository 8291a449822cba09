#include "XmlDocument.hpp"

#include <cstring>

#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlsave.h>
#include <spdlog/spdlog.h>

#include "core/record/Errors.hpp"

namespace premis {

static std::string lastErrorMessage(const std::string& fallback) {
  const xmlError* err = xmlGetLastError();
  if (!err || !err->message) return fallback;
  std::string msg = err->message;
  while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
  if (err->line > 0) msg += " (line " + std::to_string(err->line) + ")";
  return msg;
}

static constexpr int kParseFlags = XML_PARSE_NONET | XML_PARSE_NOBLANKS;

static int saveFlags(const SaveOptions& opts) {
  int flags = 0;
  if (opts.pretty) flags |= XML_SAVE_FORMAT;
  if (!opts.xmlDeclaration) flags |= XML_SAVE_NO_DECL;
  return flags;
}

XmlDocument::XmlDocument() : doc_(xmlNewDoc(BAD_CAST "1.0")) {
  if (!doc_) throw XmlError("xmlNewDoc failed");
}

XmlDocument::XmlDocument(xmlDocPtr doc) : doc_(doc) {
  if (!doc_) throw XmlError("null document");
}

XmlDocument XmlDocument::parseFile(const std::string& path) {
  xmlResetLastError();
  xmlDocPtr doc = xmlReadFile(path.c_str(), nullptr, kParseFlags);
  if (!doc) {
    throw XmlError("failed to parse " + path + ": " + lastErrorMessage("unknown error"));
  }
  spdlog::debug("parsed XML document {}", path);
  return XmlDocument(doc);
}

XmlDocument XmlDocument::parseString(const std::string& xml) {
  xmlResetLastError();
  xmlDocPtr doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                                "memory.xml", nullptr, kParseFlags);
  if (!doc) throw XmlError("failed to parse XML: " + lastErrorMessage("unknown error"));
  return XmlDocument(doc);
}

void XmlDocument::saveFile(const std::string& path, const SaveOptions& opts) const {
  xmlResetLastError();
  xmlSaveCtxtPtr ctxt = xmlSaveToFilename(path.c_str(), opts.encoding.c_str(), saveFlags(opts));
  if (!ctxt) throw XmlError("cannot open " + path + " for writing");
  const long rc = xmlSaveDoc(ctxt, doc_.get());
  if (xmlSaveClose(ctxt) < 0 || rc < 0) {
    throw XmlError("failed to write " + path + ": " + lastErrorMessage("I/O error"));
  }
}

std::string XmlDocument::toString(const SaveOptions& opts) const {
  std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> buf(xmlBufferCreate(), &xmlBufferFree);
  if (!buf) throw XmlError("xmlBufferCreate failed");
  xmlSaveCtxtPtr ctxt = xmlSaveToBuffer(buf.get(), opts.encoding.c_str(), saveFlags(opts));
  if (!ctxt) throw XmlError("unsupported encoding " + opts.encoding);
  const long rc = xmlSaveDoc(ctxt, doc_.get());
  if (xmlSaveClose(ctxt) < 0 || rc < 0) throw XmlError("failed to serialize document");
  return std::string(reinterpret_cast<const char*>(xmlBufferContent(buf.get())),
                     static_cast<size_t>(xmlBufferLength(buf.get())));
}

// ---------- node helpers ----------

std::string localName(xmlNodePtr node) {
  return node && node->name ? reinterpret_cast<const char*>(node->name) : "";
}

bool isPremisElement(xmlNodePtr node, const char* name) {
  if (!node || node->type != XML_ELEMENT_NODE) return false;
  if (!node->ns || !node->ns->href) return false;
  return std::strcmp(reinterpret_cast<const char*>(node->ns->href), kPremisNamespace) == 0 &&
         std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

std::vector<xmlNodePtr> premisChildren(xmlNodePtr parent, const char* name) {
  std::vector<xmlNodePtr> out;
  for (xmlNodePtr n = parent ? parent->children : nullptr; n; n = n->next) {
    if (isPremisElement(n, name)) out.push_back(n);
  }
  return out;
}

xmlNodePtr firstPremisChild(xmlNodePtr parent, const char* name) {
  for (xmlNodePtr n = parent ? parent->children : nullptr; n; n = n->next) {
    if (isPremisElement(n, name)) return n;
  }
  return nullptr;
}

std::string textOf(xmlNodePtr node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (!content) return {};
  std::string s(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return s;
}

std::string requiredText(xmlNodePtr parent, const char* name) {
  xmlNodePtr n = firstPremisChild(parent, name);
  if (!n) {
    throw XmlError("<" + localName(parent) + "> is missing required <" + name + ">");
  }
  return textOf(n);
}

std::optional<std::string> optionalText(xmlNodePtr parent, const char* name) {
  if (xmlNodePtr n = firstPremisChild(parent, name)) return textOf(n);
  return std::nullopt;
}

std::vector<std::string> allText(xmlNodePtr parent, const char* name) {
  std::vector<std::string> out;
  for (xmlNodePtr n : premisChildren(parent, name)) out.push_back(textOf(n));
  return out;
}

xmlNodePtr addElement(xmlNodePtr parent, xmlNsPtr ns, const char* name) {
  xmlNodePtr n = xmlNewChild(parent, ns, BAD_CAST name, nullptr);
  if (!n) throw XmlError(std::string("failed to create <") + name + ">");
  return n;
}

xmlNodePtr addTextElement(xmlNodePtr parent, xmlNsPtr ns, const char* name, const std::string& text) {
  // xmlNewTextChild escapes the content, unlike xmlNewChild.
  xmlNodePtr n = xmlNewTextChild(parent, ns, BAD_CAST name, BAD_CAST text.c_str());
  if (!n) throw XmlError(std::string("failed to create <") + name + ">");
  return n;
}

} // namespace premis
