#include "XmlRecordWriter.hpp"

#include <spdlog/spdlog.h>

#include "core/record/Errors.hpp"
#include "core/record/PremisRecord.hpp"
#include "core/xml/NodeCodec.hpp"

namespace premis {

static const xmlChar* prefixOrNull(const std::string& prefix) {
  // An empty prefix makes the namespace the default one.
  return prefix.empty() ? nullptr : BAD_CAST prefix.c_str();
}

XmlDocument buildPremisDocument(const PremisRecord& record, const ExportOptions& opts) {
  XmlDocument doc;
  xmlNodePtr root = xmlNewDocNode(doc.get(), nullptr, BAD_CAST "premis", nullptr);
  if (!root) throw XmlError("failed to create root element");
  doc.setRoot(root);

  XmlNamespaces ns;
  ns.premis = xmlNewNs(root, BAD_CAST kPremisNamespace, prefixOrNull(opts.premisPrefix));
  ns.xsi = xmlNewNs(root, BAD_CAST kXsiNamespace, prefixOrNull(opts.xsiPrefix));
  if (!ns.premis || !ns.xsi) throw XmlError("failed to declare namespaces");
  xmlSetNs(root, ns.premis);
  xmlNewProp(root, BAD_CAST "version", BAD_CAST kPremisVersion);

  std::size_t count = 0;
  record.forEachRecord([&](const auto& node) {
    toXml(node, root, ns);
    ++count;
  });
  spdlog::debug("built PREMIS document with {} node(s)", count);
  return doc;
}

} // namespace premis
