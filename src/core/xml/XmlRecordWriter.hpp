#pragma once
#include "core/xml/ExportOptions.hpp"
#include "core/xml/XmlDocument.hpp"

namespace premis {

class PremisRecord;

// Builds <premis:premis version="3.0"> with the premis and xsi namespaces
// declared, then appends objects, events, rights and agents in that order.
XmlDocument buildPremisDocument(const PremisRecord& record, const ExportOptions& opts = {});

} // namespace premis
