#pragma once
#include <string>

#include "core/xml/XmlDocument.hpp"

namespace premis {

// Passed to every export call; nothing about prefixes is global.
struct ExportOptions {
  std::string premisPrefix = "premis";
  std::string xsiPrefix = "xsi";
  SaveOptions save;
};

// Reads a JSON object such as
//   {"premis_prefix": "premis", "xsi_prefix": "xsi",
//    "encoding": "UTF-8", "xml_declaration": true, "pretty": true}
// Missing keys keep their defaults. Throws ConfigurationError.
ExportOptions loadExportOptions(const std::string& jsonPath);
ExportOptions parseExportOptions(const std::string& jsonText);

} // namespace premis
