#include "ExportOptions.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "core/record/Errors.hpp"

using nlohmann::json;

namespace premis {

template <typename T>
static void readKey(const json& j, const char* key, T& out) {
  if (!j.contains(key)) return;
  try {
    out = j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigurationError(std::string("export config key '") + key + "': " + e.what());
  }
}

ExportOptions parseExportOptions(const std::string& jsonText) {
  json j;
  try {
    j = json::parse(jsonText);
  } catch (const json::parse_error& e) {
    throw ConfigurationError(std::string("invalid export config: ") + e.what());
  }
  if (!j.is_object()) throw ConfigurationError("export config must be a JSON object");

  ExportOptions opts;
  readKey(j, "premis_prefix", opts.premisPrefix);
  readKey(j, "xsi_prefix", opts.xsiPrefix);
  readKey(j, "encoding", opts.save.encoding);
  readKey(j, "xml_declaration", opts.save.xmlDeclaration);
  readKey(j, "pretty", opts.save.pretty);
  if (opts.xsiPrefix.empty()) throw ConfigurationError("xsi_prefix must not be empty");
  if (!opts.premisPrefix.empty() && opts.premisPrefix == opts.xsiPrefix) {
    throw ConfigurationError("premis_prefix and xsi_prefix must differ");
  }
  return opts;
}

ExportOptions loadExportOptions(const std::string& jsonPath) {
  std::ifstream in(jsonPath);
  if (!in) throw ConfigurationError("Cannot open export config: " + jsonPath);
  std::ostringstream buf; buf << in.rdbuf();
  return parseExportOptions(buf.str());
}

} // namespace premis
