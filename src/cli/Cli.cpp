#include "Cli.hpp"

#include <cstdlib>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/record/PremisRecord.hpp"
#include "core/xml/ExportOptions.hpp"

using nlohmann::json;

namespace premis::cli {

// ---------- helpers ----------

static std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

// PREMIS_EXPORT_CONFIG points at a JSON file; unset means defaults.
static ExportOptions export_options() {
  const std::string path = get_env_or("PREMIS_EXPORT_CONFIG", "");
  if (path.empty()) return {};
  return loadExportOptions(path);
}

static json identifiers_json(const IdentifierList& ids) {
  json out = json::array();
  for (const auto& id : ids) out.push_back({{"type", id.type}, {"value", id.value}});
  return out;
}

static json summary_json(const PremisRecord& rec) {
  json j = {
    {"path", rec.filepath().value_or("")},
    {"counts", {
      {"objects", rec.listObjects().size()},
      {"events",  rec.listEvents().size()},
      {"agents",  rec.listAgents().size()},
      {"rights",  rec.listRights().size()}
    }}
  };
  json nodes = json::array();
  for (const auto& r : rec.records()) {
    nodes.push_back({
      {"kind", kindName(kindOf(r))},
      {"identifiers", identifiers_json(identifiersOf(r))}
    });
  }
  j["nodes"] = nodes;
  return j;
}

static void print_usage(const char* argv0, std::ostream& out) {
  out << "Usage:\n"
      << "  " << argv0 << " --summary FILE      # JSON summary of a PREMIS document\n"
      << "  " << argv0 << " --validate FILE     # structural checks, exit 0 if clean\n"
      << "  " << argv0 << " --convert IN OUT    # load IN and rewrite it as OUT\n"
      << "\n"
      << "--convert keeps only the modelled PREMIS subset; other elements are\n"
      << "dropped with a warning.\n";
}

// ---------- entry points ----------

spdlog::level::level_enum parseLogLevel(const std::string& name, spdlog::level::level_enum fallback) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") return fallback;
  return level;
}

void configureLogging() {
  const std::string name = get_env_or("PREMIS_LOG_LEVEL", "warn");
  const auto level = parseLogLevel(name);
  spdlog::set_level(level);
  if (level == spdlog::level::warn && name != "warn" && name != "warning") {
    spdlog::warn("unknown PREMIS_LOG_LEVEL '{}', using warn", name);
  }
}

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
  const char* argv0 = argc > 0 ? argv[0] : "premis-tool";
  try {
    const std::string cmd = argc > 1 ? argv[1] : "";

    if (cmd == "--summary" && argc == 3) {
      const auto rec = PremisRecord::fromFile(argv[2]);
      out << summary_json(rec).dump(2) << "\n";
      return 0;
    }

    if (cmd == "--validate" && argc == 3) {
      const auto rec = PremisRecord::fromFile(argv[2]);
      const auto report = rec.validate();
      for (const auto& w : report.warnings) spdlog::warn("{}", w);
      for (const auto& e : report.errors) err << "error: " << e << "\n";
      out << (report.ok() ? "valid" : "invalid") << " ("
          << report.errors.size() << " error(s), "
          << report.warnings.size() << " warning(s))\n";
      return report.ok() ? 0 : 3;
    }

    if (cmd == "--convert" && argc == 4) {
      const auto opts = export_options();
      const auto rec = PremisRecord::fromFile(argv[2]);
      rec.writeToFile(argv[3], opts);
      out << "Wrote " << rec.size() << " node(s) to " << argv[3] << "\n";
      return 0;
    }

    print_usage(argv0, out);
    return 1;
  } catch (const std::exception& e) {
    err << "Fatal: " << e.what() << "\n";
    return 2;
  }
}

} // namespace premis::cli
