#include "cli/Cli.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/record/PremisRecord.hpp"

using namespace premis;

namespace {

std::string dataPath(const char* name) {
  return std::string(PREMIS_TEST_DATA_DIR) + "/" + name;
}

struct ToolResult {
  int code = -1;
  std::string out;
  std::string err;
};

ToolResult runTool(std::vector<std::string> args) {
  args.insert(args.begin(), "premis-tool");
  std::vector<const char*> argv;
  for (const auto& a : args) argv.push_back(a.c_str());
  std::ostringstream out, err;
  ToolResult r;
  r.code = cli::run(static_cast<int>(argv.size()), argv.data(), out, err);
  r.out = out.str();
  r.err = err.str();
  return r;
}

} // namespace

// -- Usage --------------------------------------------------------------------

TEST(PremisTool, no_arguments_prints_usage) {
  const auto r = runTool({});
  EXPECT_EQ(r.code, 1);
  EXPECT_NE(r.out.find("Usage:"), std::string::npos);
  EXPECT_NE(r.out.find("modelled PREMIS subset"), std::string::npos);
}

TEST(PremisTool, wrong_argument_count_is_a_usage_error) {
  EXPECT_EQ(runTool({"--summary"}).code, 1);
  EXPECT_EQ(runTool({"--convert", dataPath("sample-premis.xml")}).code, 1);
  EXPECT_EQ(runTool({"--bogus", "x"}).code, 1);
}

// -- Commands -----------------------------------------------------------------

TEST(PremisTool, summary_prints_counts_as_json) {
  const auto r = runTool({"--summary", dataPath("sample-premis.xml")});
  ASSERT_EQ(r.code, 0) << r.err;

  auto j = nlohmann::json::parse(r.out);
  EXPECT_EQ(j["path"], dataPath("sample-premis.xml"));
  EXPECT_EQ(j["counts"]["objects"], 2);
  EXPECT_EQ(j["counts"]["events"], 3);
  EXPECT_EQ(j["counts"]["agents"], 2);
  EXPECT_EQ(j["counts"]["rights"], 1);
  ASSERT_EQ(j["nodes"].size(), 8u);
  EXPECT_EQ(j["nodes"][0]["kind"], "object");
  EXPECT_EQ(j["nodes"][0]["identifiers"][1]["type"], "ark");
}

TEST(PremisTool, validate_clean_document_exits_zero) {
  const auto r = runTool({"--validate", dataPath("sample-premis.xml")});
  EXPECT_EQ(r.code, 0);
  EXPECT_NE(r.out.find("valid (0 error(s)"), std::string::npos);
  EXPECT_TRUE(r.err.empty());
}

TEST(PremisTool, validate_reports_errors_with_exit_three) {
  const auto r = runTool({"--validate", dataPath("invalid-premis.xml")});
  EXPECT_EQ(r.code, 3);
  EXPECT_NE(r.out.find("invalid (1 error(s)"), std::string::npos);
  EXPECT_NE(r.err.find("eventType"), std::string::npos);
}

TEST(PremisTool, convert_writes_an_equivalent_document) {
  const auto target = std::filesystem::temp_directory_path() / "premiskit-cli-convert.xml";
  std::filesystem::remove(target);

  const auto r = runTool({"--convert", dataPath("sample-premis.xml"), target.string()});
  ASSERT_EQ(r.code, 0) << r.err;
  ASSERT_TRUE(std::filesystem::exists(target));
  EXPECT_NE(r.out.find("Wrote 8 node(s)"), std::string::npos);

  EXPECT_EQ(PremisRecord::fromFile(dataPath("sample-premis.xml")),
            PremisRecord::fromFile(target.string()));
  std::filesystem::remove(target);
}

// -- Failures -----------------------------------------------------------------

TEST(PremisTool, missing_input_is_fatal) {
  const auto r = runTool({"--summary", dataPath("does-not-exist.xml")});
  EXPECT_EQ(r.code, 2);
  EXPECT_EQ(r.err.rfind("Fatal: ", 0), 0u);
}

TEST(PremisTool, duplicate_identifier_is_fatal) {
  const auto r = runTool({"--validate", dataPath("duplicate-object.xml")});
  EXPECT_EQ(r.code, 2);
  EXPECT_NE(r.err.find("duplicate identifier: local:O1"), std::string::npos);
}

// -- Log level ----------------------------------------------------------------

TEST(PremisToolLogLevel, known_names_map_to_levels) {
  EXPECT_EQ(cli::parseLogLevel("debug"), spdlog::level::debug);
  EXPECT_EQ(cli::parseLogLevel("warning"), spdlog::level::warn);
  EXPECT_EQ(cli::parseLogLevel("warn"), spdlog::level::warn);
  EXPECT_EQ(cli::parseLogLevel("err"), spdlog::level::err);
  EXPECT_EQ(cli::parseLogLevel("off"), spdlog::level::off);
}

TEST(PremisToolLogLevel, typo_falls_back_instead_of_silencing) {
  EXPECT_EQ(cli::parseLogLevel("debgu"), spdlog::level::warn);
  EXPECT_EQ(cli::parseLogLevel(""), spdlog::level::warn);
  EXPECT_EQ(cli::parseLogLevel("INFO", spdlog::level::info), spdlog::level::info);
}
