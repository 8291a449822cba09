#include "core/xml/ExportOptions.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/record/Errors.hpp"

using namespace premis;

TEST(ExportOptions, defaults) {
  const ExportOptions opts;
  EXPECT_EQ(opts.premisPrefix, "premis");
  EXPECT_EQ(opts.xsiPrefix, "xsi");
  EXPECT_EQ(opts.save.encoding, "UTF-8");
  EXPECT_TRUE(opts.save.xmlDeclaration);
  EXPECT_TRUE(opts.save.pretty);
}

TEST(ExportOptions, missing_keys_keep_defaults) {
  const auto opts = parseExportOptions(R"({"pretty": false, "unknown": 1})");
  EXPECT_FALSE(opts.save.pretty);
  EXPECT_EQ(opts.premisPrefix, "premis");
}

TEST(ExportOptions, reads_every_key) {
  const auto opts = parseExportOptions(R"({
    "premis_prefix": "p", "xsi_prefix": "x",
    "encoding": "ISO-8859-1", "xml_declaration": false, "pretty": false
  })");
  EXPECT_EQ(opts.premisPrefix, "p");
  EXPECT_EQ(opts.xsiPrefix, "x");
  EXPECT_EQ(opts.save.encoding, "ISO-8859-1");
  EXPECT_FALSE(opts.save.xmlDeclaration);
  EXPECT_FALSE(opts.save.pretty);
}

TEST(ExportOptions, wrong_type_is_a_configuration_error) {
  EXPECT_THROW(parseExportOptions(R"({"pretty": "yes"})"), ConfigurationError);
}

TEST(ExportOptions, malformed_json_is_a_configuration_error) {
  EXPECT_THROW(parseExportOptions("{"), ConfigurationError);
  EXPECT_THROW(parseExportOptions("[1, 2]"), ConfigurationError);
}

TEST(ExportOptions, clashing_prefixes_are_rejected) {
  EXPECT_THROW(parseExportOptions(R"({"premis_prefix": "a", "xsi_prefix": "a"})"), ConfigurationError);
  EXPECT_THROW(parseExportOptions(R"({"xsi_prefix": ""})"), ConfigurationError);
}

TEST(ExportOptions, loads_from_file) {
  const auto path = std::filesystem::temp_directory_path() / "premiskit-export.json";
  {
    std::ofstream out(path);
    out << R"({"premis_prefix": "pr"})";
  }
  EXPECT_EQ(loadExportOptions(path.string()).premisPrefix, "pr");
  std::filesystem::remove(path);
  EXPECT_THROW(loadExportOptions(path.string()), ConfigurationError);
}
