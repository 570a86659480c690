#include <gtest/gtest.h>

#include <string>

#include "core/errors.hpp"
#include "tool/spec_parser.hpp"

using namespace cmdbridge;
using namespace cmdbridge::tool;

// ============================================================
// ParsePositionalTest
// ============================================================

TEST(ParsePositionalTest, NameAndDescription) {
  auto param = parse_positional("input Input file");

  EXPECT_EQ(param.name, "input");
  EXPECT_EQ(param.description, "Input file");
  EXPECT_EQ(param.kind, ParameterKind::Positional);
  EXPECT_TRUE(param.cli_token.empty());
  EXPECT_TRUE(param.required);
  EXPECT_EQ(param.value_type, "string");
}

TEST(ParsePositionalTest, SplitsOnFirstWhitespaceRun) {
  auto param = parse_positional("  file \t  Path to   the book  ");

  EXPECT_EQ(param.name, "file");
  // 描述内部的空白保持原样，只去掉首尾空白
  EXPECT_EQ(param.description, "Path to   the book");
}

TEST(ParsePositionalTest, MissingDescriptionFails) {
  EXPECT_THROW(parse_positional("input"), SpecParseError);
  EXPECT_THROW(parse_positional("input   "), SpecParseError);
}

TEST(ParsePositionalTest, EmptySpecFails) {
  EXPECT_THROW(parse_positional(""), SpecParseError);
  EXPECT_THROW(parse_positional("   "), SpecParseError);
}

// ============================================================
// ParseFlagTest
// ============================================================

TEST(ParseFlagTest, ValueFlag) {
  auto param = parse_flag("-resize= Resize dimensions");

  EXPECT_EQ(param.name, "resize");
  EXPECT_EQ(param.cli_token, "-resize");
  EXPECT_EQ(param.description, "Resize dimensions");
  EXPECT_EQ(param.kind, ParameterKind::ValueFlag);
  EXPECT_FALSE(param.required);
  EXPECT_EQ(param.value_type, "string");
}

TEST(ParseFlagTest, BooleanFlag) {
  auto param = parse_flag("-verbose Verbose output");

  EXPECT_EQ(param.name, "verbose");
  EXPECT_EQ(param.cli_token, "-verbose");
  EXPECT_EQ(param.kind, ParameterKind::BooleanFlag);
  EXPECT_FALSE(param.required);
  EXPECT_EQ(param.value_type, "boolean");
}

TEST(ParseFlagTest, DoubleDashTokenKeepsSpelling) {
  auto param = parse_flag("--output-dir= Where to write");

  EXPECT_EQ(param.name, "output-dir");
  EXPECT_EQ(param.cli_token, "--output-dir");
}

TEST(ParseFlagTest, RequiredFlag) {
  auto param = parse_flag("-o= Output path", true);

  EXPECT_TRUE(param.required);
  EXPECT_EQ(param.kind, ParameterKind::ValueFlag);
}

TEST(ParseFlagTest, MissingDescriptionFails) {
  EXPECT_THROW(parse_flag("-verbose"), SpecParseError);
  EXPECT_THROW(parse_flag("-resize="), SpecParseError);
}

TEST(ParseFlagTest, EmptyTokenFails) {
  EXPECT_THROW(parse_flag("= Something"), SpecParseError);
  EXPECT_THROW(parse_flag("-- Only dashes"), SpecParseError);
  EXPECT_THROW(parse_flag("-= Only dash"), SpecParseError);
}

TEST(ParseFlagTest, EmbeddedEqualsFails) {
  EXPECT_THROW(parse_flag("-f=x Format"), SpecParseError);
  EXPECT_THROW(parse_flag("-f=x= Format"), SpecParseError);
  EXPECT_THROW(parse_flag("-f== Format"), SpecParseError);
}

TEST(ParseFlagTest, ErrorMessageNamesSpec) {
  try {
    parse_flag("-verbose");
    FAIL() << "expected SpecParseError";
  } catch (const SpecParseError &e) {
    EXPECT_EQ(e.spec(), "-verbose");
    EXPECT_NE(std::string(e.what()).find("-verbose"), std::string::npos);
  }
}

// ============================================================
// SpecParserTest
// ============================================================

TEST(SpecParserTest, PreservesDeclarationOrder) {
  SpecParser parser;
  parser.add_positional("input Input file");
  parser.add_flag("-resize= Resize dimensions");
  parser.add_positional("output Output file");
  parser.add_flag("-verbose Verbose output");

  const auto &params = parser.parameters();
  ASSERT_EQ(params.size(), 4);
  EXPECT_EQ(params[0].name, "input");
  EXPECT_EQ(params[1].name, "resize");
  EXPECT_EQ(params[2].name, "output");
  EXPECT_EQ(params[3].name, "verbose");
}

TEST(SpecParserTest, DuplicateNameFails) {
  SpecParser parser;
  parser.add_positional("input Input file");

  EXPECT_THROW(parser.add_positional("input Another input"), SpecParseError);
  // 标志名去掉前缀后与位置参数同名，同样冲突
  EXPECT_THROW(parser.add_flag("-input= Conflicts with positional"), SpecParseError);
  EXPECT_EQ(parser.parameters().size(), 1);
}

TEST(SpecParserTest, NamesAreCaseSensitive) {
  SpecParser parser;
  parser.add_flag("-v Verbose");
  EXPECT_NO_THROW(parser.add_flag("-V Version"));
  EXPECT_EQ(parser.parameters().size(), 2);
}

TEST(SpecParserTest, BuildSchema) {
  SpecParser parser;
  parser.add_positional("file Path to book");

  auto schema = parser.build("reader", "Read a book");

  EXPECT_EQ(schema.name, "reader");
  EXPECT_EQ(schema.description, "Read a book");
  ASSERT_EQ(schema.parameters.size(), 1);
  ASSERT_NE(schema.find("file"), nullptr);
  EXPECT_EQ(schema.find("missing"), nullptr);
}
