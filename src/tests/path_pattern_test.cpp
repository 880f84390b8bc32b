#include <gtest/gtest.h>
#include "router/path_pattern.hpp"

using namespace biowiki::router;

TEST(PathPatternTest, LiteralPatternMatchesExactly) {
  PathPattern pattern("/webs");
  auto params = pattern.match("/webs");
  ASSERT_TRUE(params.has_value());
  EXPECT_TRUE(params->empty());

  EXPECT_FALSE(pattern.match("/webs/").has_value());
  EXPECT_FALSE(pattern.match("/web").has_value());
  EXPECT_FALSE(pattern.match("/webs/alpha").has_value());
  EXPECT_FALSE(pattern.match("").has_value());
}

TEST(PathPatternTest, ExtractsNamedParameters) {
  PathPattern pattern("/webs/:web_name/pages/:page_name");
  auto params = pattern.match("/webs/alpha/pages/beta");
  ASSERT_TRUE(params.has_value());
  ASSERT_EQ(params->size(), 2u);
  EXPECT_EQ(params->at("web_name"), "alpha");
  EXPECT_EQ(params->at("page_name"), "beta");
}

TEST(PathPatternTest, DifferentSegmentCountDoesNotMatch) {
  PathPattern pattern("/webs/:web_name/pages/:page_name");
  EXPECT_FALSE(pattern.match("/webs/alpha").has_value());
  EXPECT_FALSE(pattern.match("/webs/alpha/pages").has_value());
  EXPECT_FALSE(pattern.match("/webs/alpha/pages/beta/attachments").has_value());
}

TEST(PathPatternTest, LiteralSegmentMustMatch) {
  PathPattern pattern("/webs/:web_name/pages");
  EXPECT_FALSE(pattern.match("/webs/alpha/files").has_value());
  EXPECT_FALSE(pattern.match("/wiki/alpha/pages").has_value());
}

TEST(PathPatternTest, ParametersMustBeNonEmpty) {
  PathPattern pattern("/webs/:web_name/pages");
  EXPECT_FALSE(pattern.match("/webs//pages").has_value());
}

TEST(PathPatternTest, ParameterDoesNotSpanSegments) {
  PathPattern pattern("/webs/:web_name");
  EXPECT_FALSE(pattern.match("/webs/a/b").has_value());
}

TEST(PathPatternTest, NamesKeepDeclarationOrder) {
  PathPattern pattern("/webs/:web_name/pages/:page_name/versions/:version_hash");
  std::vector<std::string> expected = {"web_name", "page_name", "version_hash"};
  EXPECT_EQ(pattern.names(), expected);
}

TEST(PathPatternTest, DuplicateParameterNamesNeverMatch) {
  PathPattern pattern("/webs/:name/pages/:name");
  EXPECT_FALSE(pattern.match("/webs/alpha/pages/beta").has_value());
}

TEST(PathPatternTest, RegexCharactersInLiteralsAreVerbatim) {
  PathPattern pattern("/files/a.b/:id");
  EXPECT_TRUE(pattern.match("/files/a.b/1").has_value());
  EXPECT_FALSE(pattern.match("/files/axb/1").has_value());
}

TEST(PathPatternTest, RootPattern) {
  PathPattern pattern("/");
  EXPECT_TRUE(pattern.match("/").has_value());
  EXPECT_FALSE(pattern.match("/webs").has_value());
}
