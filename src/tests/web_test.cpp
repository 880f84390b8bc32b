#include <gtest/gtest.h>
#include <filesystem>
#include <algorithm>
#include "store/web.hpp"
#include "test_utils.hpp"

using namespace biowiki::store;

class WebTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<WebCollection> webs;

  void SetUp() override {
    quiet_logging();
    test_dir = make_test_dir("web_test");
    webs = std::make_unique<WebCollection>(test_dir);
  }

  void TearDown() override {
    webs.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  template <typename Stub>
  static std::vector<std::string> sorted_names(const std::vector<Stub>& stubs) {
    std::vector<std::string> names;
    for (const auto& stub : stubs) {
      names.push_back(stub.name);
    }
    std::sort(names.begin(), names.end());
    return names;
  }
};

// ---- WEB COLLECTION ----

TEST_F(WebTest, EmptyRootHasNoWebs) {
  EXPECT_TRUE(webs->list().empty());
}

TEST_F(WebTest, CreateThenGet) {
  Web created = webs->create("Home");
  EXPECT_EQ(created.name(), "Home");
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "Home"));

  auto found = webs->get("Home");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->name(), "Home");
  EXPECT_TRUE(std::filesystem::is_directory(found->directory()));
}

TEST_F(WebTest, CreateTwiceIsOverwriteError) {
  webs->create("Home");
  try {
    webs->create("Home");
    FAIL() << "Expected WebError";
  } catch (const WebError& e) {
    EXPECT_EQ(e.kind(), WebErrorKind::OVERWRITE_ERROR);
  }
}

TEST_F(WebTest, CreateOverExistingFileIsOverwriteError) {
  write_file(test_dir / "Notes", "x");
  try {
    webs->create("Notes");
    FAIL() << "Expected WebError";
  } catch (const WebError& e) {
    EXPECT_EQ(e.kind(), WebErrorKind::OVERWRITE_ERROR);
  }
}

TEST_F(WebTest, CreateRejectsPathNames) {
  for (const std::string name : {"", ".", "..", "a/b", "../escape"}) {
    try {
      webs->create(name);
      FAIL() << "Expected WebError for '" << name << "'";
    } catch (const WebError& e) {
      EXPECT_EQ(e.kind(), WebErrorKind::INVALID_NAME) << name;
    }
  }
  EXPECT_FALSE(std::filesystem::exists(test_dir.parent_path() / "escape"));
}

TEST_F(WebTest, GetIgnoresMissingWebsAndFiles) {
  write_file(test_dir / "plain", "x");
  EXPECT_FALSE(webs->get("Missing").has_value());
  EXPECT_FALSE(webs->get("plain").has_value());
  EXPECT_FALSE(webs->get("..").has_value());
}

TEST_F(WebTest, ListOnlyDirectories) {
  webs->create("Home");
  webs->create("Lab");
  write_file(test_dir / "stray.txt", "x");

  std::vector<std::string> expected = {"Home", "Lab"};
  EXPECT_EQ(sorted_names(webs->list()), expected);
}

TEST_F(WebTest, ListMissingRootIsIoError) {
  WebCollection missing(test_dir / "absent");
  try {
    missing.list();
    FAIL() << "Expected WebError";
  } catch (const WebError& e) {
    EXPECT_EQ(e.kind(), WebErrorKind::IO_ERROR);
  }
}

TEST_F(WebTest, WebStubSerializesName) {
  nlohmann::json j = std::vector<WebStub>{{"Home"}};
  EXPECT_EQ(j, nlohmann::json::parse(R"([{"name": "Home"}])"));
}

// ---- WEB ----

TEST_F(WebTest, NewPageCreatesUnderWeb) {
  Web web = webs->create("Home");
  Page page = web.new_page(PageDetail{"WebHome", "Welcome", "Hello", ""});
  EXPECT_FALSE(std::filesystem::exists(test_dir / "Home" / "WebHome"));

  page.create();
  EXPECT_TRUE(std::filesystem::is_regular_file(test_dir / "Home" / "WebHome" / PAGE_FILENAME));

  Page opened = web.open_page("WebHome");
  EXPECT_EQ(opened.detail().title, "Welcome");
}

TEST_F(WebTest, ListPages) {
  Web web = webs->create("Home");
  web.new_page(PageDetail{"A", "a", "", ""}).create();
  web.new_page(PageDetail{"B", "b", "", ""}).create();

  std::vector<std::string> expected = {"A", "B"};
  EXPECT_EQ(sorted_names(web.list_pages()), expected);
}

TEST_F(WebTest, OpenPageRejectsTraversal) {
  Web web = webs->create("Home");
  try {
    web.open_page("..");
    FAIL() << "Expected PageError";
  } catch (const PageError& e) {
    EXPECT_EQ(e.kind(), PageErrorKind::NOT_FOUND);
  }
}

TEST_F(WebTest, OpenMissingPage) {
  Web web = webs->create("Home");
  EXPECT_THROW(web.open_page("Nope"), PageError);
}
