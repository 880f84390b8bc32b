#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <vector>
#include "config/options.hpp"
#include "test_utils.hpp"

using namespace biowiki::config;

class OptionsTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::ostringstream err;

  void SetUp() override {
    test_dir = make_test_dir("options_test");
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  ProgramOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "biowiki");
    std::vector<const char*> argv;
    for (const auto& arg : args) {
      argv.push_back(arg.c_str());
    }
    return parse_command_line(static_cast<int>(argv.size()), argv.data(), err);
  }
};

TEST_F(OptionsTest, Defaults) {
  auto options = parse({"-d", test_dir.string()});
  ASSERT_TRUE(options.valid);
  EXPECT_FALSE(options.help);
  EXPECT_EQ(options.host, "127.0.0.1");
  EXPECT_EQ(options.port, 3000);
  EXPECT_EQ(options.directory, test_dir.string());
  EXPECT_TRUE(options.log_file.empty());
  EXPECT_EQ(options.log_level, boost::log::trivial::info);
  EXPECT_TRUE(err.str().empty());
}

TEST_F(OptionsTest, LongAndShortFlags) {
  auto options = parse({"--host", "0.0.0.0", "-p", "8080", "--dir", test_dir.string(),
                        "-l", "wiki.log", "--log-level", "debug"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.host, "0.0.0.0");
  EXPECT_EQ(options.port, 8080);
  EXPECT_EQ(options.log_file, "wiki.log");
  EXPECT_EQ(options.log_level, boost::log::trivial::debug);
}

TEST_F(OptionsTest, PortZeroIsAllowed) {
  auto options = parse({"-d", test_dir.string(), "-p", "0"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.port, 0);
}

TEST_F(OptionsTest, HelpShortCircuits) {
  auto options = parse({"--help"});
  EXPECT_TRUE(options.valid);
  EXPECT_TRUE(options.help);
}

TEST_F(OptionsTest, DirectoryIsRequired) {
  auto options = parse({"-p", "3000"});
  EXPECT_FALSE(options.valid);
  EXPECT_NE(err.str().find("directory is required"), std::string::npos);
}

TEST_F(OptionsTest, DirectoryMustExist) {
  auto options = parse({"-d", (test_dir / "missing").string()});
  EXPECT_FALSE(options.valid);
  EXPECT_NE(err.str().find("is not a directory"), std::string::npos);
}

TEST_F(OptionsTest, InvalidPorts) {
  for (const std::string port : {"abc", "-1", "65536", "80x", ""}) {
    err.str("");
    auto options = parse({"-d", test_dir.string(), "-p", port});
    EXPECT_FALSE(options.valid) << port;
    EXPECT_NE(err.str().find("Invalid port"), std::string::npos) << port;
  }
}

TEST_F(OptionsTest, InvalidLogLevel) {
  auto options = parse({"-d", test_dir.string(), "-v", "loud"});
  EXPECT_FALSE(options.valid);
  EXPECT_NE(err.str().find("Invalid log level"), std::string::npos);
}

TEST_F(OptionsTest, UnknownFlag) {
  auto options = parse({"-d", test_dir.string(), "--verbose"});
  EXPECT_FALSE(options.valid);
  EXPECT_NE(err.str().find("Unknown argument"), std::string::npos);
  EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}

TEST_F(OptionsTest, MissingValue) {
  auto options = parse({"-d"});
  EXPECT_FALSE(options.valid);
  EXPECT_NE(err.str().find("Missing value"), std::string::npos);
}

TEST_F(OptionsTest, UsageListsFlags) {
  std::ostringstream out;
  print_usage(out, "biowiki");
  for (const std::string flag : {"--dir", "--host", "--port", "--log-file", "--log-level", "--help"}) {
    EXPECT_NE(out.str().find(flag), std::string::npos) << flag;
  }
}
