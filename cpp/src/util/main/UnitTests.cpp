#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/CppUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

static_assert(util::int_sequence_contains_v<util::int_sequence<1, 2, 3>, 2>);
static_assert(!util::int_sequence_contains_v<util::int_sequence<1, 2, 3>, 4>);
static_assert(util::no_overlap_v<util::int_sequence<1, 2>, util::int_sequence<3>>);
static_assert(!util::no_overlap_v<util::int_sequence<1, 2>, util::int_sequence<2, 3>>);
static_assert(
  util::string_literal_sequence_contains_v<util::StringLiteralSequence<"foo", "bar">, "bar">);
static_assert(
  !util::string_literal_sequence_contains_v<util::StringLiteralSequence<"foo", "bar">, "baz">);

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

TEST(Exceptions, format) {
  util::Exception e("x={} y={}", 3, "abc");
  EXPECT_STREQ(e.what(), "x=3 y=abc");

  util::CleanException ce("no args");
  EXPECT_STREQ(ce.what(), "no args");
}

TEST(Asserts, release_assert) {
  int x = 5;
  EXPECT_NO_THROW(RELEASE_ASSERT(x == 5));
  EXPECT_THROW(RELEASE_ASSERT(x == 6), util::ReleaseAssertionError);

  try {
    RELEASE_ASSERT(x == 6, "x is {}", x);
    FAIL() << "expected a throw";
  } catch (const util::ReleaseAssertionError& e) {
    EXPECT_TRUE(contains(e.what(), "RELEASE_ASSERT failed: x is 5")) << e.what();
    EXPECT_TRUE(contains(e.what(), "UnitTests.cpp")) << e.what();
  }

  try {
    RELEASE_ASSERT(x < 0);
    FAIL() << "expected a throw";
  } catch (const util::ReleaseAssertionError& e) {
    EXPECT_TRUE(contains(e.what(), "x < 0")) << e.what();
  }
}

TEST(Asserts, clean_assert) {
  EXPECT_THROW(CLEAN_ASSERT(false, "bad arg {}", 7), util::CleanAssertionError);
  EXPECT_THROW(CLEAN_ASSERT(false), util::CleanException);
  EXPECT_NO_THROW(CLEAN_ASSERT(true, "never formatted"));
}

TEST(Asserts, debug_assert) {
  if (IS_MACRO_ENABLED(DEBUG_BUILD)) {
    EXPECT_THROW(DEBUG_ASSERT(1 + 1 == 3), util::DebugAssertionError);
  } else {
    EXPECT_NO_THROW(DEBUG_ASSERT(1 + 1 == 3));
  }
  EXPECT_NO_THROW(DEBUG_ASSERT(1 + 1 == 2));
}

TEST(StringUtil, rstrip) {
  EXPECT_EQ(util::rstrip("1A"), "1A");
  EXPECT_EQ(util::rstrip("1A \t\r"), "1A");
  EXPECT_EQ(util::rstrip("  1A"), "  1A");
  EXPECT_EQ(util::rstrip("   "), "");
  EXPECT_EQ(util::rstrip(""), "");
}

TEST(StringUtil, splitlines) {
  std::vector<std::string> expected = {"abc", "", "de"};
  EXPECT_EQ(util::splitlines("abc\n\nde\n"), expected);
  EXPECT_EQ(util::splitlines("abc\n\nde"), expected);
  EXPECT_TRUE(util::splitlines("").empty());
}

struct TestOptions {
  int count = 0;
  std::string name;
  bool verbose = false;
  bool colors = true;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Test options");
    return desc.template add_option<"count", 'c'>(po::value<int>(&count), "count")
      .template add_option<"name">(po::value<std::string>(&name), "name")
      .template add_flag<"verbose", "quiet">(&verbose, "be verbose", "be quiet")
      .template add_flag<"colors", "no-colors">(&colors, "use colors", "no colors");
  }
};

TEST(BoostUtil, parse_args) {
  namespace po2 = boost_util::program_options;

  TestOptions options;
  std::vector<std::string> args = {"-c", "3", "--name", "foo", "--verbose", "--no-colors"};
  po2::parse_args(options.make_options_description(), args);

  EXPECT_EQ(options.count, 3);
  EXPECT_EQ(options.name, "foo");
  EXPECT_TRUE(options.verbose);
  EXPECT_FALSE(options.colors);
}

TEST(BoostUtil, parse_args_defaults) {
  namespace po2 = boost_util::program_options;

  TestOptions options;
  std::vector<std::string> args;
  po2::parse_args(options.make_options_description(), args);

  EXPECT_EQ(options.count, 0);
  EXPECT_EQ(options.name, "");
  EXPECT_FALSE(options.verbose);
  EXPECT_TRUE(options.colors);
}

TEST(BoostUtil, parse_args_errors) {
  namespace po2 = boost_util::program_options;

  TestOptions options;
  std::vector<std::string> unknown = {"--bogus"};
  EXPECT_THROW(po2::parse_args(options.make_options_description(), unknown),
               util::CleanException);

  std::vector<std::string> bad_value = {"--count", "three"};
  EXPECT_THROW(po2::parse_args(options.make_options_description(), bad_value),
               util::CleanException);
}

TEST(BoostUtil, add) {
  namespace po2 = boost_util::program_options;

  TestOptions options;
  util::Logging::Params log_params;

  po2::options_description raw_desc("All options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help")
                .add(options.make_options_description())
                .add(log_params.make_options_description());

  std::vector<std::string> args = {"--quiet", "--log-append-mode", "-c", "9"};
  po2::parse_args(desc, args);

  EXPECT_FALSE(options.verbose);
  EXPECT_EQ(options.count, 9);
  EXPECT_TRUE(log_params.append_mode);
}

TEST(BoostUtil, help_output) {
  namespace po2 = boost_util::program_options;

  TestOptions options;
  auto desc = options.make_options_description();

  std::ostringstream ss;
  desc.print(ss);
  std::string brief = ss.str();

  EXPECT_TRUE(contains(brief, "--verbose"));
  EXPECT_FALSE(contains(brief, "--quiet"));
  EXPECT_TRUE(contains(brief, "--no-colors"));
  EXPECT_FALSE(contains(brief, "--colors "));

  po2::Settings::help_full = true;
  ss.str("");
  desc.print(ss);
  std::string full = ss.str();
  po2::Settings::help_full = false;

  EXPECT_TRUE(contains(full, "--quiet"));
  EXPECT_TRUE(contains(full, "--colors "));
  EXPECT_TRUE(contains(full, "(no-op)"));
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  std::stringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

TEST(LoggingUtil, log_to_file) {
  std::filesystem::path path =
    std::filesystem::temp_directory_path() / "tictactoe_util_tests_log.txt";
  std::filesystem::remove(path);

  util::Logging::Params params;
  params.log_filename = path.string();
  params.omit_timestamps = true;
  util::Logging::init(params);

  LOG_INFO("hello {}", 42);
  LOG_WARN("careful");
  spdlog::default_logger()->flush();

  // restore console-only logging before inspecting the file
  util::Logging::init(util::Logging::Params{});

  EXPECT_EQ(read_file(path), "hello 42\ncareful\n");
  std::filesystem::remove(path);
}

TEST(LoggingUtil, log_level) {
  std::filesystem::path path =
    std::filesystem::temp_directory_path() / "tictactoe_util_tests_level.txt";
  std::filesystem::remove(path);

  util::Logging::Params params;
  params.log_filename = path.string();
  params.log_level = "warn";
  params.omit_timestamps = true;
  util::Logging::init(params);

  LOG_INFO("dropped");
  LOG_WARN("kept");
  LOG_ERROR("also kept");
  spdlog::default_logger()->flush();

  util::Logging::init(util::Logging::Params{});

  EXPECT_EQ(read_file(path), "kept\nalso kept\n");
  std::filesystem::remove(path);
}

TEST(LoggingUtil, bad_params) {
  util::Logging::Params params;
  params.log_level = "chatty";
  EXPECT_THROW(util::Logging::init(params), util::CleanException);

  // the parent "directory" is a regular file, so the log file cannot be created
  std::filesystem::path not_a_dir =
    std::filesystem::temp_directory_path() / "tictactoe_util_tests_not_a_dir";
  {
    std::ofstream file(not_a_dir);
    file << "x";
  }

  params.log_level = "off";
  params.log_filename = (not_a_dir / "tests.log").string();
  EXPECT_THROW(util::Logging::init(params), util::CleanException);

  util::Logging::init(util::Logging::Params{});
  std::filesystem::remove(not_a_dir);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
