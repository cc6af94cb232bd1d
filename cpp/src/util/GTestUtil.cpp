#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <cstring>
#include <iostream>

namespace {

bool has_arg(int argc, char** argv, const char* arg) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], arg) == 0) return true;
  }
  return false;
}

}  // namespace

// testing::InitGoogleTest() only knows how to describe the --gtest_* options, and boost rejects
// them as unknown. So on --help, our options are printed before gtest's. Otherwise, boost only
// sees what InitGoogleTest() leaves behind in argv.
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;

  util::Logging::Params log_params;

  po2::options_description raw_desc("Options");
  auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                .template add_option<"help-full">("help (all options)")
                .add(log_params.make_options_description());

  bool help_full = has_arg(argc, argv, "--help-full");
  if (help_full || has_arg(argc, argv, "--help") || has_arg(argc, argv, "-h")) {
    po2::Settings::help_full = help_full;
    std::cout << desc << std::endl;

    char help_arg[] = "--help";
    char* gtest_argv[] = {argv[0], help_arg, nullptr};
    int gtest_argc = 2;
    testing::InitGoogleTest(&gtest_argc, gtest_argv);
    return 0;
  }

  testing::InitGoogleTest(&argc, argv);

  try {
    po2::parse_args(desc, argc, argv);
    util::Logging::init(log_params);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: " << e.what() << std::endl;
    return 1;
  }
  return RUN_ALL_TESTS();
}
