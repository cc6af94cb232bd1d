#pragma once

#include <gtest/gtest.h>

/*
 * Use as the body of a unit-test main(). Runs all registered tests, after accepting the
 * util::Logging options on the command line next to gtest's own --gtest_* options.
 */
int launch_gtest(int argc, char** argv);
