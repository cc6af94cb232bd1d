#pragma once

namespace util {

constexpr int kDefaultScreenWidth = 80;

// Column count of the terminal on stdout, or kDefaultScreenWidth when stdout is not a terminal.
int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
