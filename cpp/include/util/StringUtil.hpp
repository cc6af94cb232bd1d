#pragma once

#include <string>
#include <vector>

namespace util {

// Removes trailing whitespace, including the "\r" of a CRLF line ending.
std::string rstrip(const std::string& s);

// Splits on "\n". A trailing "\n" does not produce a final empty line.
std::vector<std::string> splitlines(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
