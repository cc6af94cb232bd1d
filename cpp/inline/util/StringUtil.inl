#include "util/StringUtil.hpp"

#include <sstream>

namespace util {

inline std::string rstrip(const std::string& s) {
  size_t end = s.find_last_not_of(" \t\n\v\f\r");
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

inline std::vector<std::string> splitlines(const std::string& s) {
  std::vector<std::string> lines;
  std::istringstream ss(s);
  std::string line;
  while (std::getline(ss, line)) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace util
