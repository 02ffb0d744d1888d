#pragma once

#include <string>

namespace markdownd {

inline bool HasPrefix(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool HasSuffix(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool Contains(const std::string &s, const std::string &needle) {
  return s.find(needle) != std::string::npos;
}

}  // namespace markdownd
