#include "core/SymlinkGuard.hpp"

#include <limits.h>
#include <stdlib.h>

namespace markdownd {

bool IsSymlinkSafe(const std::string &path, std::string *realPath) {
  if (path.empty() || path[0] != '/') return false;
  char buf[PATH_MAX];
  if (::realpath(path.c_str(), buf) == 0) return false;
  std::string resolved(buf);
  if (realPath) *realPath = resolved;
  return resolved == path;
}

}  // namespace markdownd
