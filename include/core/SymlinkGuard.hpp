#pragma once

#include <string>

namespace markdownd {

// True only when realpath(path) succeeds and equals path byte for byte, i.e.
// no component of the canonical path is a symbolic link. *realPath receives
// the resolved form when resolution succeeded.
bool IsSymlinkSafe(const std::string &path, std::string *realPath = 0);

}  // namespace markdownd
