#include "core/PathResolver.hpp"

#include <vector>

#include "util/Strings.hpp"

namespace markdownd {

std::string CleanPath(const std::string &path) {
  std::vector<std::string> stack;
  size_t i = 0;
  while (i <= path.size()) {
    size_t j = path.find('/', i);
    if (j == std::string::npos) j = path.size();
    std::string seg = path.substr(i, j - i);
    if (seg == "..") {
      if (!stack.empty()) stack.pop_back();
    } else if (!seg.empty() && seg != ".") {
      stack.push_back(seg);
    }
    i = j + 1;
  }
  std::string out;
  for (size_t k = 0; k < stack.size(); ++k) {
    out += '/';
    out += stack[k];
  }
  return out.empty() ? "/" : out;
}

Result<std::string, std::string> ResolveRequestPath(
    const std::string &rootPath, const std::string &urlPath,
    const std::string &indexName) {
  typedef Result<std::string, std::string> R;
  if (Contains(urlPath, "../")) return R::Err("contains '../'");
  if (urlPath.find('\0') != std::string::npos) return R::Err("contains NUL");

  std::string rel = urlPath;
  if (!rel.empty() && rel[0] == '/') rel.erase(0, 1);
  if (rel.empty()) rel = indexName;
  if (HasSuffix(rel, "/")) rel += "index.md";

  std::string canonical = CleanPath(rootPath + rel);
  if (!HasPrefix(canonical, rootPath))
    return R::Err("escapes root " + rootPath);
  return R::Ok(canonical);
}

}  // namespace markdownd
