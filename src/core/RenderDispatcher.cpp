#include "core/RenderDispatcher.hpp"

#include "core/FileSystem.hpp"
#include "util/Strings.hpp"

namespace markdownd {

const char *BranchName(RenderBranch branch) {
  switch (branch) {
    case kBranchRawHtml: return "html";
    case kBranchMarkdown: return "markdown";
    case kBranchRawMarkdown: return "raw";
    case kBranchStatic: return "static";
  }
  return "static";
}

RenderDispatcher::RenderDispatcher(const MarkdownRenderer &renderer)
    : m_renderer(renderer) {}

Option<std::string> RenderDispatcher::FindMarkdownSibling(
    const std::string &path) {
  if (!HasSuffix(path, ".html")) return Option<std::string>::None();
  std::string candidate = path.substr(0, path.size() - 5) + ".md";
  if (!CanOpen(candidate, 0)) return Option<std::string>::None();
  return Option<std::string>::Some(candidate);
}

Result<RenderOutput, std::string> RenderDispatcher::Dispatch(
    const std::string &path, ClassificationResult &content,
    const std::string &rawQuery) const {
  typedef Result<RenderOutput, std::string> R;
  RenderOutput out;
  if (HasSuffix(path, ".html") || content.category == kCategoryHtml) {
    out.branch = kBranchRawHtml;
    out.contentType = "text/html";
    out.body.swap(content.bytes);
    return R::Ok(out);
  }
  if (HasSuffix(path, ".md") && content.category == kCategoryText) {
    if (Contains(rawQuery, "raw")) {
      out.branch = kBranchRawMarkdown;
      out.body.swap(content.bytes);
      return R::Ok(out);
    }
    if (!m_renderer.Render(content.bytes, out.body))
      return R::Err("markdown renderer failed");
    out.branch = kBranchMarkdown;
    out.contentType = "text/html";
    return R::Ok(out);
  }
  out.branch = kBranchStatic;
  return R::Ok(out);
}

}  // namespace markdownd
