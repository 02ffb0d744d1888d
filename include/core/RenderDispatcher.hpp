#pragma once

#include <string>

#include "core/ContentClassifier.hpp"
#include "core/MarkdownRenderer.hpp"
#include "util/Option.hpp"
#include "util/Result.hpp"

namespace markdownd {

enum RenderBranch {
  kBranchRawHtml,
  kBranchMarkdown,
  kBranchRawMarkdown,
  kBranchStatic
};

const char *BranchName(RenderBranch branch);

struct RenderOutput {
  RenderBranch branch;
  std::string body;
  std::string contentType;  // empty: leave Content-Type unset
  RenderOutput() : branch(kBranchStatic) {}
};

// Chooses how a verified file is delivered. Holds no per-request state.
class RenderDispatcher {
 public:
  explicit RenderDispatcher(const MarkdownRenderer &renderer);

  // For "x/page.html" returns "x/page.md" when that file can be opened.
  static Option<std::string> FindMarkdownSibling(const std::string &path);

  // First match wins:
  //   1. ".html" path or HTML-looking bytes: bytes as text/html
  //   2. ".md" path with plain-text bytes: raw source when rawQuery contains
  //      "raw", rendered HTML otherwise
  //   3. anything else: kBranchStatic with an empty body
  // Err only when the markdown renderer fails.
  Result<RenderOutput, std::string> Dispatch(
      const std::string &path, ClassificationResult &content,
      const std::string &rawQuery) const;

 private:
  const MarkdownRenderer &m_renderer;
};

}  // namespace markdownd
