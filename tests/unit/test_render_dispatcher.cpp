#include <criterion/criterion.h>

#include <string>

#include "TempTree.hpp"
#include "core/ContentClassifier.hpp"
#include "core/MarkdownRenderer.hpp"
#include "core/RenderDispatcher.hpp"

using namespace markdownd;
using markdownd::testing::TempTree;

namespace {

// Wraps the input so tests can tell rendered output from raw bytes.
class FakeRenderer : public MarkdownRenderer {
 public:
  explicit FakeRenderer(bool ok = true) : m_ok(ok) {}
  virtual bool Render(const std::string &markdown, std::string &html) const {
    if (!m_ok) return false;
    html = "<rendered>" + markdown + "</rendered>";
    return true;
  }

 private:
  bool m_ok;
};

ClassificationResult classified(const std::string &path,
                                const std::string &data) {
  std::string bytes(data);
  return Classify(path, bytes);
}

}  // namespace

Test(RenderDispatcher, html_extension_is_served_raw) {
  FakeRenderer fake;
  RenderDispatcher d(fake);
  ClassificationResult c = classified("/r/page.html", "just text");
  Result<RenderOutput, std::string> out = d.Dispatch("/r/page.html", c, "");
  cr_assert(out.IsOk());
  cr_assert_eq(out.Unwrap().branch, kBranchRawHtml);
  cr_assert_str_eq(out.Unwrap().contentType.c_str(), "text/html");
  cr_assert_str_eq(out.Unwrap().body.c_str(), "just text");
}

Test(RenderDispatcher, html_content_wins_over_md_extension) {
  FakeRenderer fake;
  RenderDispatcher d(fake);
  ClassificationResult c = classified("/r/page.md", "<html><p>x</p></html>");
  Result<RenderOutput, std::string> out = d.Dispatch("/r/page.md", c, "");
  cr_assert_eq(out.Unwrap().branch, kBranchRawHtml);
  cr_assert_str_eq(out.Unwrap().body.c_str(), "<html><p>x</p></html>");
}

Test(RenderDispatcher, markdown_is_rendered) {
  FakeRenderer fake;
  RenderDispatcher d(fake);
  ClassificationResult c = classified("/r/a.md", "# hi\n");
  Result<RenderOutput, std::string> out = d.Dispatch("/r/a.md", c, "x=1");
  cr_assert_eq(out.Unwrap().branch, kBranchMarkdown);
  cr_assert_str_eq(out.Unwrap().contentType.c_str(), "text/html");
  cr_assert_str_eq(out.Unwrap().body.c_str(), "<rendered># hi\n</rendered>");
}

Test(RenderDispatcher, raw_query_returns_source) {
  FakeRenderer fake;
  RenderDispatcher d(fake);
  const char *queries[] = {"raw", "raw=1", "x=1&raw", "draw"};
  for (size_t i = 0; i < sizeof(queries) / sizeof(queries[0]); ++i) {
    ClassificationResult c = classified("/r/a.md", "# hi\n");
    Result<RenderOutput, std::string> out =
        d.Dispatch("/r/a.md", c, queries[i]);
    cr_assert_eq(out.Unwrap().branch, kBranchRawMarkdown, "%s", queries[i]);
    cr_assert(out.Unwrap().contentType.empty());
    cr_assert_str_eq(out.Unwrap().body.c_str(), "# hi\n");
  }
}

Test(RenderDispatcher, other_files_fall_through) {
  FakeRenderer fake;
  RenderDispatcher d(fake);
  ClassificationResult text = classified("/r/notes.txt", "plain");
  Result<RenderOutput, std::string> out = d.Dispatch("/r/notes.txt", text, "");
  cr_assert_eq(out.Unwrap().branch, kBranchStatic);
  cr_assert_str_eq(text.bytes.c_str(), "plain");

  ClassificationResult bin =
      classified("/r/blob.md", std::string("\x89PNG\r\n\x1a\n", 8));
  out = d.Dispatch("/r/blob.md", bin, "raw");
  cr_assert_eq(out.Unwrap().branch, kBranchStatic);
}

Test(RenderDispatcher, renderer_failure_is_err) {
  FakeRenderer broken(false);
  RenderDispatcher d(broken);
  ClassificationResult c = classified("/r/a.md", "# hi\n");
  cr_assert(d.Dispatch("/r/a.md", c, "").IsErr());
}

Test(RenderDispatcher, markdown_sibling_lookup) {
  TempTree tree;
  cr_assert(tree.Ok());
  cr_assert(tree.WriteFile("doc.md", "# doc\n"));
  Option<std::string> hit =
      RenderDispatcher::FindMarkdownSibling(tree.Path("doc.html"));
  cr_assert(hit.IsSome());
  cr_assert_str_eq(hit.Unwrap().c_str(), tree.Path("doc.md").c_str());
  cr_assert(RenderDispatcher::FindMarkdownSibling(tree.Path("other.html"))
                .IsNone());
  cr_assert(
      RenderDispatcher::FindMarkdownSibling(tree.Path("doc.md")).IsNone());
}

Test(RenderDispatcher, branch_names) {
  cr_assert_str_eq(BranchName(kBranchRawHtml), "html");
  cr_assert_str_eq(BranchName(kBranchMarkdown), "markdown");
  cr_assert_str_eq(BranchName(kBranchRawMarkdown), "raw");
  cr_assert_str_eq(BranchName(kBranchStatic), "static");
}
