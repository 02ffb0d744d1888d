#include <criterion/criterion.h>

#include <string>

#include "core/MarkdownRenderer.hpp"

using markdownd::Md4cRenderer;

namespace {

bool has(const std::string &html, const char *needle) {
  return html.find(needle) != std::string::npos;
}

}  // namespace

Test(MarkdownRenderer, headings_and_emphasis) {
  Md4cRenderer r;
  std::string html;
  cr_assert(r.Render("# Title\n\nSome *em* and **strong**.\n", html));
  cr_assert(has(html, "<h1>Title</h1>"), "%s", html.c_str());
  cr_assert(has(html, "<em>em</em>"));
  cr_assert(has(html, "<strong>strong</strong>"));
}

Test(MarkdownRenderer, github_extensions) {
  Md4cRenderer r;
  std::string html;
  cr_assert(r.Render("| a | b |\n|---|---|\n| 1 | 2 |\n\n~~gone~~\n\n"
                     "- [x] done\n\nsee https://example.com\n",
                     html));
  cr_assert(has(html, "<table>"), "%s", html.c_str());
  cr_assert(has(html, "<del>gone</del>"));
  cr_assert(has(html, "type=\"checkbox\""));
  cr_assert(has(html, "<a href=\"https://example.com\">"));
}

Test(MarkdownRenderer, raw_html_passes_through) {
  Md4cRenderer r;
  std::string html;
  cr_assert(r.Render("<div class=\"note\">kept</div>\n", html));
  cr_assert(has(html, "<div class=\"note\">kept</div>"));
}

Test(MarkdownRenderer, xhtml_void_tags) {
  Md4cRenderer r;
  std::string html;
  cr_assert(r.Render("a\n\n---\n", html));
  cr_assert(has(html, "<hr />"), "%s", html.c_str());
}

Test(MarkdownRenderer, empty_input) {
  Md4cRenderer r;
  std::string html = "stale";
  cr_assert(r.Render("", html));
  cr_assert(html.empty());
}
