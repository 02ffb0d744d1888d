#include "core/MarkdownRenderer.hpp"

extern "C" {
#include <md4c-html.h>
}

namespace markdownd {

namespace {

void appendChunk(const MD_CHAR *text, MD_SIZE size, void *userdata) {
  static_cast<std::string *>(userdata)->append(text, size);
}

}  // namespace

Md4cRenderer::Md4cRenderer()
    : m_parserFlags(MD_DIALECT_GITHUB),
      m_rendererFlags(MD_HTML_FLAG_XHTML | MD_HTML_FLAG_SKIP_UTF8_BOM) {}

bool Md4cRenderer::Render(const std::string &markdown,
                          std::string &html) const {
  std::string out;
  out.reserve(markdown.size() + markdown.size() / 2);
  int rc = md_html(markdown.data(), (MD_SIZE)markdown.size(), appendChunk,
                   &out, m_parserFlags, m_rendererFlags);
  if (rc != 0) return false;
  html.swap(out);
  return true;
}

}  // namespace markdownd
