#pragma once

#include <string>

namespace markdownd {

// Markdown bytes in, HTML bytes out. Implementations hold no per-call state
// so one instance serves every request.
class MarkdownRenderer {
 public:
  virtual ~MarkdownRenderer() {}
  virtual bool Render(const std::string &markdown, std::string &html) const = 0;
};

// md4c-html with the GitHub dialect (tables, strikethrough, autolinks, task
// lists) and XHTML-style void tags. Raw HTML in the source is passed through.
class Md4cRenderer : public MarkdownRenderer {
 public:
  Md4cRenderer();
  virtual bool Render(const std::string &markdown, std::string &html) const;

 private:
  unsigned m_parserFlags;
  unsigned m_rendererFlags;
};

}  // namespace markdownd
