#pragma once

#include <cstddef>
#include <string>

namespace markdownd {

enum ContentCategory { kCategoryHtml, kCategoryText, kCategoryOther };

const char *CategoryName(ContentCategory category);

struct ClassificationResult {
  std::string bytes;
  ContentCategory category;
  std::string mimeType;   // sniffed, e.g. "text/plain; charset=utf-8"
  std::string extension;  // ".md", ".html", "" when the name has none
  ClassificationResult() : category(kCategoryOther) {}
};

// Number of leading bytes the sniffer looks at.
const size_t kSniffLength = 512;

// MIME type guessed from the first kSniffLength bytes. Always returns a
// value; "application/octet-stream" when nothing matches.
std::string DetectContentType(const std::string &data);

ContentCategory CategoryOf(const std::string &mimeType);

// Extension of the last path segment including the dot.
std::string FileExtension(const std::string &path);

// Sniffs bytes and moves them into the result; bytes is left empty.
ClassificationResult Classify(const std::string &path, std::string &bytes);

}  // namespace markdownd
