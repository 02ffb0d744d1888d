#include "core/ContentClassifier.hpp"

#include "util/Strings.hpp"

namespace markdownd {

namespace {

struct Signature {
  const char *pattern;
  size_t length;
  const char *mask;  // 0 = exact match
  bool skipWhitespace;
  const char *mimeType;
};

// Order matters: first match wins.
const Signature kSignatures[] = {
    {"<?xml", 5, "\xFF\xFF\xFF\xFF\xFF", true, "text/xml; charset=utf-8"},
    {"%PDF-", 5, 0, false, "application/pdf"},
    {"%!PS-Adobe-", 11, 0, false, "application/postscript"},
    {"\xFE\xFF\x00\x00", 4, "\xFF\xFF\x00\x00", false,
     "text/plain; charset=utf-16be"},
    {"\xFF\xFE\x00\x00", 4, "\xFF\xFF\x00\x00", false,
     "text/plain; charset=utf-16le"},
    {"\xEF\xBB\xBF\x00", 4, "\xFF\xFF\xFF\x00", false,
     "text/plain; charset=utf-8"},
    {"\x00\x00\x01\x00", 4, 0, false, "image/x-icon"},
    {"\x00\x00\x02\x00", 4, 0, false, "image/x-icon"},
    {"BM", 2, 0, false, "image/bmp"},
    {"GIF87a", 6, 0, false, "image/gif"},
    {"GIF89a", 6, 0, false, "image/gif"},
    {"RIFF\x00\x00\x00\x00WEBPVP", 14,
     "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF\xFF\xFF", false,
     "image/webp"},
    {"\x89PNG\x0D\x0A\x1A\x0A", 8, 0, false, "image/png"},
    {"\xFF\xD8\xFF", 3, 0, false, "image/jpeg"},
    {"ID3", 3, 0, false, "audio/mpeg"},
    {"OggS\x00", 5, 0, false, "application/ogg"},
    {"RIFF\x00\x00\x00\x00WAVE", 12,
     "\xFF\xFF\xFF\xFF\x00\x00\x00\x00\xFF\xFF\xFF\xFF", false, "audio/wave"},
    {"\x1A\x45\xDF\xA3", 4, 0, false, "video/webm"},
    {"wOFF", 4, 0, false, "font/woff"},
    {"wOF2", 4, 0, false, "font/woff2"},
    {"\x1F\x8B\x08", 3, 0, false, "application/x-gzip"},
    {"PK\x03\x04", 4, 0, false, "application/zip"},
    {"Rar!\x1A\x07\x00", 7, 0, false, "application/x-rar-compressed"},
    {"Rar!\x1A\x07\x01\x00", 8, 0, false, "application/x-rar-compressed"},
    {"\x00\x61\x73\x6D", 4, 0, false, "application/wasm"},
};

// Tags that mark a document as HTML when they open it (after whitespace) and
// are followed by a space or '>'.
const char *const kHtmlTags[] = {
    "<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT", "<IFRAME", "<H1",
    "<DIV",           "<FONT", "<TABLE", "<A",     "<STYLE",  "<TITLE",
    "<B",             "<BODY", "<BR",   "<P",     "<!--",
};

bool isWhitespace(unsigned char c) {
  return c == '\t' || c == '\n' || c == '\x0c' || c == '\r' || c == ' ';
}

bool isBinaryControl(unsigned char c) {
  return c <= 0x08 || c == 0x0B || (c >= 0x0E && c <= 0x1A) ||
         (c >= 0x1C && c <= 0x1F);
}

bool matchesSignature(const std::string &data, size_t firstNonWs,
                      const Signature &sig) {
  size_t start = sig.skipWhitespace ? firstNonWs : 0;
  if (data.size() < start + sig.length) return false;
  for (size_t i = 0; i < sig.length; ++i) {
    unsigned char d = (unsigned char)data[start + i];
    unsigned char p = (unsigned char)sig.pattern[i];
    if (sig.mask) d &= (unsigned char)sig.mask[i];
    if (d != p) return false;
  }
  return true;
}

bool matchesHtmlTag(const std::string &data, size_t start, const char *tag) {
  size_t i = 0;
  for (; tag[i]; ++i) {
    if (start + i >= data.size()) return false;
    unsigned char d = (unsigned char)data[start + i];
    unsigned char t = (unsigned char)tag[i];
    if (t >= 'A' && t <= 'Z') d &= 0xDF;  // ASCII upper-case
    if (d != t) return false;
  }
  if (start + i >= data.size()) return false;
  char next = data[start + i];
  return next == ' ' || next == '>';
}

}  // namespace

const char *CategoryName(ContentCategory category) {
  switch (category) {
    case kCategoryHtml: return "html";
    case kCategoryText: return "text";
    case kCategoryOther: return "other";
  }
  return "other";
}

std::string DetectContentType(const std::string &full) {
  std::string data =
      full.size() > kSniffLength ? full.substr(0, kSniffLength) : full;

  size_t firstNonWs = 0;
  while (firstNonWs < data.size() &&
         isWhitespace((unsigned char)data[firstNonWs]))
    ++firstNonWs;

  for (size_t i = 0; i < sizeof(kHtmlTags) / sizeof(kHtmlTags[0]); ++i) {
    if (matchesHtmlTag(data, firstNonWs, kHtmlTags[i]))
      return "text/html; charset=utf-8";
  }
  for (size_t i = 0; i < sizeof(kSignatures) / sizeof(kSignatures[0]); ++i) {
    if (matchesSignature(data, firstNonWs, kSignatures[i]))
      return kSignatures[i].mimeType;
  }
  for (size_t i = 0; i < data.size(); ++i) {
    if (isBinaryControl((unsigned char)data[i]))
      return "application/octet-stream";
  }
  return "text/plain; charset=utf-8";
}

ContentCategory CategoryOf(const std::string &mimeType) {
  if (HasPrefix(mimeType, "text/html")) return kCategoryHtml;
  if (HasPrefix(mimeType, "text/plain")) return kCategoryText;
  return kCategoryOther;
}

std::string FileExtension(const std::string &path) {
  for (size_t i = path.size(); i > 0; --i) {
    if (path[i - 1] == '.') return path.substr(i - 1);
    if (path[i - 1] == '/') break;
  }
  return "";
}

ClassificationResult Classify(const std::string &path, std::string &bytes) {
  ClassificationResult result;
  result.mimeType = DetectContentType(bytes);
  result.category = CategoryOf(result.mimeType);
  result.extension = FileExtension(path);
  result.bytes.swap(bytes);
  return result;
}

}  // namespace markdownd
