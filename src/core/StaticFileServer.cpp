#include "core/StaticFileServer.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "core/ContentClassifier.hpp"
#include "util/Strings.hpp"

namespace markdownd {

namespace {

struct MimeEntry {
  const char *extension;
  const char *type;
};

const MimeEntry kMimeTable[] = {
    {".html", "text/html; charset=utf-8"},
    {".htm", "text/html; charset=utf-8"},
    {".css", "text/css; charset=utf-8"},
    {".js", "text/javascript; charset=utf-8"},
    {".mjs", "text/javascript; charset=utf-8"},
    {".json", "application/json"},
    {".xml", "text/xml; charset=utf-8"},
    {".txt", "text/plain; charset=utf-8"},
    {".md", "text/markdown; charset=utf-8"},
    {".svg", "image/svg+xml"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".ico", "image/x-icon"},
    {".pdf", "application/pdf"},
    {".wasm", "application/wasm"},
    {".woff", "font/woff"},
    {".woff2", "font/woff2"},
    {".ttf", "font/ttf"},
    {".mp3", "audio/mpeg"},
    {".mp4", "video/mp4"},
    {".webm", "video/webm"},
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
};

std::string lower(const std::string &s) {
  std::string out(s);
  for (size_t i = 0; i < out.size(); ++i)
    out[i] = (char)std::tolower((unsigned char)out[i]);
  return out;
}

// Digits only; false on empty input or overflow.
bool parseOffset(const std::string &s, size_t &out) {
  if (s.empty()) return false;
  for (size_t i = 0; i < s.size(); ++i)
    if (s[i] < '0' || s[i] > '9') return false;
  errno = 0;
  unsigned long long v = std::strtoull(s.c_str(), 0, 10);
  if (errno != 0) return false;
  out = (size_t)v;
  return true;
}

std::string contentRange(size_t first, size_t last, size_t size) {
  char buf[96];
  std::sprintf(buf, "bytes %lu-%lu/%lu", (unsigned long)first,
               (unsigned long)last, (unsigned long)size);
  return buf;
}

}  // namespace

const char *MimeTypeByExtension(const std::string &path) {
  std::string ext = lower(FileExtension(path));
  if (ext.empty()) return 0;
  for (size_t i = 0; i < sizeof(kMimeTable) / sizeof(kMimeTable[0]); ++i) {
    if (ext == kMimeTable[i].extension) return kMimeTable[i].type;
  }
  return 0;
}

RangeStatus ParseByteRange(const std::string &header, size_t size,
                           size_t &offset, size_t &length) {
  if (header.empty()) return kRangeNone;
  if (!HasPrefix(header, "bytes=")) return kRangeMalformed;
  std::string spec = header.substr(6);
  if (Contains(spec, ",")) return kRangeNone;
  std::string::size_type dash = spec.find('-');
  if (dash == std::string::npos) return kRangeMalformed;
  std::string first = spec.substr(0, dash);
  std::string last = spec.substr(dash + 1);
  size_t a = 0;
  size_t b = 0;
  if (first.empty()) {
    // suffix range: the final b bytes
    if (!parseOffset(last, b)) return kRangeMalformed;
    if (b == 0 || size == 0) return kRangeUnsatisfiable;
    if (b > size) b = size;
    offset = size - b;
    length = b;
    return kRangeSatisfiable;
  }
  if (!parseOffset(first, a)) return kRangeMalformed;
  if (a >= size) return kRangeUnsatisfiable;
  if (last.empty()) {
    b = size - 1;
  } else {
    if (!parseOffset(last, b) || b < a) return kRangeMalformed;
    if (b >= size) b = size - 1;
  }
  offset = a;
  length = b - a + 1;
  return kRangeSatisfiable;
}

void ServeStaticFile(const HttpRequest &request, const std::string &path,
                     const std::string &bytes, std::time_t modified,
                     const std::string &sniffedType, HttpResponse &resp) {
  const char *byExt = MimeTypeByExtension(path);
  std::string ctype = byExt ? std::string(byExt) : sniffedType;
  if (modified > 0) resp.SetHeader("Last-Modified", FormatHttpDate(modified));

  std::string value;
  std::time_t since = 0;
  if (request.Header("If-Unmodified-Since", value) &&
      ParseHttpDate(value, since) && modified > since) {
    resp.status = 412;
    resp.body.clear();
    return;
  }
  if (request.Header("If-Modified-Since", value) &&
      ParseHttpDate(value, since) && modified > 0 && modified <= since) {
    resp.status = 304;
    resp.omitBody = true;
    resp.body.clear();
    return;
  }

  resp.SetHeader("Accept-Ranges", "bytes");
  resp.SetHeader("Content-Type", ctype);

  std::string rangeHeader;
  request.Header("Range", rangeHeader);
  size_t offset = 0;
  size_t length = 0;
  switch (ParseByteRange(rangeHeader, bytes.size(), offset, length)) {
    case kRangeSatisfiable:
      resp.status = 206;
      resp.SetHeader("Content-Range",
                     contentRange(offset, offset + length - 1, bytes.size()));
      resp.body = bytes.substr(offset, length);
      return;
    case kRangeUnsatisfiable: {
      char buf[64];
      std::sprintf(buf, "bytes */%lu", (unsigned long)bytes.size());
      resp.SetHeader("Content-Range", buf);
    }
    // fall through
    case kRangeMalformed:
      resp.status = 416;
      resp.SetHeader("Content-Type", "text/plain; charset=utf-8");
      resp.body = "416 requested range not satisfiable\n";
      return;
    case kRangeNone:
      break;
  }
  resp.status = 200;
  resp.body = bytes;
}

}  // namespace markdownd
