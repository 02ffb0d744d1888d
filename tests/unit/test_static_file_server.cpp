#include <criterion/criterion.h>

#include <ctime>
#include <string>

#include "core/StaticFileServer.hpp"
#include "http/HttpRequest.hpp"
#include "http/HttpResponse.hpp"

using namespace markdownd;

namespace {

const std::time_t kModified = 784111777;  // Sun, 06 Nov 1994 08:49:37 GMT

HttpRequest get(const char *header = 0, const char *value = 0) {
  HttpRequest req;
  req.method = "GET";
  req.uri = "/f";
  req.path = "/f";
  if (header) {
    HttpHeader h;
    h.name = header;
    h.value = value;
    req.headers.push_back(h);
  }
  return req;
}

std::string header(const HttpResponse &resp, const char *name) {
  std::string v;
  resp.Header(name, v);
  return v;
}

}  // namespace

Test(StaticFileServer, mime_by_extension) {
  cr_assert_str_eq(MimeTypeByExtension("/a/style.css"),
                   "text/css; charset=utf-8");
  cr_assert_str_eq(MimeTypeByExtension("/a/IMG.PNG"), "image/png");
  cr_assert_str_eq(MimeTypeByExtension("/a/x.md"),
                   "text/markdown; charset=utf-8");
  cr_assert(MimeTypeByExtension("/a/unknown.xyz") == 0);
  cr_assert(MimeTypeByExtension("/a/noext") == 0);
}

Test(StaticFileServer, full_body_with_headers) {
  HttpResponse resp;
  ServeStaticFile(get(), "/r/app.js", "var x;", kModified,
                  "text/plain; charset=utf-8", resp);
  cr_assert_eq(resp.status, 200);
  cr_assert_str_eq(resp.body.c_str(), "var x;");
  cr_assert_str_eq(header(resp, "Content-Type").c_str(),
                   "text/javascript; charset=utf-8");
  cr_assert_str_eq(header(resp, "Last-Modified").c_str(),
                   "Sun, 06 Nov 1994 08:49:37 GMT");
  cr_assert_str_eq(header(resp, "Accept-Ranges").c_str(), "bytes");
}

Test(StaticFileServer, unknown_extension_uses_sniffed_type) {
  HttpResponse resp;
  ServeStaticFile(get(), "/r/blob", "data", kModified,
                  "application/octet-stream", resp);
  cr_assert_str_eq(header(resp, "Content-Type").c_str(),
                   "application/octet-stream");
}

Test(StaticFileServer, if_modified_since) {
  HttpResponse fresh;
  ServeStaticFile(get("If-Modified-Since", "Sun, 06 Nov 1994 08:49:37 GMT"),
                  "/r/a.txt", "hello", kModified, "", fresh);
  cr_assert_eq(fresh.status, 304);
  cr_assert(fresh.omitBody);
  cr_assert(fresh.body.empty());

  HttpResponse stale;
  ServeStaticFile(get("If-Modified-Since", "Sat, 05 Nov 1994 08:49:37 GMT"),
                  "/r/a.txt", "hello", kModified, "", stale);
  cr_assert_eq(stale.status, 200);
  cr_assert_str_eq(stale.body.c_str(), "hello");
}

Test(StaticFileServer, if_unmodified_since) {
  HttpResponse resp;
  ServeStaticFile(get("If-Unmodified-Since", "Sat, 05 Nov 1994 08:49:37 GMT"),
                  "/r/a.txt", "hello", kModified, "", resp);
  cr_assert_eq(resp.status, 412);
  cr_assert(resp.body.empty());
}

Test(StaticFileServer, byte_ranges) {
  HttpResponse mid;
  ServeStaticFile(get("Range", "bytes=1-3"), "/r/a.txt", "0123456789",
                  kModified, "", mid);
  cr_assert_eq(mid.status, 206);
  cr_assert_str_eq(mid.body.c_str(), "123");
  cr_assert_str_eq(header(mid, "Content-Range").c_str(), "bytes 1-3/10");

  HttpResponse open;
  ServeStaticFile(get("Range", "bytes=7-"), "/r/a.txt", "0123456789",
                  kModified, "", open);
  cr_assert_str_eq(open.body.c_str(), "789");

  HttpResponse suffix;
  ServeStaticFile(get("Range", "bytes=-2"), "/r/a.txt", "0123456789",
                  kModified, "", suffix);
  cr_assert_str_eq(suffix.body.c_str(), "89");
  cr_assert_str_eq(header(suffix, "Content-Range").c_str(), "bytes 8-9/10");
}

Test(StaticFileServer, bad_ranges) {
  HttpResponse past;
  ServeStaticFile(get("Range", "bytes=20-"), "/r/a.txt", "0123456789",
                  kModified, "", past);
  cr_assert_eq(past.status, 416);
  cr_assert_str_eq(header(past, "Content-Range").c_str(), "bytes */10");

  HttpResponse malformed;
  ServeStaticFile(get("Range", "items=1-2"), "/r/a.txt", "0123456789",
                  kModified, "", malformed);
  cr_assert_eq(malformed.status, 416);
  cr_assert(header(malformed, "Content-Range").empty());

  HttpResponse multi;
  ServeStaticFile(get("Range", "bytes=0-1,4-5"), "/r/a.txt", "0123456789",
                  kModified, "", multi);
  cr_assert_eq(multi.status, 200);
  cr_assert_str_eq(multi.body.c_str(), "0123456789");
}

Test(StaticFileServer, parse_byte_range) {
  size_t off = 0;
  size_t len = 0;
  cr_assert_eq(ParseByteRange("", 10, off, len), kRangeNone);
  cr_assert_eq(ParseByteRange("bytes=2-100", 10, off, len), kRangeSatisfiable);
  cr_assert_eq(off, (size_t)2);
  cr_assert_eq(len, (size_t)8);
  cr_assert_eq(ParseByteRange("bytes=5-2", 10, off, len), kRangeMalformed);
  cr_assert_eq(ParseByteRange("bytes=-0", 10, off, len), kRangeUnsatisfiable);
  cr_assert_eq(ParseByteRange("bytes=0-", 0, off, len), kRangeUnsatisfiable);
  cr_assert_eq(ParseByteRange("bytes=a-b", 10, off, len), kRangeMalformed);
}
