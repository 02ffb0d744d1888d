#pragma once

#include <cstddef>
#include <ctime>
#include <string>

#include "http/HttpRequest.hpp"
#include "http/HttpResponse.hpp"

namespace markdownd {

// Content type registered for the file's extension, or 0.
const char *MimeTypeByExtension(const std::string &path);

enum RangeStatus {
  kRangeNone,           // no usable Range header: send the whole file
  kRangeSatisfiable,    // offset/length filled in
  kRangeUnsatisfiable,  // 416
  kRangeMalformed       // 416 without Content-Range
};

// Single "bytes=" range against a body of size bytes. Multiple ranges are
// reported as kRangeNone.
RangeStatus ParseByteRange(const std::string &header, size_t size,
                           size_t &offset, size_t &length);

// Generic static delivery of an already verified and read file: content type
// by extension (falling back to sniffedType), Last-Modified, conditional GET
// and byte ranges. Fills status, headers and body of resp.
void ServeStaticFile(const HttpRequest &request, const std::string &path,
                     const std::string &bytes, std::time_t modified,
                     const std::string &sniffedType, HttpResponse &resp);

}  // namespace markdownd
