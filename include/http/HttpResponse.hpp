#pragma once

#include <ctime>
#include <string>
#include <vector>

#include "http/HttpRequest.hpp"

namespace markdownd {

struct HttpResponse {
  int status;
  std::vector<HttpHeader> headers;
  std::string body;
  bool omitBody;  // 304 and friends: headers only

  HttpResponse() : status(200), omitBody(false) {}

  // Replaces any existing header of the same name (case-insensitive).
  void SetHeader(const std::string &name, const std::string &value);
  bool Header(const char *name, std::string &value) const;

  // Full HTTP/1.1 wire form with Content-Length, Date and
  // "Connection: close" added.
  std::string Serialize() const;
};

const char *ReasonPhrase(int status);

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string FormatHttpDate(std::time_t t);
// Accepts IMF-fixdate only; returns false on anything else.
bool ParseHttpDate(const std::string &s, std::time_t &out);

}  // namespace markdownd
