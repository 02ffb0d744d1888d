#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace markdownd {

struct HttpHeader {
  std::string name;
  std::string value;
};

struct HttpRequest {
  std::string method;
  std::string uri;       // request-target exactly as received
  std::string path;      // percent-decoded path component of uri
  std::string rawQuery;  // text after '?', not decoded
  std::string version;
  std::vector<HttpHeader> headers;
  std::string body;
  bool complete;

  HttpRequest() : complete(false) {}

  // Case-insensitive header lookup; first match wins.
  bool Header(const char *name, std::string &value) const;
};

// Incremental HTTP/1.x request parser. Feed it the whole buffer received so
// far; it returns true once a complete request has been parsed.
class HttpRequestParser {
 public:
  explicit HttpRequestParser(size_t maxBodySize = 1 << 20);

  void Reset();
  bool Parse(const std::string &data, HttpRequest &request);
  size_t Consumed() const { return m_consumed; }
  bool Error() const { return m_state == kStateError; }
  // 400, 413 or 501 once Error() is true.
  int ErrorStatus() const { return m_errorStatus; }

  static const size_t kMaxHeaderBytes = 8192;

  // Splits a request-target into decoded path and raw query. Accepts
  // origin-form ("/a/b?q") and absolute-form ("http://host/a/b?q").
  static bool SplitTarget(const std::string &target, std::string &path,
                          std::string &rawQuery);
  static bool PercentDecode(const std::string &in, std::string &out);

 private:
  bool Fail(int status);
  bool ParseHead(const std::string &head, HttpRequest &request);

  enum State { kStateHead, kStateBody, kStateDone, kStateError } m_state;

  size_t m_maxBodySize;
  size_t m_contentLength;
  size_t m_consumed;
  size_t m_headerEndOffset;
  int m_errorStatus;
};

}  // namespace markdownd
