#include "http/HttpRequest.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace markdownd {

namespace {

std::string trim(const std::string &s) {
  size_t a = 0;
  while (a < s.size() &&
         (s[a] == ' ' || s[a] == '\t' || s[a] == '\r' || s[a] == '\n'))
    ++a;
  size_t b = s.size();
  while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' ||
                   s[b - 1] == '\n'))
    --b;
  return s.substr(a, b - a);
}

bool equalsIgnoreCase(const std::string &a, const char *b) {
  size_t i = 0;
  for (; i < a.size() && b[i]; ++i) {
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
      return false;
  }
  return i == a.size() && b[i] == 0;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

}  // namespace

bool HttpRequest::Header(const char *name, std::string &value) const {
  for (size_t i = 0; i < headers.size(); ++i) {
    if (equalsIgnoreCase(headers[i].name, name)) {
      value = headers[i].value;
      return true;
    }
  }
  return false;
}

HttpRequestParser::HttpRequestParser(size_t maxBodySize)
    : m_state(kStateHead),
      m_maxBodySize(maxBodySize),
      m_contentLength(0),
      m_consumed(0),
      m_headerEndOffset(0),
      m_errorStatus(0) {}

void HttpRequestParser::Reset() {
  m_state = kStateHead;
  m_contentLength = 0;
  m_consumed = 0;
  m_headerEndOffset = 0;
  m_errorStatus = 0;
}

bool HttpRequestParser::Fail(int status) {
  m_state = kStateError;
  m_errorStatus = status;
  return false;
}

bool HttpRequestParser::PercentDecode(const std::string &in,
                                      std::string &out) {
  std::string decoded;
  decoded.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') {
      decoded += in[i];
      continue;
    }
    if (i + 2 >= in.size()) return false;
    int hi = hexValue(in[i + 1]);
    int lo = hexValue(in[i + 2]);
    if (hi < 0 || lo < 0) return false;
    decoded += (char)((hi << 4) | lo);
    i += 2;
  }
  out.swap(decoded);
  return true;
}

bool HttpRequestParser::SplitTarget(const std::string &target,
                                    std::string &path, std::string &rawQuery) {
  std::string rest = target;
  std::string::size_type scheme = rest.find("://");
  if (scheme != std::string::npos && rest[0] != '/') {
    std::string::size_type slash = rest.find('/', scheme + 3);
    rest = slash == std::string::npos ? "/" : rest.substr(slash);
  }
  if (rest.empty() || rest[0] != '/') return false;
  std::string::size_type hash = rest.find('#');
  if (hash != std::string::npos) rest.erase(hash);
  std::string::size_type q = rest.find('?');
  std::string rawPath = rest;
  rawQuery.clear();
  if (q != std::string::npos) {
    rawPath = rest.substr(0, q);
    rawQuery = rest.substr(q + 1);
  }
  return PercentDecode(rawPath, path);
}

bool HttpRequestParser::ParseHead(const std::string &head,
                                  HttpRequest &req) {
  size_t pos = 0;
  bool first = true;
  while (pos < head.size()) {
    size_t eol = head.find("\r\n", pos);
    if (eol == std::string::npos) eol = head.size();
    std::string line = head.substr(pos, eol - pos);
    pos = eol + 2;
    if (first) {
      first = false;
      size_t m1 = line.find(' ');
      if (m1 == std::string::npos) return Fail(400);
      size_t m2 = line.find(' ', m1 + 1);
      if (m2 == std::string::npos) return Fail(400);
      req.method = line.substr(0, m1);
      req.uri = line.substr(m1 + 1, m2 - m1 - 1);
      req.version = line.substr(m2 + 1);
      if (req.method.empty() || req.version.compare(0, 5, "HTTP/") != 0)
        return Fail(400);
      if (!SplitTarget(req.uri, req.path, req.rawQuery)) return Fail(400);
      continue;
    }
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) return Fail(400);
    HttpHeader h;
    h.name = trim(line.substr(0, colon));
    h.value = trim(line.substr(colon + 1));
    req.headers.push_back(h);
    if (equalsIgnoreCase(h.name, "Content-Length")) {
      char *end = 0;
      errno = 0;
      unsigned long n = std::strtoul(h.value.c_str(), &end, 10);
      if (h.value.empty() || *end != '\0' || errno != 0) return Fail(400);
      m_contentLength = (size_t)n;
    } else if (equalsIgnoreCase(h.name, "Transfer-Encoding") &&
               !equalsIgnoreCase(h.value, "identity")) {
      return Fail(501);
    }
  }
  if (first) return Fail(400);
  if (m_contentLength > m_maxBodySize) return Fail(413);
  return true;
}

bool HttpRequestParser::Parse(const std::string &data, HttpRequest &req) {
  if (m_state == kStateDone) return true;
  if (m_state == kStateError) return false;
  if (m_state == kStateHead) {
    size_t hdrEnd = data.find("\r\n\r\n");
    if (hdrEnd == std::string::npos) {
      if (data.size() > kMaxHeaderBytes) return Fail(400);
      return false;  // need more
    }
    if (hdrEnd > kMaxHeaderBytes) return Fail(400);
    if (!ParseHead(data.substr(0, hdrEnd), req)) return false;
    m_headerEndOffset = hdrEnd + 4;
    m_state = kStateBody;
  }
  size_t have = data.size() - m_headerEndOffset;
  if (have < m_contentLength) return false;
  req.body = data.substr(m_headerEndOffset, m_contentLength);
  m_consumed = m_headerEndOffset + m_contentLength;
  m_state = kStateDone;
  req.complete = true;
  return true;
}

}  // namespace markdownd
