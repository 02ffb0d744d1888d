#include "http/HttpResponse.hpp"

#include <time.h>

#include <cctype>
#include <cstdio>
#include <cstring>

namespace markdownd {

namespace {

bool sameName(const std::string &a, const char *b) {
  size_t i = 0;
  for (; i < a.size() && b[i]; ++i) {
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
      return false;
  }
  return i == a.size() && b[i] == 0;
}

}  // namespace

const char *ReasonPhrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 206: return "Partial Content";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 408: return "Request Timeout";
    case 412: return "Precondition Failed";
    case 413: return "Payload Too Large";
    case 416: return "Range Not Satisfiable";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
  }
  return "Unknown";
}

std::string FormatHttpDate(std::time_t t) {
  std::tm gm;
  gmtime_r(&t, &gm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &gm);
  return std::string(buf);
}

bool ParseHttpDate(const std::string &s, std::time_t &out) {
  std::tm tm;
  std::memset(&tm, 0, sizeof(tm));
  const char *end = ::strptime(s.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  if (end == 0 || *end != '\0') return false;
  out = ::timegm(&tm);
  return out != (std::time_t)-1;
}

void HttpResponse::SetHeader(const std::string &name,
                             const std::string &value) {
  for (size_t i = 0; i < headers.size(); ++i) {
    if (sameName(headers[i].name, name.c_str())) {
      headers[i].value = value;
      return;
    }
  }
  HttpHeader h;
  h.name = name;
  h.value = value;
  headers.push_back(h);
}

bool HttpResponse::Header(const char *name, std::string &value) const {
  for (size_t i = 0; i < headers.size(); ++i) {
    if (sameName(headers[i].name, name)) {
      value = headers[i].value;
      return true;
    }
  }
  return false;
}

std::string HttpResponse::Serialize() const {
  std::string resp = "HTTP/1.1 ";
  char codeBuf[8];
  std::sprintf(codeBuf, "%d", status);
  resp += codeBuf;
  resp += ' ';
  resp += ReasonPhrase(status);
  resp += "\r\n";
  std::string unused;
  if (!Header("Date", unused))
    resp += "Date: " + FormatHttpDate(std::time(0)) + "\r\n";
  for (size_t i = 0; i < headers.size(); ++i) {
    if (sameName(headers[i].name, "Connection")) continue;
    resp += headers[i].name;
    resp += ": ";
    resp += headers[i].value;
    resp += "\r\n";
  }
  if (!omitBody && !Header("Content-Length", unused)) {
    char len[32];
    std::sprintf(len, "%lu", (unsigned long)body.size());
    resp += "Content-Length: ";
    resp += len;
    resp += "\r\n";
  }
  resp += "Connection: close\r\n\r\n";
  if (!omitBody) resp += body;
  return resp;
}

}  // namespace markdownd
