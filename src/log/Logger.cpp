#include "log/Logger.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>

namespace markdownd {

namespace {

std::string timestamp() {
  std::time_t t = std::time(0);
  std::tm tm;
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y/%m/%d %H:%M:%S", &tm);
  return std::string(buf);
}

}  // namespace

Logger::Logger() : m_out(&std::cerr) {}

Logger::Logger(std::ostream &sink) : m_out(&sink) {}

bool Logger::OpenFile(const std::string &path, std::string *err) {
  // ofstream cannot set the creation mode, so create the file first
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0660);
  if (fd < 0) {
    if (err) *err = path + ": " + std::strerror(errno);
    return false;
  }
  ::close(fd);
  m_file.open(path.c_str(), std::ios::out | std::ios::app);
  if (!m_file) {
    if (err) *err = path + ": cannot open for append";
    return false;
  }
  m_out = &m_file;
  return true;
}

void Logger::Write(const std::string &tag, const std::string &message) {
  *m_out << timestamp() << " [" << tag << "] " << message << "\n";
  m_out->flush();
}

std::string Logger::Escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = (unsigned char)text[i];
    if (c == '\\') {
      out += "\\\\";
    } else if (c < 0x20 || c == 0x7f) {
      char buf[8];
      std::sprintf(buf, "\\x%02x", (unsigned)c);
      out += buf;
    } else {
      out += (char)c;
    }
  }
  return out;
}

}  // namespace markdownd
