#pragma once

#include <unistd.h>

namespace markdownd {

// Owns one file descriptor (socket or file) and closes it on destruction.
// Copying dup()s the descriptor so std::map/std::vector can hold FDs by value.
class FD {
 public:
  FD() : m_fd(-1) {}
  explicit FD(int fd) : m_fd(fd) {}
  FD(const FD &other) : m_fd(other.m_fd >= 0 ? ::dup(other.m_fd) : -1) {}
  FD &operator=(const FD &other) {
    if (this != &other) Reset(other.m_fd >= 0 ? ::dup(other.m_fd) : -1);
    return *this;
  }
  ~FD() { Close(); }

  int Get() const { return m_fd; }
  bool Valid() const { return m_fd >= 0; }
  void Reset(int fd) {
    if (m_fd == fd) return;
    Close();
    m_fd = fd;
  }
  int Release() {
    int tmp = m_fd;
    m_fd = -1;
    return tmp;
  }

 private:
  void Close() {
    if (m_fd >= 0) {
      ::close(m_fd);
      m_fd = -1;
    }
  }

  int m_fd;
};

}  // namespace markdownd
