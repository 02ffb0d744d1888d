#include "core/FileSystem.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "server/FD.hpp"

namespace markdownd {

bool CanOpen(const std::string &path, int *err) {
  FD fd(::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
  if (!fd.Valid()) {
    if (err) *err = errno;
    return false;
  }
  return true;
}

Result<FileContents, std::string> ReadRegularFile(const std::string &path) {
  typedef Result<FileContents, std::string> R;
  FD fd(::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
  if (!fd.Valid()) return R::Err(std::strerror(errno));
  struct stat st;
  if (::fstat(fd.Get(), &st) != 0) return R::Err(std::strerror(errno));
  if (!S_ISREG(st.st_mode)) return R::Err("not a regular file");

  FileContents out;
  out.modified = st.st_mtime;
  out.data.reserve((size_t)st.st_size);
  char buf[16384];
  for (;;) {
    ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      return R::Err(std::strerror(errno));
    }
    if (n == 0) break;
    out.data.append(buf, (size_t)n);
  }
  return R::Ok(out);
}

}  // namespace markdownd
