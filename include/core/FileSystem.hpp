#pragma once

#include <ctime>
#include <string>

#include "util/Result.hpp"

namespace markdownd {

struct FileContents {
  std::string data;
  std::time_t modified;
  FileContents() : modified(0) {}
};

// Opens path read-only and closes it again. On failure *err receives errno.
// Both helpers open with O_NONBLOCK so a FIFO in the tree cannot stall the
// poll loop.
bool CanOpen(const std::string &path, int *err);

// Whole contents of a regular file. Directories, devices and read errors are
// reported as Err with a printable reason.
Result<FileContents, std::string> ReadRegularFile(const std::string &path);

}  // namespace markdownd
