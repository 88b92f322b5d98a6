#pragma once
/*
 * TtyFile
 *
 * Purpose: owning handle for the controlling terminal stream handed to newterm().
 * Note: fclose also closes the underlying descriptor.
 */
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

class TtyFile {
public:
  TtyFile() : file_(nullptr) {}
  TtyFile(const TtyFile&) = delete;
  TtyFile& operator=(const TtyFile&) = delete;
  ~TtyFile() { close_if_needed(); }

  // read/write stream on `path`; false (and nothing held) on failure
  bool open(const char* path) {
    close_if_needed();
    int fd = ::open(path, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) return false;
    file_ = ::fdopen(fd, "r+");
    if (!file_) { ::close(fd); return false; }
    return true;
  }
  FILE* get() const { return file_; }
  void reset() { close_if_needed(); }
private:
  void close_if_needed() { if (file_) { ::fclose(file_); file_ = nullptr; } }
  FILE* file_;
};
