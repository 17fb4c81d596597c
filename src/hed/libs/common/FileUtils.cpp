// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <sys/stat.h>

#include "FileUtils.h"

namespace FakeIdP {

  static bool write_all(int h, const char *buf, size_t size) {
    for (;size > 0;) {
      ssize_t l = ::write(h, buf, size);
      if (l == -1) {
        if (errno == EINTR) continue;
        return false;
      }
      size -= l;
      buf += l;
    }
    return true;
  }

  bool FileRead(const std::string& filename, std::string& data) {
    data.clear();
    int h = ::open(filename.c_str(), O_RDONLY);
    if (h == -1) return false;
    char buf[1024];
    for (;;) {
      ssize_t l = ::read(h, buf, sizeof(buf));
      if (l == -1) {
        if (errno == EINTR) continue;
        int err = errno;
        ::close(h);
        errno = err;
        return false;
      }
      if (l == 0) break;
      data += std::string(buf, l);
    }
    ::close(h);
    return true;
  }

  bool FileCreate(const std::string& filename, const std::string& data, mode_t mode) {
    if (mode == 0) mode = S_IRUSR|S_IWUSR|S_IRGRP|S_IROTH;
    std::string tempfile = filename + ".XXXXXX";
    int h = ::mkstemp(const_cast<char*>(tempfile.c_str()));
    if (h == -1) return false;
    if (!write_all(h, data.c_str(), data.length())) {
      ::close(h);
      ::unlink(tempfile.c_str());
      return false;
    }
    ::close(h);
    if (::chmod(tempfile.c_str(), mode) != 0) { ::unlink(tempfile.c_str()); return false; }
    if (::rename(tempfile.c_str(), filename.c_str()) != 0) { ::unlink(tempfile.c_str()); return false; }
    return true;
  }

} // namespace FakeIdP
