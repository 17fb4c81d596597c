// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_FILEUTILS_H__
#define __FAKEIDP_FILEUTILS_H__

#include <string>

#include <sys/types.h>

namespace FakeIdP {

  /** \addtogroup common
   *  @{ */

  /// Simple method to read whole file content from filename.
  /** Content is returned unchanged, binary data included. On failure
      errno is left as set by the failing call. */
  bool FileRead(const std::string& filename, std::string& data);

  /// Simple method to create a new file containing given data.
  /** Data is written into a temporary file first which then replaces
      filename. If mode is 0 the file gets rw-r--r--. */
  bool FileCreate(const std::string& filename, const std::string& data, mode_t mode = 0);

  /** @} */

} // namespace FakeIdP

#endif // __FAKEIDP_FILEUTILS_H__
