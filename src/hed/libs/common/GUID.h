// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_GUID_H__
#define __FAKEIDP_GUID_H__

#include <string>

namespace FakeIdP {

  /// Generates a unique identifier using the system uuid library
  /** The result has the form 12345678-90ab-cdef-1234-567890abcdef */
  std::string UUID(void);

} // namespace FakeIdP

#endif // __FAKEIDP_GUID_H__
