// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <stdarg.h>
#include <stdio.h>

#include <vector>

#include "IString.h"

namespace FakeIdP {

  const char* MsgArg(const char *s) {
    if (!s) return "(null)";
    if (!*s) return "(empty)";
    return s;
  }

  std::string FormatMsg(const char *fmt, ...) {
    char buf[512];
    va_list ap;
    va_start(ap, fmt);
    int len = vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (len < 0) return fmt;
    if ((size_t)len < sizeof(buf)) return std::string(buf, len);
    // Canonical forms and decrypted fragments do not fit the stack buffer
    std::vector<char> big(len + 1);
    va_start(ap, fmt);
    vsnprintf(&big[0], big.size(), fmt, ap);
    va_end(ap);
    return std::string(&big[0], len);
  }

  std::ostream& operator<<(std::ostream& os, const IString& msg) {
    return os << msg.str();
  }

} // namespace FakeIdP
