// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_ISTRING_H__
#define __FAKEIDP_ISTRING_H__

#include <string>
#include <ostream>

// Marks literal as user visible text in option tables
#define istring(x) (x)

namespace FakeIdP {

  /** \addtogroup common
   *  @{ */

  /// Argument adapters so that strings can be passed to %s directly.
  const char* MsgArg(const char *s);
  inline const char* MsgArg(const std::string& s) {
    return MsgArg(s.c_str());
  }
  template<class T>
  inline const T& MsgArg(const T& t) {
    return t;
  }

  /// printf-style formatting into std::string.
  std::string FormatMsg(const char *fmt, ...)
#ifdef __GNUC__
    __attribute__ ((format (printf, 1, 2)))
#endif
    ;

  /// Message text rendered from printf-style format and up to 4 arguments.
  /** NULL and empty string arguments are shown as "(null)" and "(empty)".
     \headerfile IString.h fakeidp/IString.h */
  class IString {
  public:
    IString(const std::string& m)
      : text(m) {}

    template<class T0>
    IString(const std::string& m, const T0& t0)
      : text(FormatMsg(m.c_str(), MsgArg(t0))) {}

    template<class T0, class T1>
    IString(const std::string& m, const T0& t0, const T1& t1)
      : text(FormatMsg(m.c_str(), MsgArg(t0), MsgArg(t1))) {}

    template<class T0, class T1, class T2>
    IString(const std::string& m, const T0& t0, const T1& t1, const T2& t2)
      : text(FormatMsg(m.c_str(), MsgArg(t0), MsgArg(t1), MsgArg(t2))) {}

    template<class T0, class T1, class T2, class T3>
    IString(const std::string& m, const T0& t0, const T1& t1, const T2& t2,
            const T3& t3)
      : text(FormatMsg(m.c_str(), MsgArg(t0), MsgArg(t1), MsgArg(t2), MsgArg(t3))) {}

    const std::string& str(void) const {
      return text;
    }

  private:
    std::string text;
  };

  std::ostream& operator<<(std::ostream& os, const IString& msg);

  /** @} */

} // namespace FakeIdP

#endif // __FAKEIDP_ISTRING_H__
