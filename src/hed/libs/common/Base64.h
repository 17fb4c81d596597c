// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_BASE64_H__
#define __FAKEIDP_BASE64_H__

#include <string>

namespace FakeIdP {

  /// Standard base 64 alphabet with padding (RFC 4648 section 4).
  /** \ingroup common
   *  \headerfile Base64.h fakeidp/Base64.h */
  class Base64 {
  public:
    /// Encodes as a single line without line breaks.
    static std::string encode(const std::string& bufplain);
    /// Decodes, skipping line breaks and other characters outside the alphabet.
    /** Decoding stops at the first '='. */
    static std::string decode(const std::string& bufcoded);
  private:
    Base64();
  };

} // namespace FakeIdP

#endif // __FAKEIDP_BASE64_H__
