// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include "Base64.h"

namespace FakeIdP {

  static const char alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  static int sextet(char c) {
    if ((c >= 'A') && (c <= 'Z')) return c - 'A';
    if ((c >= 'a') && (c <= 'z')) return c - 'a' + 26;
    if ((c >= '0') && (c <= '9')) return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
  }

  std::string Base64::encode(const std::string& bufplain) {
    std::string out;
    out.reserve((bufplain.length() + 2) / 3 * 4);
    std::string::size_type n = 0;
    for (; n + 3 <= bufplain.length(); n += 3) {
      unsigned long group = ((unsigned long)(unsigned char)bufplain[n] << 16) |
                            ((unsigned long)(unsigned char)bufplain[n+1] << 8) |
                            (unsigned long)(unsigned char)bufplain[n+2];
      out += alphabet[(group >> 18) & 0x3f];
      out += alphabet[(group >> 12) & 0x3f];
      out += alphabet[(group >> 6) & 0x3f];
      out += alphabet[group & 0x3f];
    }
    std::string::size_type rest = bufplain.length() - n;
    if (rest > 0) {
      unsigned long group = (unsigned long)(unsigned char)bufplain[n] << 16;
      if (rest > 1) group |= (unsigned long)(unsigned char)bufplain[n+1] << 8;
      out += alphabet[(group >> 18) & 0x3f];
      out += alphabet[(group >> 12) & 0x3f];
      out += (rest > 1) ? alphabet[(group >> 6) & 0x3f] : '=';
      out += '=';
    }
    return out;
  }

  std::string Base64::decode(const std::string& bufcoded) {
    std::string out;
    out.reserve(bufcoded.length() / 4 * 3);
    unsigned long bits = 0;
    int nbits = 0;
    for (std::string::const_iterator c = bufcoded.begin(); c != bufcoded.end(); ++c) {
      if (*c == '=') break;
      int v = sextet(*c);
      if (v < 0) continue;
      bits = ((bits << 6) | v) & 0xffffff;
      nbits += 6;
      if (nbits >= 8) {
        nbits -= 8;
        out += (char)((bits >> nbits) & 0xff);
      }
    }
    return out;
  }

} // namespace FakeIdP
