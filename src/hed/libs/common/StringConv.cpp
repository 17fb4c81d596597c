// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <ctype.h>

#include "StringConv.h"

namespace FakeIdP {

  bool strtobool(const std::string& s, bool& b) {
    if ((s == "true") || (s == "1")) {
      b = true;
    } else if ((s == "false") || (s == "0")) {
      b = false;
    } else {
      return false;
    }
    return true;
  }

  std::string upper(const std::string& s) {
    std::string ret(s);
    for (std::string::iterator c = ret.begin(); c != ret.end(); ++c)
      *c = (char)toupper((unsigned char)*c);
    return ret;
  }

  void tokenize(const std::string& str, std::vector<std::string>& tokens,
                const std::string& delimiters) {
    std::string::size_type start = 0;
    for (;;) {
      start = str.find_first_not_of(delimiters, start);
      if (start == std::string::npos) break;
      std::string::size_type end = str.find_first_of(delimiters, start);
      if (end == std::string::npos) {
        tokens.push_back(str.substr(start));
        break;
      }
      tokens.push_back(str.substr(start, end - start));
      start = end;
    }
  }

  std::string trim(const std::string& str, const char *sep) {
    if (!sep) sep = " \t\r\n";
    std::string::size_type first = str.find_first_not_of(sep);
    if (first == std::string::npos) return "";
    std::string::size_type last = str.find_last_not_of(sep);
    return str.substr(first, last + 1 - first);
  }

} // namespace FakeIdP
