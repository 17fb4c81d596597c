// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_STRINGCONV_H__
#define __FAKEIDP_STRINGCONV_H__

#include <string>
#include <vector>

namespace FakeIdP {

  /** \addtogroup common
   *  @{ */

  /// Parses "true", "1", "false" or "0" into b.
  /** Any other text leaves b untouched and returns false. */
  bool strtobool(const std::string& s, bool& b);

  std::string upper(const std::string& s);

  /// Appends to tokens every non-empty run of characters not in delimiters.
  void tokenize(const std::string& str, std::vector<std::string>& tokens,
                const std::string& delimiters = " ");

  /// Strips characters of sep (whitespace if NULL) from both ends.
  std::string trim(const std::string& str, const char *sep = NULL);

  /** @} */

} // namespace FakeIdP

#endif // __FAKEIDP_STRINGCONV_H__
