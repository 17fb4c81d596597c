// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_SAMLRESPONSEERROR_H__
#define __FAKEIDP_SAMLRESPONSEERROR_H__

#include <stdexcept>
#include <string>

namespace FakeIdP {

  /// Exception thrown when SAML response can not be produced.
  /** Covers invalid request data, documents missing expected elements
     and failures of canonicalization, signing or encryption. */
  class SAMLResponseError : public std::runtime_error {
  public:
    /** @param what  An explanation of the error. */
    SAMLResponseError(const std::string& what="")
      : std::runtime_error(what) {}
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_SAMLRESPONSEERROR_H__ */
