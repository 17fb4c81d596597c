// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_RESPONSECONTEXT_H__
#define __FAKEIDP_RESPONSECONTEXT_H__

#include <string>

#include <fakeidp/DateTime.h>

namespace FakeIdP {

  /// Identifiers and time window of one response.
  /** Values are fixed when object is created and every time attribute
     of the response is derived from the same capture time. */
  class ResponseContext {
  public:
    /// Generates fresh identifiers and captures current time.
    ResponseContext(void);
    /// Uses given values. Time is truncated to whole seconds.
    ResponseContext(const std::string& response_id,
                    const std::string& assertion_id,
                    const Time& instant);
    /// ID of Response, also the SessionIndex
    const std::string& ResponseID(void) const { return response_id_; };
    /// ID of Assertion
    const std::string& AssertionID(void) const { return assertion_id_; };
    /// URI of signature Reference pointing to Assertion
    std::string ReferenceURI(void) const { return "#" + assertion_id_; };
    const Time& Instant(void) const { return instant_; };
    /// IssueInstant and AuthnInstant
    std::string IssueInstant(void) const;
    /// Conditions/@NotBefore, 5 seconds before instant
    std::string NotBefore(void) const;
    /// Conditions/@NotOnOrAfter, one hour after instant
    std::string NotOnOrAfter(void) const;
    /// SubjectConfirmationData/@NotOnOrAfter, 3 minutes after instant
    std::string ConfirmationNotOnOrAfter(void) const;
    /// Creates identifier of form "_" followed by UUID
    static std::string NewID(void);
  private:
    std::string response_id_;
    std::string assertion_id_;
    Time instant_;
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_RESPONSECONTEXT_H__ */
