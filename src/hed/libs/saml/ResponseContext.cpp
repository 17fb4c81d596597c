// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fakeidp/GUID.h>

#include "ResponseContext.h"

namespace FakeIdP {

  #define CLOCK_SKEW             (5)
  #define CONDITIONS_VALIDITY    (60*60)
  #define CONFIRMATION_VALIDITY  (3*60)

  ResponseContext::ResponseContext(void)
    : response_id_(NewID()),
      assertion_id_(NewID()),
      instant_(Time().GetTime()) {}

  ResponseContext::ResponseContext(const std::string& response_id,
                                   const std::string& assertion_id,
                                   const Time& instant)
    : response_id_(response_id),
      assertion_id_(assertion_id),
      instant_(instant.GetTime()) {}

  std::string ResponseContext::NewID(void) {
    return "_" + UUID();
  }

  std::string ResponseContext::IssueInstant(void) const {
    return instant_.str(UTCTime);
  }

  std::string ResponseContext::NotBefore(void) const {
    return (instant_ - Period(CLOCK_SKEW)).str(UTCTime);
  }

  std::string ResponseContext::NotOnOrAfter(void) const {
    return (instant_ + Period(CONDITIONS_VALIDITY)).str(UTCTime);
  }

  std::string ResponseContext::ConfirmationNotOnOrAfter(void) const {
    return (instant_ + Period(CONFIRMATION_VALIDITY)).str(UTCTime);
  }

} // namespace FakeIdP
