// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_SAMLRESPONSE_H__
#define __FAKEIDP_SAMLRESPONSE_H__

#include <string>

#include <fakeidp/crypto/RSASigner.h>
#include <fakeidp/saml/Encryptor.h>
#include <fakeidp/saml/ResponseContext.h>
#include <fakeidp/saml/ResponseRequest.h>
#include <fakeidp/saml/SAMLResponseError.h>

namespace FakeIdP {

  /// Generator of signed and optionally encrypted SAML 2.0 response.
  /** Request data is validated at construction: certificate and private
     key must parse and the key must belong to the certificate. Problems
     are reported by throwing SAMLResponseError. Each call to Build()
     runs the whole pipeline of assembling, digesting, signing and, if
     requested, encrypting a fresh document.

     Usage:
     \code
     ResponseRequest request;
     ... fill request ...
     SAMLResponse response(request);
     std::string xml = response.Build();
     \endcode */
  class SAMLResponse {
  public:
    /// Uses XMLSecEncryptor when encryption is enabled in request.
    SAMLResponse(const ResponseRequest& request);
    /// Uses given encryptor, which must outlive this object.
    SAMLResponse(const ResponseRequest& request, Encryptor& encryptor);
    ~SAMLResponse(void);
    /// Produces response with new identifiers and current time.
    std::string Build(void) const;
    /// Produces response with identifiers and time taken from context.
    std::string Build(const ResponseContext& context) const;
    const ResponseRequest& Request(void) const { return request_; };
  private:
    ResponseRequest request_;
    RSASigner signer_;
    Encryptor* encryptor_;
    bool encryptor_owned_;
    void Validate(void) const;
    SAMLResponse(const SAMLResponse&);
    SAMLResponse& operator=(const SAMLResponse&);
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_SAMLRESPONSE_H__ */
