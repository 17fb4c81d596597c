// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_SAMLCONSTANTS_H__
#define __FAKEIDP_SAMLCONSTANTS_H__

#include <string>

#include <fakeidp/crypto/Digest.h>

#define SAML_NAMESPACE   "urn:oasis:names:tc:SAML:2.0:assertion"
#define SAMLP_NAMESPACE  "urn:oasis:names:tc:SAML:2.0:protocol"
#define DSIG_NAMESPACE   "http://www.w3.org/2000/09/xmldsig#"
#define XENC_NAMESPACE   "http://www.w3.org/2001/04/xmlenc#"

#define SAML_VERSION              "2.0"
#define SAML_CONSENT_UNSPECIFIED  "urn:oasis:names:tc:SAML:2.0:consent:unspecified"
#define SAML_STATUS_SUCCESS       "urn:oasis:names:tc:SAML:2.0:status:Success"
#define SAML_NAMEID_ENTITY        "urn:oasis:names:tc:SAML:2.0:nameid-format:entity"
#define SAML_NAMEID_EMAIL         "urn:oasis:names:tc:SAML:1.1:nameid-format:emailAddress"
#define SAML_CM_BEARER            "urn:oasis:names:tc:SAML:2.0:cm:bearer"
#define SAML_AUTHN_CONTEXT_CLASS  "urn:federation:authentication:windows"

#define DSIG_EXC_C14N             "http://www.w3.org/2001/10/xml-exc-c14n#"
#define DSIG_ENVELOPED_SIGNATURE  "http://www.w3.org/2000/09/xmldsig#enveloped-signature"

#define DSIG_RSA_SHA1    "http://www.w3.org/2000/09/xmldsig#rsa-sha1"
#define DSIG_RSA_SHA256  "http://www.w3.org/2001/04/xmldsig-more#rsa-sha256"
#define DSIG_RSA_SHA384  "http://www.w3.org/2001/04/xmldsig-more#rsa-sha384"
#define DSIG_RSA_SHA512  "http://www.w3.org/2001/04/xmldsig-more#rsa-sha512"

#define DSIG_SHA1        "http://www.w3.org/2000/09/xmldsig#sha1"
#define DSIG_SHA256      "http://www.w3.org/2001/04/xmlenc#sha256"
#define DSIG_SHA384      "http://www.w3.org/2001/04/xmldsig-more#sha384"
#define DSIG_SHA512      "http://www.w3.org/2001/04/xmlenc#sha512"

namespace FakeIdP {

  /// URI of ds:SignatureMethod for RSA signature with given hash
  std::string SignatureMethodURI(DigestAlgorithm alg);

  /// URI of ds:DigestMethod for given hash
  std::string DigestMethodURI(DigestAlgorithm alg);

} // namespace FakeIdP

#endif /* __FAKEIDP_SAMLCONSTANTS_H__ */
