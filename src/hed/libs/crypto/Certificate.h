// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_CERTIFICATE_H__
#define __FAKEIDP_CERTIFICATE_H__

#include <string>

#include <openssl/evp.h>
#include <openssl/x509.h>

namespace FakeIdP {

  /// Encoding of certificate or key held in memory
  typedef enum {CRED_PEM, CRED_DER, CRED_UNKNOWN} Credformat;

  /// Guesses encoding of certificate or key from its first byte.
  /** ASN.1 SEQUENCE tag means DER, anything else non-empty is taken
     for PEM. */
  Credformat GetCredFormat(const std::string& source);

  /// Parses X.509 certificate in PEM or DER encoding.
  /** Only first certificate of PEM bundle is used. Returned object must
     be freed with X509_free(). NULL is returned on failure. */
  X509* LoadCertificate(const std::string& cert);

  /// Parses RSA private key in PEM or DER encoding.
  /** Encrypted keys are not supported. Returned object must be freed
     with EVP_PKEY_free(). NULL is returned on failure or if key is not
     an RSA one. */
  EVP_PKEY* LoadPrivateKey(const std::string& key);

  /// Converts certificate in PEM or DER encoding into DER bytes.
  bool CertificateToDER(const std::string& cert, std::string& der);

} // namespace FakeIdP

#endif /* __FAKEIDP_CERTIFICATE_H__ */
