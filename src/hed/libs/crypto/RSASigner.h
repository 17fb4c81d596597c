// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_RSASIGNER_H__
#define __FAKEIDP_RSASIGNER_H__

#include <string>

#include <openssl/evp.h>

#include <fakeidp/crypto/Digest.h>

namespace FakeIdP {

  /// Produces RSA PKCS#1 v1.5 signatures with a private key.
  /** The key is parsed once at construction. If parsing fails the object
     is invalid and Sign() always fails. */
  class RSASigner {
   public:
    /// Parses private key in PEM or DER encoding.
    RSASigner(const std::string& key);
    ~RSASigner(void);
    /// Returns true if key was loaded.
    operator bool(void) const { return (pkey_ != NULL); };
    bool operator!(void) const { return (pkey_ == NULL); };
    /// Signs data hashed with algorithm alg. Binary signature is stored in signature.
    bool Sign(DigestAlgorithm alg, const std::string& data, std::string& signature) const;
   private:
    EVP_PKEY* pkey_;
    RSASigner(const RSASigner&);
    RSASigner& operator=(const RSASigner&);
  };

  /// Verifies RSA PKCS#1 v1.5 signature with public key of certificate.
  /** Certificate may be in PEM or DER encoding. */
  bool RSAVerify(const std::string& cert, DigestAlgorithm alg,
                 const std::string& data, const std::string& signature);

} // namespace FakeIdP

#endif /* __FAKEIDP_RSASIGNER_H__ */
