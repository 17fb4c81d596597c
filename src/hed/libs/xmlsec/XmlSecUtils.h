// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_XMLSECUTILS_H__
#define __FAKEIDP_XMLSECUTILS_H__

#include <string>

#include <xmlsec/crypto.h>

namespace FakeIdP {

  /// Initializes xmlsec with its OpenSSL backend.
  /** Must succeed before XMLSecNode signs, verifies, encrypts or decrypts.
     Repeated calls do nothing. xmlsec diagnostics are passed to the logger. */
  bool init_xmlsec(void);
  /// Undoes init_xmlsec(). Later init_xmlsec() initializes again.
  bool final_xmlsec(void);

  /// RSA private key (PEM or DER) as xmlsec key. Caller owns result, NULL on failure.
  xmlSecKeyPtr xmlsec_private_key(const std::string& key);
  /// Public key of certificate (PEM or DER) as xmlsec key. Caller owns result, NULL on failure.
  xmlSecKeyPtr xmlsec_public_key(const std::string& cert);
  /// New keys manager holding only the public key of cert. Caller owns result.
  xmlSecKeysMngrPtr xmlsec_keys_manager(const std::string& cert);

} // namespace FakeIdP

#endif /* __FAKEIDP_XMLSECUTILS_H__ */
