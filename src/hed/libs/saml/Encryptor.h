// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_ENCRYPTOR_H__
#define __FAKEIDP_ENCRYPTOR_H__

#include <string>

namespace FakeIdP {

  /// Interface for encryption of serialized assertion.
  class Encryptor {
  public:
    virtual ~Encryptor(void) {}
    /// Encrypts assertion for holder of certificate.
    /** On success encrypted_xml holds serialized saml:EncryptedAssertion
       element wrapping xenc:EncryptedData. Returns false on failure. */
    virtual bool Encrypt(const std::string& assertion_xml,
                         const std::string& certificate,
                         std::string& encrypted_xml) = 0;
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_ENCRYPTOR_H__ */
