// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_XMLSECENCRYPTOR_H__
#define __FAKEIDP_XMLSECENCRYPTOR_H__

#include <string>

#include <fakeidp/saml/Encryptor.h>
#include <fakeidp/xmlsec/XMLSecNode.h>

namespace FakeIdP {

  /// Encryptor implemented with XML Encryption of xmlsec library.
  /** Assertion is encrypted as Element with AES-CBC session key which
     is transported with RSA-OAEP to public key of certificate. */
  class XMLSecEncryptor : public Encryptor {
  public:
    XMLSecEncryptor(XMLSecNode::SymEncryptionType type = XMLSecNode::AES_128);
    virtual ~XMLSecEncryptor(void);
    virtual bool Encrypt(const std::string& assertion_xml,
                         const std::string& certificate,
                         std::string& encrypted_xml);
  private:
    XMLSecNode::SymEncryptionType type_;
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_XMLSECENCRYPTOR_H__ */
