// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_ENCRYPTIONSTAGE_H__
#define __FAKEIDP_ENCRYPTIONSTAGE_H__

#include <string>

#include <fakeidp/saml/Encryptor.h>

namespace FakeIdP {

  /// Replaces saml:Assertion with its encrypted form.
  /** Takes signed serialized document and returns a new serialized
     document where saml:Assertion is substituted by fragment produced
     by Encryptor. All failures throw SAMLResponseError. */
  class EncryptionStage {
  public:
    /// Encryptor must outlive stage.
    EncryptionStage(Encryptor& encryptor, const std::string& certificate);
    std::string Process(const std::string& document) const;
  private:
    Encryptor& encryptor_;
    std::string certificate_;
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_ENCRYPTIONSTAGE_H__ */
