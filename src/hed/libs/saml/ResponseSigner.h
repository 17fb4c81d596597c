// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_RESPONSESIGNER_H__
#define __FAKEIDP_RESPONSESIGNER_H__

#include <string>

#include <fakeidp/crypto/Digest.h>
#include <fakeidp/crypto/RSASigner.h>

namespace FakeIdP {

  /// Computes reference digest of assertion.
  /** Takes serialized document produced by ResponseAssembler and returns
     a new serialized document with ds:DigestValue filled. The digest
     covers exclusive canonical form of element with ID attribute equal
     to assertion_id, with ds:Signature removed. Input is not modified.
     All failures throw SAMLResponseError. */
  class DigestStage {
  public:
    DigestStage(DigestAlgorithm alg, const std::string& assertion_id);
    std::string Process(const std::string& document) const;
    /// Computes digest value without updating document.
    std::string DigestValue(const std::string& document) const;
  private:
    DigestAlgorithm alg_;
    std::string assertion_id_;
  };

  /// Computes signature over ds:SignedInfo.
  /** Takes serialized document with ds:DigestValue filled and returns
     a new serialized document with ds:SignatureValue filled. All
     failures throw SAMLResponseError. */
  class SignatureStage {
  public:
    /// Signer must outlive stage.
    SignatureStage(DigestAlgorithm alg, const RSASigner& signer);
    std::string Process(const std::string& document) const;
  private:
    DigestAlgorithm alg_;
    const RSASigner& signer_;
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_RESPONSESIGNER_H__ */
