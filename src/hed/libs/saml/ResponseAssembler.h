// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_RESPONSEASSEMBLER_H__
#define __FAKEIDP_RESPONSEASSEMBLER_H__

#include <string>

#include <fakeidp/XMLNode.h>
#include <fakeidp/saml/ResponseContext.h>
#include <fakeidp/saml/ResponseRequest.h>

namespace FakeIdP {

  /// Builds unsigned samlp:Response document.
  /** The produced document carries complete ds:Signature skeleton with
     empty ds:DigestValue and ds:SignatureValue elements to be filled by
     DigestStage and SignatureStage. */
  class ResponseAssembler {
  public:
    /// Request and context must outlive assembler.
    ResponseAssembler(const ResponseRequest& request, const ResponseContext& context);
    /// Returns serialized document. Throws SAMLResponseError.
    std::string Assemble(void) const;
  private:
    const ResponseRequest& request_;
    const ResponseContext& context_;
    void AddAssertion(XMLNode response) const;
    void AddSignature(XMLNode assertion) const;
    void AddSubject(XMLNode assertion) const;
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_RESPONSEASSEMBLER_H__ */
