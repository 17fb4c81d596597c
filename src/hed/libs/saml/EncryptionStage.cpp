// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fakeidp/Logger.h>
#include <fakeidp/XMLNode.h>

#include "SAMLConstants.h"
#include "SAMLResponseError.h"
#include "EncryptionStage.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "EncryptionStage");

  static XMLNode find_assertion(const XMLNode& doc) {
    if(!doc) throw SAMLResponseError("Response document is not well formed XML");
    XMLNodeList assertions = doc.XPathLookup("//saml:Assertion", NS("saml", SAML_NAMESPACE));
    if(assertions.size() != 1) {
      logger.msg(ERROR, "Expected exactly one saml:Assertion in document, found %u",
                 (unsigned int)assertions.size());
      throw SAMLResponseError("Response document must contain exactly one saml:Assertion");
    }
    return assertions.front();
  }

  EncryptionStage::EncryptionStage(Encryptor& encryptor, const std::string& certificate)
    : encryptor_(encryptor),
      certificate_(certificate) {}

  std::string EncryptionStage::Process(const std::string& document) const {
    XMLNode working(document);
    std::string assertion_xml;
    find_assertion(working).GetXML(assertion_xml);

    std::string encrypted_xml;
    if(!encryptor_.Encrypt(assertion_xml, certificate_, encrypted_xml))
      throw SAMLResponseError("Failed to encrypt assertion");
    XMLNode fragment(encrypted_xml);
    if(!fragment || !MatchXMLName(fragment, "EncryptedAssertion") || !fragment["EncryptedData"]) {
      logger.msg(ERROR, "Encryptor produced unexpected fragment: %s", encrypted_xml);
      throw SAMLResponseError("Encryptor did not produce saml:EncryptedAssertion");
    }

    XMLNode copy(document);
    XMLNode target = find_assertion(copy);
    target.Replace(fragment);
    std::string xml;
    copy.GetDoc(xml);
    logger.msg(VERBOSE, "Replaced assertion with encrypted assertion");
    return xml;
  }

} // namespace FakeIdP
