// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fakeidp/Logger.h>
#include <fakeidp/XMLNode.h>
#include <fakeidp/xmlsec/XmlSecUtils.h>

#include "SAMLConstants.h"
#include "XMLSecEncryptor.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "XMLSecEncryptor");

  XMLSecEncryptor::XMLSecEncryptor(XMLSecNode::SymEncryptionType type)
    : type_(type) {}

  XMLSecEncryptor::~XMLSecEncryptor(void) {}

  bool XMLSecEncryptor::Encrypt(const std::string& assertion_xml,
                                const std::string& certificate,
                                std::string& encrypted_xml) {
    encrypted_xml.clear();
    if(!init_xmlsec()) return false;
    XMLNode assertion(assertion_xml);
    if(!assertion) {
      logger.msg(ERROR, "Assertion to be encrypted is not well formed XML");
      return false;
    }
    // Encrypted element replaces the assertion inside the wrapper
    XMLNode wrapper(NS("saml", SAML_NAMESPACE), "saml:EncryptedAssertion");
    XMLNode data = wrapper.NewChild(assertion);
    XMLSecNode secnode(data);
    if(!secnode.EncryptNode(certificate, type_)) {
      logger.msg(ERROR, "Failed to encrypt assertion");
      return false;
    }
    wrapper.GetXML(encrypted_xml);
    return true;
  }

} // namespace FakeIdP
