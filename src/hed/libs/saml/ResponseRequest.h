// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_RESPONSEREQUEST_H__
#define __FAKEIDP_RESPONSEREQUEST_H__

#include <list>
#include <string>
#include <utility>

#include <fakeidp/IdPConfig.h>
#include <fakeidp/crypto/Digest.h>
#include <fakeidp/xmlsec/XMLSecNode.h>

namespace FakeIdP {

  /// Ordered list of attribute name and value pairs
  typedef std::list<std::pair<std::string, std::string> > AttributeList;

  /// Everything needed to produce one SAML response.
  /** Certificate and private key are held in memory in PEM or DER
     encoding. */
  class ResponseRequest {
  public:
    /// Subject identifier, rendered as e-mail address NameID
    std::string name_id;
    /// Entity of identity provider, also used as Audience
    std::string issuer_uri;
    /// Assertion consumer service URL, Destination and Recipient
    std::string acs_url;
    /// InResponseTo correlation value
    std::string request_id;
    /// Content of attribute statement in order of appearance
    AttributeList user_attributes;
    /// Hash used for reference digest and signature
    DigestAlgorithm digest_algorithm;
    /// Certificate embedded in KeyInfo and used for encryption
    std::string certificate;
    /// Signing key matching certificate
    std::string private_key;
    bool encryption_enabled;
    /// Session cipher used for encrypted assertion
    XMLSecNode::SymEncryptionType encryption_type;

    /// Defaults are SHA256 and no encryption
    ResponseRequest(void);

    /// Fills request from IdPResponse configuration document.
    /** Credentials are read from CertificatePath and KeyPath which are
       resolved relative to configuration file. Returns false and logs
       reason if document is incomplete or invalid. */
    bool LoadFromConfig(const Config& cfg);
  };

} // namespace FakeIdP

#endif /* __FAKEIDP_RESPONSEREQUEST_H__ */
