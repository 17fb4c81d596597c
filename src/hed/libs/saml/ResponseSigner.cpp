// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fakeidp/Base64.h>
#include <fakeidp/Logger.h>
#include <fakeidp/XMLNode.h>
#include <fakeidp/xmlsec/XMLSecNode.h>

#include "SAMLConstants.h"
#include "SAMLResponseError.h"
#include "ResponseSigner.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "ResponseSigner");

  static void check_document(const XMLNode& doc) {
    if(!doc) {
      logger.msg(ERROR, "Failed to parse response document");
      throw SAMLResponseError("Response document is not well formed XML");
    }
  }

  // Finds the only element matching path or throws
  static XMLNode find_single(const XMLNode& doc, const std::string& path, const char* what) {
    NS ns("ds", DSIG_NAMESPACE);
    XMLNodeList nodes = doc.XPathLookup(path, ns);
    if(nodes.size() != 1) {
      logger.msg(ERROR, "Expected exactly one %s in document, found %u", what, (unsigned int)nodes.size());
      throw SAMLResponseError(std::string("Response document must contain exactly one ") + what);
    }
    return nodes.front();
  }

  static std::string canonicalize(XMLNode node, const char* what) {
    XMLSecNode secnode(node);
    std::string canonical;
    if(!secnode.Canonicalize(canonical))
      throw SAMLResponseError(std::string("Failed to canonicalize ") + what);
    return canonical;
  }

  DigestStage::DigestStage(DigestAlgorithm alg, const std::string& assertion_id)
    : alg_(alg),
      assertion_id_(assertion_id) {}

  std::string DigestStage::DigestValue(const std::string& document) const {
    XMLNode working(document);
    check_document(working);
    // Signature is never part of its own digest
    find_single(working, "//ds:Signature", "ds:Signature").Destroy();
    // Identifiers are generated from UUIDs and never contain quotes
    XMLNode assertion = find_single(working, "//*[@ID='" + assertion_id_ + "']", "element with assertion ID");
    std::string canonical = canonicalize(assertion, "assertion");
    std::string digest;
    if(!Digest(alg_, canonical, digest))
      throw SAMLResponseError("Failed to compute " + digest_to_string(alg_) + " digest of assertion");
    return Base64::encode(digest);
  }

  std::string DigestStage::Process(const std::string& document) const {
    std::string value = DigestValue(document);
    XMLNode copy(document);
    check_document(copy);
    find_single(copy, "//ds:DigestValue", "ds:DigestValue") = value;
    std::string xml;
    copy.GetDoc(xml);
    logger.msg(VERBOSE, "Computed %s digest of assertion %s", digest_to_string(alg_), assertion_id_);
    return xml;
  }

  SignatureStage::SignatureStage(DigestAlgorithm alg, const RSASigner& signer)
    : alg_(alg),
      signer_(signer) {}

  std::string SignatureStage::Process(const std::string& document) const {
    XMLNode working(document);
    check_document(working);
    XMLNode signed_info = find_single(working, "//ds:Signature/ds:SignedInfo", "ds:SignedInfo");
    if(((std::string)signed_info["Reference"]["DigestValue"]).empty())
      throw SAMLResponseError("Reference digest must be computed before signing");
    std::string canonical = canonicalize(signed_info, "ds:SignedInfo");
    std::string signature;
    if(!signer_.Sign(alg_, canonical, signature))
      throw SAMLResponseError("Failed to sign ds:SignedInfo with " + digest_to_string(alg_));
    std::string value = Base64::encode(signature);

    XMLNode copy(document);
    check_document(copy);
    find_single(copy, "//ds:SignatureValue", "ds:SignatureValue") = value;
    std::string xml;
    copy.GetDoc(xml);
    logger.msg(VERBOSE, "Signed response with %s", SignatureMethodURI(alg_));
    return xml;
  }

} // namespace FakeIdP
