// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fakeidp/Logger.h>
#include <fakeidp/crypto/Certificate.h>

#include "EncryptionStage.h"
#include "ResponseAssembler.h"
#include "ResponseSigner.h"
#include "XMLSecEncryptor.h"
#include "SAMLResponse.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "SAMLResponse");

  // Data signed to check that key and certificate belong together
  #define KEY_CHECK_DATA "FakeIdP key pair check"

  SAMLResponse::SAMLResponse(const ResponseRequest& request)
    : request_(request),
      signer_(request.private_key),
      encryptor_(NULL),
      encryptor_owned_(false) {
    Validate();
    if(request_.encryption_enabled) {
      encryptor_ = new XMLSecEncryptor(request_.encryption_type);
      encryptor_owned_ = true;
    }
  }

  SAMLResponse::SAMLResponse(const ResponseRequest& request, Encryptor& encryptor)
    : request_(request),
      signer_(request.private_key),
      encryptor_(&encryptor),
      encryptor_owned_(false) {
    Validate();
  }

  SAMLResponse::~SAMLResponse(void) {
    if(encryptor_owned_) delete encryptor_;
  }

  void SAMLResponse::Validate(void) const {
    std::string der;
    if(!CertificateToDER(request_.certificate, der)) {
      logger.msg(ERROR, "Certificate could not be parsed");
      throw SAMLResponseError("Certificate is missing or malformed");
    }
    if(!signer_) {
      logger.msg(ERROR, "Private key could not be parsed");
      throw SAMLResponseError("Private key is missing or malformed");
    }
    std::string signature;
    if(!signer_.Sign(request_.digest_algorithm, KEY_CHECK_DATA, signature) ||
       !RSAVerify(request_.certificate, request_.digest_algorithm, KEY_CHECK_DATA, signature)) {
      logger.msg(ERROR, "Private key does not correspond to certificate");
      throw SAMLResponseError("Private key does not match certificate");
    }
  }

  std::string SAMLResponse::Build(void) const {
    ResponseContext context;
    return Build(context);
  }

  std::string SAMLResponse::Build(const ResponseContext& context) const {
    logger.msg(VERBOSE, "Building response %s for %s", context.ResponseID(), request_.name_id);
    try {
      std::string document = ResponseAssembler(request_, context).Assemble();
      document = DigestStage(request_.digest_algorithm, context.AssertionID()).Process(document);
      document = SignatureStage(request_.digest_algorithm, signer_).Process(document);
      if(request_.encryption_enabled) {
        if(!encryptor_) throw SAMLResponseError("No encryptor available");
        document = EncryptionStage(*encryptor_, request_.certificate).Process(document);
      }
      logger.msg(VERBOSE, "Response %s is ready", context.ResponseID());
      return document;
    } catch(SAMLResponseError& err) {
      logger.msg(ERROR, "Failed to build response %s: %s", context.ResponseID(), err.what());
      throw;
    }
  }

} // namespace FakeIdP
