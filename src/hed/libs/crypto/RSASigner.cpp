// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <fakeidp/Logger.h>
#include <fakeidp/Utils.h>

#include "OpenSSL.h"
#include "Certificate.h"
#include "RSASigner.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "RSASigner");

  RSASigner::RSASigner(const std::string& key):pkey_(NULL) {
    pkey_ = LoadPrivateKey(key);
  }

  RSASigner::~RSASigner(void) {
    if(pkey_) EVP_PKEY_free(pkey_);
  }

  bool RSASigner::Sign(DigestAlgorithm alg, const std::string& data, std::string& signature) const {
    if(!pkey_) {
      logger.msg(ERROR, "No private key loaded for signing");
      return false;
    };
    const EVP_MD* md = digest_to_evp(alg);
    if(!md) return false;
    AutoPointer<EVP_MD_CTX> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx) {
      LogOpenSSLErrors();
      return false;
    };
    EVP_PKEY_CTX* pctx = NULL;
    if(EVP_DigestSignInit(ctx.Ptr(), &pctx, md, NULL, pkey_) != 1) {
      logger.msg(ERROR, "Failed to initialize %s signing", digest_to_string(alg));
      LogOpenSSLErrors();
      return false;
    };
    if(EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) != 1) {
      logger.msg(ERROR, "Failed to select PKCS#1 v1.5 padding");
      LogOpenSSLErrors();
      return false;
    };
    size_t siglen = 0;
    if((EVP_DigestSign(ctx.Ptr(), NULL, &siglen,
                       (const unsigned char*)data.c_str(), data.length()) != 1) ||
       (siglen == 0)) {
      logger.msg(ERROR, "Failed to obtain signature length");
      LogOpenSSLErrors();
      return false;
    };
    std::string buf(siglen, '\0');
    if(EVP_DigestSign(ctx.Ptr(), (unsigned char*)&buf[0], &siglen,
                      (const unsigned char*)data.c_str(), data.length()) != 1) {
      logger.msg(ERROR, "Failed to sign data");
      LogOpenSSLErrors();
      return false;
    };
    buf.resize(siglen);
    signature = buf;
    logger.msg(DEBUG, "Produced %s signature of %u bytes", digest_to_string(alg), (unsigned int)siglen);
    return true;
  }

  bool RSAVerify(const std::string& cert, DigestAlgorithm alg,
                 const std::string& data, const std::string& signature) {
    AutoPointer<X509> x509(LoadCertificate(cert), &X509_free);
    if(!x509) return false;
    AutoPointer<EVP_PKEY> pkey(X509_get_pubkey(x509.Ptr()), &EVP_PKEY_free);
    if(!pkey) {
      logger.msg(ERROR, "Failed to extract public key from certificate");
      LogOpenSSLErrors();
      return false;
    };
    const EVP_MD* md = digest_to_evp(alg);
    if(!md) return false;
    AutoPointer<EVP_MD_CTX> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx) {
      LogOpenSSLErrors();
      return false;
    };
    if(EVP_DigestVerifyInit(ctx.Ptr(), NULL, md, NULL, pkey.Ptr()) != 1) {
      LogOpenSSLErrors();
      return false;
    };
    int r = EVP_DigestVerify(ctx.Ptr(),
                             (const unsigned char*)signature.c_str(), signature.length(),
                             (const unsigned char*)data.c_str(), data.length());
    if(r != 1) {
      logger.msg(VERBOSE, "Signature does not match %s digest of data", digest_to_string(alg));
      LogOpenSSLErrors();
      return false;
    };
    return true;
  }

} // namespace FakeIdP
