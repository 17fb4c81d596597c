// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <openssl/evp.h>

#include <fakeidp/Logger.h>
#include <fakeidp/StringConv.h>
#include <fakeidp/Utils.h>

#include "OpenSSL.h"
#include "Digest.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "Digest");

  bool string_to_digest(const std::string& name, DigestAlgorithm& alg) {
    std::string n = upper(trim(name));
    if((n.length() > 4) && (n.compare(0,4,"SHA-") == 0)) n.erase(3,1);
    if(n == "SHA1") {
      alg = DIGEST_SHA1;
    } else if(n == "SHA256") {
      alg = DIGEST_SHA256;
    } else if(n == "SHA384") {
      alg = DIGEST_SHA384;
    } else if(n == "SHA512") {
      alg = DIGEST_SHA512;
    } else {
      return false;
    };
    return true;
  }

  std::string digest_to_string(DigestAlgorithm alg) {
    switch(alg) {
      case DIGEST_SHA1: return "SHA1";
      case DIGEST_SHA256: return "SHA256";
      case DIGEST_SHA384: return "SHA384";
      case DIGEST_SHA512: return "SHA512";
    };
    return "";
  }

  const EVP_MD* digest_to_evp(DigestAlgorithm alg) {
    switch(alg) {
      case DIGEST_SHA1: return EVP_sha1();
      case DIGEST_SHA256: return EVP_sha256();
      case DIGEST_SHA384: return EVP_sha384();
      case DIGEST_SHA512: return EVP_sha512();
    };
    return NULL;
  }

  bool Digest(DigestAlgorithm alg, const std::string& data, std::string& out) {
    const EVP_MD* md = digest_to_evp(alg);
    if(!md) {
      logger.msg(ERROR, "Unsupported digest algorithm");
      return false;
    };
    AutoPointer<EVP_MD_CTX> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx) {
      logger.msg(ERROR, "Failed to allocate digest context");
      LogOpenSSLErrors();
      return false;
    };
    unsigned char md_value[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if((EVP_DigestInit_ex(ctx.Ptr(), md, NULL) != 1) ||
       (EVP_DigestUpdate(ctx.Ptr(), data.c_str(), data.length()) != 1) ||
       (EVP_DigestFinal_ex(ctx.Ptr(), md_value, &md_len) != 1)) {
      logger.msg(ERROR, "Failed to compute %s digest", digest_to_string(alg));
      LogOpenSSLErrors();
      return false;
    };
    out.assign((const char*)md_value, md_len);
    return true;
  }

} // namespace FakeIdP
