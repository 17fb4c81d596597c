// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/err.h>
#include <openssl/x509.h>

#include <fakeidp/Logger.h>
#include <fakeidp/Utils.h>

#include "OpenSSL.h"
#include "Certificate.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "Certificate");

  static void free_bio(BIO* bio) {
    BIO_free_all(bio);
  }

  Credformat GetCredFormat(const std::string& source) {
    if(source.empty()) return CRED_UNKNOWN;
    // 0x30 is ASN.1 SEQUENCE
    if(source[0] == (char)48) return CRED_DER;
    return CRED_PEM;
  }

  X509* LoadCertificate(const std::string& cert) {
    if(!OpenSSLInit()) return NULL;
    X509* x509 = NULL;
    switch(GetCredFormat(cert)) {
      case CRED_PEM: {
        logger.msg(DEBUG, "Certificate format is PEM");
        AutoPointer<BIO> certbio(BIO_new_mem_buf((void*)(cert.c_str()), cert.length()), &free_bio);
        if(!certbio) break;
        x509 = PEM_read_bio_X509(certbio.Ptr(), NULL, NULL, NULL);
      } break;
      case CRED_DER: {
        logger.msg(DEBUG, "Certificate format is DER");
        const unsigned char* cert_chr = (const unsigned char*)(cert.c_str());
        x509 = d2i_X509(NULL, &cert_chr, cert.length());
      } break;
      default:
        logger.msg(ERROR, "Certificate is empty");
        return NULL;
    };
    if(!x509) {
      logger.msg(ERROR, "Can not read certificate");
      LogOpenSSLErrors();
    };
    return x509;
  }

  EVP_PKEY* LoadPrivateKey(const std::string& key) {
    if(!OpenSSLInit()) return NULL;
    EVP_PKEY* pkey = NULL;
    switch(GetCredFormat(key)) {
      case CRED_PEM: {
        AutoPointer<BIO> keybio(BIO_new_mem_buf((void*)(key.c_str()), key.length()), &free_bio);
        if(!keybio) break;
        // Empty passphrase makes encrypted keys fail instead of prompting
        pkey = PEM_read_bio_PrivateKey(keybio.Ptr(), NULL, NULL, (void*)"");
        if(!pkey) {
          int reason = ERR_GET_REASON(ERR_peek_error());
          if(reason == PEM_R_BAD_DECRYPT) {
            logger.msg(ERROR, "Can not read PEM private key: failed to decrypt");
          } else if(reason == PEM_R_NO_START_LINE) {
            logger.msg(ERROR, "Can not read PEM private key: no PEM data found");
          } else {
            logger.msg(ERROR, "Can not read PEM private key");
          };
          LogOpenSSLErrors();
          return NULL;
        };
      } break;
      case CRED_DER: {
        const unsigned char* key_chr = (const unsigned char*)(key.c_str());
        pkey = d2i_AutoPrivateKey(NULL, &key_chr, key.length());
        if(!pkey) {
          logger.msg(ERROR, "Can not read DER private key");
          LogOpenSSLErrors();
          return NULL;
        };
      } break;
      default:
        logger.msg(ERROR, "Private key is empty");
        return NULL;
    };
    if(!pkey) {
      LogOpenSSLErrors();
      return NULL;
    };
    if(EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA) {
      logger.msg(ERROR, "Private key is not an RSA key");
      EVP_PKEY_free(pkey);
      return NULL;
    };
    return pkey;
  }

  bool CertificateToDER(const std::string& cert, std::string& der) {
    AutoPointer<X509> x509(LoadCertificate(cert), &X509_free);
    if(!x509) return false;
    unsigned char* buf = NULL;
    int len = i2d_X509(x509.Ptr(), &buf);
    if((len <= 0) || (buf == NULL)) {
      logger.msg(ERROR, "Failed to convert certificate to DER");
      LogOpenSSLErrors();
      return false;
    };
    der.assign((const char*)buf, len);
    OPENSSL_free(buf);
    return true;
  }

} // namespace FakeIdP
