// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <glibmm/thread.h>

#include <libxml/parser.h>

#include <xmlsec/xmlsec.h>
#include <xmlsec/errors.h>
#include <xmlsec/keys.h>
#include <xmlsec/keysmngr.h>
#include <xmlsec/crypto.h>
#include <xmlsec/openssl/evp.h>

#include <fakeidp/Logger.h>
#include <fakeidp/Utils.h>
#include <fakeidp/crypto/Certificate.h>
#include <fakeidp/crypto/OpenSSL.h>

#include "XmlSecUtils.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "XMLSec");

  static Glib::Mutex init_lock;
  static bool initialized = false;

  static void xmlsec_error(const char* /* file */, int /* line */, const char *func,
                           const char *object, const char *subject, int reason,
                           const char *msg) {
    logger.msg(VERBOSE, "xmlsec %s: %s %s: %s (reason %i)",
               func, object, subject, msg, reason);
  }

  bool init_xmlsec(void) {
    Glib::Mutex::Lock lock(init_lock);
    if(initialized) return true;
    if(!OpenSSLInit()) return false;
    xmlInitParser();
    if(xmlSecInit() < 0) {
      logger.msg(ERROR, "Failed to initialize xmlsec");
      return false;
    }
    if(xmlSecCheckVersion() != 1) {
      logger.msg(ERROR, "Loaded xmlsec library is not compatible with headers");
      xmlSecShutdown();
      return false;
    }
    xmlSecErrorsSetCallback(&xmlsec_error);
#ifdef XMLSEC_CRYPTO_DYNAMIC_LOADING
    if(xmlSecCryptoDLLoadLibrary(BAD_CAST "openssl") < 0) {
      logger.msg(ERROR, "Failed to load xmlsec OpenSSL backend");
      xmlSecShutdown();
      return false;
    }
#endif
    if((xmlSecCryptoAppInit(NULL) < 0) || (xmlSecCryptoInit() < 0)) {
      logger.msg(ERROR, "Failed to initialize xmlsec OpenSSL backend");
      xmlSecCryptoAppShutdown();
      xmlSecShutdown();
      return false;
    }
    initialized = true;
    return true;
  }

  bool final_xmlsec(void) {
    Glib::Mutex::Lock lock(init_lock);
    if(!initialized) return true;
    xmlSecCryptoShutdown();
    xmlSecCryptoAppShutdown();
    xmlSecShutdown();
    initialized = false;
    return true;
  }

  // Takes ownership of pkey in every case
  static xmlSecKeyPtr adopt_key(EVP_PKEY *pkey) {
    if(!pkey) return NULL;
    xmlSecKeyDataPtr data = xmlSecOpenSSLEvpKeyAdopt(pkey);
    if(!data) {
      EVP_PKEY_free(pkey);
      return NULL;
    }
    AutoPointer<xmlSecKey> key(xmlSecKeyCreate(), &xmlSecKeyDestroy);
    if(!key || (xmlSecKeySetValue(key.Ptr(), data) < 0)) {
      xmlSecKeyDataDestroy(data);
      return NULL;
    }
    return key.Release();
  }

  xmlSecKeyPtr xmlsec_private_key(const std::string& key) {
    xmlSecKeyPtr result = adopt_key(LoadPrivateKey(key));
    if(!result) logger.msg(ERROR, "Failed to convert private key for xmlsec");
    return result;
  }

  xmlSecKeyPtr xmlsec_public_key(const std::string& cert) {
    AutoPointer<X509> x509(LoadCertificate(cert), &X509_free);
    if(!x509) return NULL;
    xmlSecKeyPtr result = adopt_key(X509_get_pubkey(x509.Ptr()));
    if(!result) {
      LogOpenSSLErrors();
      logger.msg(ERROR, "Failed to convert certificate public key for xmlsec");
    }
    return result;
  }

  xmlSecKeysMngrPtr xmlsec_keys_manager(const std::string& cert) {
    AutoPointer<xmlSecKeysMngr> mngr(xmlSecKeysMngrCreate(), &xmlSecKeysMngrDestroy);
    if(!mngr || (xmlSecCryptoAppDefaultKeysMngrInit(mngr.Ptr()) < 0)) {
      logger.msg(ERROR, "Failed to create xmlsec keys manager");
      return NULL;
    }
    AutoPointer<xmlSecKey> key(xmlsec_public_key(cert), &xmlSecKeyDestroy);
    if(!key) return NULL;
    if(xmlSecCryptoAppDefaultKeysMngrAdoptKey(mngr.Ptr(), key.Ptr()) < 0) {
      logger.msg(ERROR, "Failed to add certificate key to keys manager");
      return NULL;
    }
    key.Release();
    return mngr.Release();
  }

} // namespace FakeIdP
