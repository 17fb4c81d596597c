// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <glibmm/thread.h>

#include <fakeidp/Logger.h>

#include "OpenSSL.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "OpenSSL");

  static Glib::Mutex init_lock;
  static bool initialized = false;

  bool OpenSSLInit(void) {
    Glib::Mutex::Lock lock(init_lock);
    if(initialized) return true;
    if(OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS, NULL) != 1) {
      logger.msg(ERROR, "Failed to initialize libcrypto");
      LogOpenSSLErrors();
      return false;
    }
    initialized = true;
    return true;
  }

  void LogOpenSSLErrors(void) {
    char text[256];
    unsigned long code;
    while((code = ERR_get_error()) != 0) {
      ERR_error_string_n(code, text, sizeof(text));
      logger.msg(VERBOSE, "libcrypto: %s", text);
    }
  }

} // namespace FakeIdP
