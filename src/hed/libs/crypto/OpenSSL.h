// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_OPENSSL_H__
#define __FAKEIDP_OPENSSL_H__

namespace FakeIdP {

  /// Loads libcrypto error strings once per process.
  /** Safe to call from several threads and any number of times. */
  bool OpenSSLInit(void);

  /// Logs every entry of the calling thread's libcrypto error queue and clears it.
  void LogOpenSSLErrors(void);

} // namespace FakeIdP

#endif /* __FAKEIDP_OPENSSL_H__ */
