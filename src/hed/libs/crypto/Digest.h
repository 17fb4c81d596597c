// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_DIGEST_H__
#define __FAKEIDP_DIGEST_H__

#include <string>

#include <openssl/evp.h>

namespace FakeIdP {

  /// Hash algorithms usable for reference digests and RSA signatures.
  typedef enum {
    DIGEST_SHA1,
    DIGEST_SHA256,
    DIGEST_SHA384,
    DIGEST_SHA512
  } DigestAlgorithm;

  /// Parses algorithm name like "SHA256" or "sha-256".
  /** Comparison is case-insensitive and a dash after "SHA" is accepted.
     Returns false for any other name; there is no fallback algorithm. */
  bool string_to_digest(const std::string& name, DigestAlgorithm& alg);

  /// Returns canonical name of algorithm, e.g. "SHA256".
  std::string digest_to_string(DigestAlgorithm alg);

  /// Returns OpenSSL message digest implementing the algorithm.
  const EVP_MD* digest_to_evp(DigestAlgorithm alg);

  /// Computes binary digest of data.
  /** On failure false is returned and OpenSSL errors are logged. */
  bool Digest(DigestAlgorithm alg, const std::string& data, std::string& out);

} // namespace FakeIdP

#endif /* __FAKEIDP_DIGEST_H__ */
