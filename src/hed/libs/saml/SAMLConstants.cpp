// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include "SAMLConstants.h"

namespace FakeIdP {

  std::string SignatureMethodURI(DigestAlgorithm alg) {
    switch(alg) {
      case DIGEST_SHA1: return DSIG_RSA_SHA1;
      case DIGEST_SHA256: return DSIG_RSA_SHA256;
      case DIGEST_SHA384: return DSIG_RSA_SHA384;
      case DIGEST_SHA512: return DSIG_RSA_SHA512;
    };
    return "";
  }

  std::string DigestMethodURI(DigestAlgorithm alg) {
    switch(alg) {
      case DIGEST_SHA1: return DSIG_SHA1;
      case DIGEST_SHA256: return DSIG_SHA256;
      case DIGEST_SHA384: return DSIG_SHA384;
      case DIGEST_SHA512: return DSIG_SHA512;
    };
    return "";
  }

} // namespace FakeIdP
