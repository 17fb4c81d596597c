// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <uuid/uuid.h>

#include "GUID.h"

std::string FakeIdP::UUID(void) {
  uuid_t uu;
  uuid_generate(uu);
  char uustr[37];
  uuid_unparse_lower(uu, uustr);
  return uustr;
}
