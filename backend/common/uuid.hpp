#pragma once

#include <string>
#include <uuid/uuid.h>

namespace common {

inline std::string generateUuid() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

} // namespace common
