#pragma once

#include "common/error.hpp"

#include <cstdint>
#include <istream>
#include <string>

namespace transcode_service {

class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // returns the stored location (the key)
  virtual common::Result<std::string> put(std::istream& data,
                                          int64_t size,
                                          const std::string& key,
                                          const std::string& content_type) = 0;

  virtual common::Result<std::string> publicUrl(const std::string& location) = 0;
};

} // namespace transcode_service
