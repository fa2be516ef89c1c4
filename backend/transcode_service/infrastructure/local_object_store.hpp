#pragma once

#include "domain/object_store.hpp"

#include <filesystem>
#include <string>

namespace transcode_service {

// Object keys map to files under root; an HTTP server publishes root at public_base_url.
class LocalObjectStore : public ObjectStore {
public:
  LocalObjectStore(std::filesystem::path root, std::string public_base_url);

  common::Result<std::string> put(std::istream& data,
                                  int64_t size,
                                  const std::string& key,
                                  const std::string& content_type) override;

  common::Result<std::string> publicUrl(const std::string& location) override;

  std::filesystem::path pathFor(const std::string& key) const { return root_ / key; }

private:
  std::filesystem::path root_;
  std::string public_base_url_;
};

} // namespace transcode_service
