#include "local_object_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace transcode_service {

namespace {

bool validKey(const std::string& key) {
  if (key.empty() || key.front() == '/') return false;
  for (const auto& part : std::filesystem::path(key)) {
    if (part == "..") return false;
  }
  return true;
}

} // namespace

LocalObjectStore::LocalObjectStore(std::filesystem::path root, std::string public_base_url)
  : root_(std::move(root)), public_base_url_(std::move(public_base_url)) {
  while (!public_base_url_.empty() && public_base_url_.back() == '/') {
    public_base_url_.pop_back();
  }
}

common::Result<std::string> LocalObjectStore::put(std::istream& data,
                                                  int64_t size,
                                                  const std::string& key,
                                                  const std::string& content_type) {
  if (!validKey(key)) {
    return common::fail(common::ErrorKind::Store, "invalid object key: " + key);
  }

  const auto target = root_ / key;
  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    return common::fail(common::ErrorKind::Store, "cannot create " + target.parent_path().string() + ": " + ec.message());
  }

  // 先写临时文件再改名, 读者不会看到写了一半的对象
  auto partial = target;
  partial += ".part";
  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
      return common::fail(common::ErrorKind::Store, "cannot open " + partial.string());
    }
    if (size > 0) {
      out << data.rdbuf();
    }
    if (!out) {
      return common::fail(common::ErrorKind::Store, "write failed for " + partial.string());
    }
  }

  auto written = std::filesystem::file_size(partial, ec);
  if (ec || static_cast<int64_t>(written) != size) {
    std::filesystem::remove(partial, ec);
    return common::fail(common::ErrorKind::Store,
                        "short write for " + key + ": expected " + std::to_string(size) + " bytes");
  }

  std::filesystem::rename(partial, target, ec);
  if (ec) {
    return common::fail(common::ErrorKind::Store, "cannot move " + partial.string() + ": " + ec.message());
  }
  spdlog::debug("stored {} ({} bytes, {})", key, size, content_type);
  return key;
}

common::Result<std::string> LocalObjectStore::publicUrl(const std::string& location) {
  if (!validKey(location)) {
    return common::fail(common::ErrorKind::Store, "invalid object location: " + location);
  }
  return public_base_url_ + "/" + location;
}

} // namespace transcode_service
