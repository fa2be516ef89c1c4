#pragma once

#include "common/connection_pool/mysql_connection_pool.hpp"
#include "domain/video_repository.hpp"

#include <mysql/mysql.h>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transcode_service {

class MysqlVideoRepository : public VideoRepository {
public:
  explicit MysqlVideoRepository(std::shared_ptr<common::MySQLConnectionPool> pool);
  ~MysqlVideoRepository() override = default;

  // CREATE TABLE IF NOT EXISTS for videos and video_renditions
  common::Result<void> migrate();

  common::Result<void> createAsset(const VideoAsset& asset) override;
  common::Result<std::optional<VideoAsset>> findById(const std::string& id) override;
  common::Result<std::vector<VideoAsset>> listAssets(size_t limit) override;
  common::Result<void> updateStatus(const std::string& id,
                                    VideoStatus status,
                                    const std::optional<std::string>& error_message) override;
  common::Result<void> updateProbe(const std::string& id, int width, int height, double duration_seconds) override;
  common::Result<void> setMasterManifest(const std::string& id,
                                         const std::string& location,
                                         const std::string& url) override;
  common::Result<void> markCompleted(const std::string& id, TimePoint completed_at) override;
  common::Result<void> upsertRendition(const Rendition& rendition) override;
  common::Result<std::vector<Rendition>> listRenditions(const std::string& video_id) override;

private:
  class MysqlBindHelper;
  using Row = std::vector<std::optional<std::string>>;

  // affected rows
  common::Result<uint64_t> executeUpdate(const char* query, MysqlBindHelper& params);
  common::Result<std::vector<Row>> executeQuery(const char* query, MysqlBindHelper& params, size_t columns);

  std::shared_ptr<common::MySQLConnectionPool> pool_;
};


// RAII wrapper for MySQL bind parameters
class MysqlVideoRepository::MysqlBindHelper {
public:
  explicit MysqlBindHelper(size_t param_count)
    : binds_(param_count), string_storage_(param_count), int_storage_(param_count), double_storage_(param_count) {
    std::memset(binds_.data(), 0, sizeof(MYSQL_BIND) * param_count);
  }

  void bind_string(size_t pos, const std::string& str) {
    if (pos >= binds_.size()) return;
    string_storage_[pos] = str;
    binds_[pos].buffer_type = MYSQL_TYPE_STRING;
    binds_[pos].buffer = const_cast<char*>(string_storage_[pos].c_str());
    binds_[pos].buffer_length = string_storage_[pos].length();
  }

  void bind_optional_string(size_t pos, const std::optional<std::string>& str) {
    if (str) {
      bind_string(pos, *str);
    } else {
      bind_null(pos);
    }
  }

  void bind_int64(size_t pos, int64_t value) {
    if (pos >= binds_.size()) return;
    int_storage_[pos] = value;
    binds_[pos].buffer_type = MYSQL_TYPE_LONGLONG;
    binds_[pos].buffer = &int_storage_[pos];
  }

  void bind_double(size_t pos, double value) {
    if (pos >= binds_.size()) return;
    double_storage_[pos] = value;
    binds_[pos].buffer_type = MYSQL_TYPE_DOUBLE;
    binds_[pos].buffer = &double_storage_[pos];
  }

  void bind_null(size_t pos) {
    if (pos >= binds_.size()) return;
    binds_[pos].buffer_type = MYSQL_TYPE_NULL;
  }

  size_t size() const { return binds_.size(); }
  MYSQL_BIND* data() { return binds_.data(); }

private:
  std::vector<MYSQL_BIND> binds_;
  std::vector<std::string> string_storage_;
  std::vector<int64_t> int_storage_;
  std::vector<double> double_storage_;
};

} // namespace transcode_service
