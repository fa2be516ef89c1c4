#include "mysql_video_repository.hpp"
#include "domain/serialization.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>

namespace transcode_service {

namespace {

using StmtPtr = std::unique_ptr<MYSQL_STMT, decltype(&mysql_stmt_close)>;
using IsNullFlag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

constexpr const char* kCreateVideos =
  "CREATE TABLE IF NOT EXISTS videos ("
  "  id VARCHAR(64) NOT NULL PRIMARY KEY,"
  "  original_name VARCHAR(512) NOT NULL DEFAULT '',"
  "  source_location TEXT NOT NULL,"
  "  status VARCHAR(16) NOT NULL,"
  "  source_width INT NOT NULL DEFAULT 0,"
  "  source_height INT NOT NULL DEFAULT 0,"
  "  duration_seconds DOUBLE NOT NULL DEFAULT 0,"
  "  error_message TEXT NULL,"
  "  created_at DATETIME(3) NOT NULL,"
  "  updated_at DATETIME(3) NOT NULL,"
  "  completed_at DATETIME(3) NULL,"
  "  master_manifest_location VARCHAR(1024) NULL,"
  "  master_manifest_url VARCHAR(2048) NULL,"
  "  INDEX idx_videos_status (status),"
  "  INDEX idx_videos_created_at (created_at)"
  ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4";

constexpr const char* kCreateRenditions =
  "CREATE TABLE IF NOT EXISTS video_renditions ("
  "  id VARCHAR(64) NOT NULL PRIMARY KEY,"
  "  video_id VARCHAR(64) NOT NULL,"
  "  label VARCHAR(16) NOT NULL,"
  "  height INT NOT NULL,"
  "  artifact_location VARCHAR(1024) NOT NULL,"
  "  artifact_url VARCHAR(2048) NOT NULL DEFAULT '',"
  "  segment_count INT NOT NULL DEFAULT 0,"
  "  size_bytes BIGINT NOT NULL DEFAULT 0,"
  "  bandwidth_estimate BIGINT NOT NULL DEFAULT 0,"
  "  processed_at DATETIME(3) NOT NULL,"
  "  UNIQUE KEY uq_video_renditions_label (video_id, label),"
  "  CONSTRAINT fk_video_renditions_video FOREIGN KEY (video_id) REFERENCES videos (id) ON DELETE CASCADE"
  ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4";

#define VIDEO_COLUMNS \
  "id, original_name, source_location, status, source_width, source_height, duration_seconds, error_message," \
  " CAST(UNIX_TIMESTAMP(created_at) * 1000 AS SIGNED), CAST(UNIX_TIMESTAMP(updated_at) * 1000 AS SIGNED)," \
  " CAST(UNIX_TIMESTAMP(completed_at) * 1000 AS SIGNED), master_manifest_location, master_manifest_url"
constexpr size_t kVideoColumnCount = 13;

#define RENDITION_COLUMNS \
  "id, video_id, label, height, artifact_location, artifact_url, segment_count, size_bytes, bandwidth_estimate," \
  " CAST(UNIX_TIMESTAMP(processed_at) * 1000 AS SIGNED)"
constexpr size_t kRenditionColumnCount = 10;

std::string text(const std::optional<std::string>& value) {
  return value.value_or("");
}

int64_t integer(const std::optional<std::string>& value) {
  return value ? std::stoll(*value) : 0;
}

std::optional<TimePoint> timestamp(const std::optional<std::string>& value) {
  if (!value) return std::nullopt;
  return fromUnixMillis(std::stoll(*value));
}

VideoAsset toAsset(const std::vector<std::optional<std::string>>& row) {
  VideoAsset asset;
  asset.id = text(row[0]);
  asset.original_name = text(row[1]);
  asset.source_location = text(row[2]);
  asset.status = parseVideoStatus(text(row[3])).value_or(VideoStatus::Waiting);
  asset.source_width = static_cast<int>(integer(row[4]));
  asset.source_height = static_cast<int>(integer(row[5]));
  asset.duration_seconds = row[6] ? std::stod(*row[6]) : 0.0;
  asset.error_message = row[7];
  asset.created_at = timestamp(row[8]).value_or(TimePoint{});
  asset.updated_at = timestamp(row[9]).value_or(TimePoint{});
  asset.completed_at = timestamp(row[10]);
  asset.master_manifest_location = row[11];
  asset.master_manifest_url = row[12];
  return asset;
}

Rendition toRendition(const std::vector<std::optional<std::string>>& row) {
  return Rendition{
    .id = text(row[0]),
    .video_id = text(row[1]),
    .label = text(row[2]),
    .height = static_cast<int>(integer(row[3])),
    .artifact_location = text(row[4]),
    .artifact_url = text(row[5]),
    .segment_count = static_cast<int>(integer(row[6])),
    .size_bytes = integer(row[7]),
    .bandwidth_estimate = integer(row[8]),
    .processed_at = timestamp(row[9]).value_or(TimePoint{})
  };
}

common::Error stmtError(MYSQL_STMT* stmt) {
  return common::Error{common::ErrorKind::Persistence, mysql_stmt_error(stmt)};
}

} // namespace

MysqlVideoRepository::MysqlVideoRepository(std::shared_ptr<common::MySQLConnectionPool> pool)
  : pool_(std::move(pool)) {}

common::Result<void> MysqlVideoRepository::migrate() {
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    if (!conn_guard.valid()) {
      return common::fail(common::ErrorKind::Persistence, "no database connection available");
    }
    for (const char* ddl : {kCreateVideos, kCreateRenditions}) {
      if (mysql_query(conn_guard.get(), ddl)) {
        return common::fail(common::ErrorKind::Persistence, mysql_error(conn_guard.get()));
      }
    }
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Persistence, e.what());
  }
  spdlog::info("database schema ready");
  return {};
}

common::Result<uint64_t> MysqlVideoRepository::executeUpdate(const char* query, MysqlBindHelper& params) {
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    if (!conn_guard.valid()) {
      return common::fail(common::ErrorKind::Persistence, "no database connection available");
    }

    StmtPtr stmt{mysql_stmt_init(conn_guard.get()), mysql_stmt_close};
    if (!stmt) {
      return common::fail(common::ErrorKind::Persistence, mysql_error(conn_guard.get()));
    }
    if (mysql_stmt_prepare(stmt.get(), query, std::strlen(query))) {
      return std::unexpected(stmtError(stmt.get()));
    }
    if (params.size() > 0 && mysql_stmt_bind_param(stmt.get(), params.data())) {
      return std::unexpected(stmtError(stmt.get()));
    }
    if (mysql_stmt_execute(stmt.get())) {
      return std::unexpected(stmtError(stmt.get()));
    }
    return static_cast<uint64_t>(mysql_stmt_affected_rows(stmt.get()));
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Persistence, e.what());
  }
}

common::Result<std::vector<MysqlVideoRepository::Row>> MysqlVideoRepository::executeQuery(const char* query,
                                                                                         MysqlBindHelper& params,
                                                                                         size_t columns) {
  try {
    common::MySQLConnectionGuard conn_guard(*pool_);
    if (!conn_guard.valid()) {
      return common::fail(common::ErrorKind::Persistence, "no database connection available");
    }

    StmtPtr stmt{mysql_stmt_init(conn_guard.get()), mysql_stmt_close};
    if (!stmt) {
      return common::fail(common::ErrorKind::Persistence, mysql_error(conn_guard.get()));
    }
    if (mysql_stmt_prepare(stmt.get(), query, std::strlen(query))) {
      return std::unexpected(stmtError(stmt.get()));
    }
    if (params.size() > 0 && mysql_stmt_bind_param(stmt.get(), params.data())) {
      return std::unexpected(stmtError(stmt.get()));
    }
    if (mysql_stmt_execute(stmt.get())) {
      return std::unexpected(stmtError(stmt.get()));
    }

    // 所有列按字符串取回, 超长的列用mysql_stmt_fetch_column补取
    std::vector<MYSQL_BIND> result(columns);
    std::memset(result.data(), 0, sizeof(MYSQL_BIND) * columns);
    std::vector<std::vector<char>> buffers(columns, std::vector<char>(512));
    std::vector<unsigned long> lengths(columns, 0);
    std::vector<IsNullFlag> nulls(columns, 0);
    for (size_t i = 0; i < columns; ++i) {
      result[i].buffer_type = MYSQL_TYPE_STRING;
      result[i].buffer = buffers[i].data();
      result[i].buffer_length = buffers[i].size();
      result[i].length = &lengths[i];
      result[i].is_null = &nulls[i];
    }
    if (mysql_stmt_bind_result(stmt.get(), result.data())) {
      return std::unexpected(stmtError(stmt.get()));
    }
    if (mysql_stmt_store_result(stmt.get())) {
      return std::unexpected(stmtError(stmt.get()));
    }

    std::vector<Row> rows;
    while (true) {
      int rc = mysql_stmt_fetch(stmt.get());
      if (rc == MYSQL_NO_DATA) break;
      if (rc == 1) {
        return std::unexpected(stmtError(stmt.get()));
      }

      Row row(columns);
      for (size_t i = 0; i < columns; ++i) {
        if (nulls[i]) continue;
        if (lengths[i] <= buffers[i].size()) {
          row[i] = std::string(buffers[i].data(), lengths[i]);
          continue;
        }
        std::string value(lengths[i], '\0');
        MYSQL_BIND column;
        std::memset(&column, 0, sizeof(column));
        column.buffer_type = MYSQL_TYPE_STRING;
        column.buffer = value.data();
        column.buffer_length = value.size();
        if (mysql_stmt_fetch_column(stmt.get(), &column, static_cast<unsigned int>(i), 0)) {
          return std::unexpected(stmtError(stmt.get()));
        }
        row[i] = std::move(value);
      }
      rows.push_back(std::move(row));
    }
    return rows;
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Persistence, e.what());
  }
}

common::Result<void> MysqlVideoRepository::createAsset(const VideoAsset& asset) {
  const char* query =
    "INSERT INTO videos (id, original_name, source_location, status, created_at, updated_at) "
    "VALUES (?, ?, ?, 'waiting', FROM_UNIXTIME(? / 1000), FROM_UNIXTIME(? / 1000)) "
    "ON DUPLICATE KEY UPDATE original_name = VALUES(original_name), source_location = VALUES(source_location), "
    "status = 'waiting', error_message = NULL, completed_at = NULL, updated_at = VALUES(updated_at)";

  MysqlBindHelper bind_helper(5);
  bind_helper.bind_string(0, asset.id);
  bind_helper.bind_string(1, asset.original_name);
  bind_helper.bind_string(2, asset.source_location);
  bind_helper.bind_int64(3, toUnixMillis(asset.created_at));
  bind_helper.bind_int64(4, toUnixMillis(asset.updated_at));

  auto affected = executeUpdate(query, bind_helper);
  if (!affected) return std::unexpected(affected.error());
  return {};
}

common::Result<std::optional<VideoAsset>> MysqlVideoRepository::findById(const std::string& id) {
  const char* query = "SELECT " VIDEO_COLUMNS " FROM videos WHERE id = ?";

  MysqlBindHelper bind_helper(1);
  bind_helper.bind_string(0, id);

  auto rows = executeQuery(query, bind_helper, kVideoColumnCount);
  if (!rows) return std::unexpected(rows.error());
  if (rows->empty()) return std::optional<VideoAsset>{};
  try {
    return std::optional<VideoAsset>{toAsset(rows->front())};
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Persistence, std::string("bad video row: ") + e.what());
  }
}

common::Result<std::vector<VideoAsset>> MysqlVideoRepository::listAssets(size_t limit) {
  const char* query = "SELECT " VIDEO_COLUMNS " FROM videos ORDER BY created_at DESC LIMIT ?";

  MysqlBindHelper bind_helper(1);
  bind_helper.bind_int64(0, static_cast<int64_t>(limit));

  auto rows = executeQuery(query, bind_helper, kVideoColumnCount);
  if (!rows) return std::unexpected(rows.error());
  std::vector<VideoAsset> assets;
  try {
    for (const auto& row : *rows) {
      assets.push_back(toAsset(row));
    }
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Persistence, std::string("bad video row: ") + e.what());
  }
  return assets;
}

common::Result<void> MysqlVideoRepository::updateStatus(const std::string& id,
                                                        VideoStatus status,
                                                        const std::optional<std::string>& error_message) {
  const char* query = status == VideoStatus::Completed
    ? "UPDATE videos SET status = ?, error_message = ?, updated_at = NOW(3) WHERE id = ?"
    : "UPDATE videos SET status = ?, error_message = ?, completed_at = NULL, updated_at = NOW(3) WHERE id = ?";

  MysqlBindHelper bind_helper(3);
  bind_helper.bind_string(0, std::string(toString(status)));
  bind_helper.bind_optional_string(1, status == VideoStatus::Failed ? error_message : std::nullopt);
  bind_helper.bind_string(2, id);

  auto affected = executeUpdate(query, bind_helper);
  if (!affected) return std::unexpected(affected.error());
  if (*affected == 0) {
    return common::fail(common::ErrorKind::Persistence, "video " + id + " not found");
  }
  return {};
}

common::Result<void> MysqlVideoRepository::updateProbe(const std::string& id, int width, int height, double duration_seconds) {
  const char* query =
    "UPDATE videos SET source_width = ?, source_height = ?, duration_seconds = ?, updated_at = NOW(3) WHERE id = ?";

  MysqlBindHelper bind_helper(4);
  bind_helper.bind_int64(0, width);
  bind_helper.bind_int64(1, height);
  bind_helper.bind_double(2, duration_seconds);
  bind_helper.bind_string(3, id);

  auto affected = executeUpdate(query, bind_helper);
  if (!affected) return std::unexpected(affected.error());
  if (*affected == 0) {
    return common::fail(common::ErrorKind::Persistence, "video " + id + " not found");
  }
  return {};
}

common::Result<void> MysqlVideoRepository::setMasterManifest(const std::string& id,
                                                             const std::string& location,
                                                             const std::string& url) {
  const char* query =
    "UPDATE videos SET master_manifest_location = ?, master_manifest_url = ?, updated_at = NOW(3) WHERE id = ?";

  MysqlBindHelper bind_helper(3);
  bind_helper.bind_string(0, location);
  bind_helper.bind_string(1, url);
  bind_helper.bind_string(2, id);

  auto affected = executeUpdate(query, bind_helper);
  if (!affected) return std::unexpected(affected.error());
  if (*affected == 0) {
    return common::fail(common::ErrorKind::Persistence, "video " + id + " not found");
  }
  return {};
}

common::Result<void> MysqlVideoRepository::markCompleted(const std::string& id, TimePoint completed_at) {
  const char* query =
    "UPDATE videos SET status = 'completed', error_message = NULL, completed_at = FROM_UNIXTIME(? / 1000), "
    "updated_at = NOW(3) WHERE id = ?";

  MysqlBindHelper bind_helper(2);
  bind_helper.bind_int64(0, toUnixMillis(completed_at));
  bind_helper.bind_string(1, id);

  auto affected = executeUpdate(query, bind_helper);
  if (!affected) return std::unexpected(affected.error());
  if (*affected == 0) {
    return common::fail(common::ErrorKind::Persistence, "video " + id + " not found");
  }
  return {};
}

common::Result<void> MysqlVideoRepository::upsertRendition(const Rendition& rendition) {
  const char* query =
    "INSERT INTO video_renditions (id, video_id, label, height, artifact_location, artifact_url, "
    "segment_count, size_bytes, bandwidth_estimate, processed_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, FROM_UNIXTIME(? / 1000)) ON DUPLICATE KEY UPDATE "
    "height = VALUES(height), artifact_location = VALUES(artifact_location), artifact_url = VALUES(artifact_url), "
    "segment_count = VALUES(segment_count), size_bytes = VALUES(size_bytes), "
    "bandwidth_estimate = VALUES(bandwidth_estimate), processed_at = VALUES(processed_at)";

  MysqlBindHelper bind_helper(10);
  bind_helper.bind_string(0, rendition.id);
  bind_helper.bind_string(1, rendition.video_id);
  bind_helper.bind_string(2, rendition.label);
  bind_helper.bind_int64(3, rendition.height);
  bind_helper.bind_string(4, rendition.artifact_location);
  bind_helper.bind_string(5, rendition.artifact_url);
  bind_helper.bind_int64(6, rendition.segment_count);
  bind_helper.bind_int64(7, rendition.size_bytes);
  bind_helper.bind_int64(8, rendition.bandwidth_estimate);
  bind_helper.bind_int64(9, toUnixMillis(rendition.processed_at));

  auto affected = executeUpdate(query, bind_helper);
  if (!affected) return std::unexpected(affected.error());
  return {};
}

common::Result<std::vector<Rendition>> MysqlVideoRepository::listRenditions(const std::string& video_id) {
  const char* query = "SELECT " RENDITION_COLUMNS " FROM video_renditions WHERE video_id = ? ORDER BY height DESC";

  MysqlBindHelper bind_helper(1);
  bind_helper.bind_string(0, video_id);

  auto rows = executeQuery(query, bind_helper, kRenditionColumnCount);
  if (!rows) return std::unexpected(rows.error());
  std::vector<Rendition> renditions;
  try {
    for (const auto& row : *rows) {
      renditions.push_back(toRendition(row));
    }
  } catch (const std::exception& e) {
    return common::fail(common::ErrorKind::Persistence, std::string("bad rendition row: ") + e.what());
  }
  return renditions;
}

} // namespace transcode_service
