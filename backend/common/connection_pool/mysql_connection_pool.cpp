#include "mysql_connection_pool.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

MySQLConnection& MySQLConnection::operator=(MySQLConnection&& other) noexcept {
  if (this != &other) {
    if (conn_) {
      mysql_close(conn_);
    }
    conn_ = other.conn_;
    other.conn_ = nullptr;
  }
  return *this;
}

bool MySQLConnection::isValid() const {
  if (!conn_) return false;
  return mysql_ping(conn_) == 0;
}

MySQLConnectionPool::MySQLConnectionPool(const config::DatabaseConfig& db_config,
                                         const config::ConnectionPoolConfig& pool_config)
  : ConnectionPool(pool_config), db_config_(db_config) {
  prefill();
  if (cp_config_.min_connections > 0 && pool_.empty()) {
    throw std::runtime_error("Failed to connect to MySQL at " + db_config_.host + ":" + std::to_string(db_config_.port));
  }
}

std::unique_ptr<Connection> MySQLConnectionPool::createConnection() {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    spdlog::error("mysql_init failed");
    return nullptr;
  }

  mysql_options(conn, MYSQL_SET_CHARSET_NAME, db_config_.charset.c_str());

  unsigned int timeout = static_cast<unsigned int>(cp_config_.timeout.count() / 1000);
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &timeout);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &timeout);

  // affected rows = matched rows, an UPDATE that changes nothing still finds its row
  if (!mysql_real_connect(conn, db_config_.host.c_str(), db_config_.user.c_str(),
                        db_config_.password.c_str(), db_config_.db_name.c_str(),
                        db_config_.port, nullptr, CLIENT_FOUND_ROWS)) {
    spdlog::warn("mysql connect to {}:{} failed: {}", db_config_.host, db_config_.port, mysql_error(conn));
    mysql_close(conn);
    return nullptr;
  }

  return std::make_unique<MySQLConnection>(conn);
}

} // namespace common
