#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief RAII wrapper for a single MySQL database connection.
 *
 * This class owns one MYSQL handle from libmysqlclient for the lifetime of
 * the object. It is the connection a Mapper talks to when the configured
 * driver is "mysql".
 */

#include "Connection.hpp"
#include "Config.hpp"
#include <mysql/mysql.h>
#include <string>
#include <cstdint>

namespace tablemap {

/**
 * @class MySQLConnection
 * @brief RAII wrapper for one MySQL connection.
 *
 * The connection is opened in the constructor and closed in the destructor.
 * There is no pooling and no reconnect-on-demand: a mapper holds exactly one
 * of these.
 *
 * Statements are prepared server-side. Because the C API only understands
 * '?', statements written with ":name" placeholders are rewritten first
 * (see MySQLPlaceholderRewriter). Mixing both styles in one statement is
 * rejected.
 *
 * Usage:
 * @code
 *   MySQLConnection conn(config);
 *   auto stmt = conn.prepare("SELECT * FROM user WHERE id = :id");
 *   if (stmt && stmt->bindNamedInt("id", 7) && stmt->execute()) {
 *       auto row = stmt->fetch();
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; use one connection per thread.
 */
class MySQLConnection : public Connection {
public:
    /**
     * @brief Connect using host/port/socket, dbname, user and password.
     * @param config Connection settings.
     * @throws ConnectionError if mysql_real_connect() fails.
     */
    explicit MySQLConnection(const ConnectionConfig& config);

    /**
     * @brief Destructor - closes the connection.
     */
    ~MySQLConnection() override;

    /**
     * @brief Get the underlying MySQL connection handle.
     * @return Raw MYSQL* pointer (still owned by this object).
     */
    MYSQL* get() const { return m_conn; }

    /**
     * @brief Prepare a statement with '?' or ":name" placeholders.
     * @param sql The SQL statement.
     * @return Statement on success, nullptr on error (check error() for details).
     */
    std::unique_ptr<Statement> prepare(const std::string& sql) override;

    /**
     * @brief Get the auto-generated ID from the last INSERT.
     * @return Last insert ID, or 0 if no auto-increment column.
     */
    int64_t lastInsertId() const override;

    /**
     * @brief Get the last error message.
     * @return Description of the last failed prepare, or of the connection.
     */
    std::string error() const override;

    /**
     * @brief Get the last MySQL error number.
     * @return MySQL error code (e.g., ER_PARSE_ERROR is 1064).
     */
    unsigned int errorCode() const override;

    std::string driverName() const override { return "mysql"; }

private:
    MYSQL* m_conn = nullptr;   ///< MySQL connection handle
    std::string m_lastError;   ///< Error of the last failed prepare()
    unsigned int m_lastErrno = 0;
};

}  // namespace tablemap
