#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for an SQLite database connection.
 *
 * Used when the configured driver is "sqlite": the database name is the
 * path of the database file, or ":memory:" for a private in-memory database.
 */

#include "Connection.hpp"
#include <sqlite3.h>
#include <string>
#include <cstdint>

namespace tablemap {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * SQLiteConnection manages a connection to an SQLite database file.
 * The connection is automatically closed when the object is destroyed.
 *
 * SQLite understands both '?' and ":name" placeholders natively, so
 * statements are prepared as written.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn("/path/to/database.db");
 *   auto stmt = conn.prepare("SELECT * FROM user WHERE id = ?");
 *   // Bind, execute, fetch...
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; use one connection per thread.
 */
class SQLiteConnection : public Connection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the SQLite database file.
     * @throws ConnectionError if the file cannot be opened.
     *
     * Creates the database file if it doesn't exist.
     */
    explicit SQLiteConnection(const std::string& dbPath);

    /**
     * @brief Destructor - closes the database connection.
     */
    ~SQLiteConnection() override;

    /**
     * @brief Get the underlying sqlite3 handle.
     * @return Raw sqlite3* pointer (still owned by this object).
     */
    sqlite3* get() const { return m_db; }

    /**
     * @brief Prepare a SQL statement for execution.
     * @param sql The SQL statement to prepare.
     * @return Statement on success, nullptr on error.
     */
    std::unique_ptr<Statement> prepare(const std::string& sql) override;

    /**
     * @brief Get the rowid of the last inserted row.
     * @return Last insert rowid, or 0 if no inserts performed.
     */
    int64_t lastInsertId() const override;

    /**
     * @brief Get the last SQLite error message.
     * @return Error description from the last failed operation.
     */
    std::string error() const override;

    /**
     * @brief Get the last SQLite error code.
     * @return SQLite error code (SQLITE_OK = 0, SQLITE_ERROR = 1, etc.).
     */
    unsigned int errorCode() const override;

    std::string driverName() const override { return "sqlite"; }

private:
    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
};

}  // namespace tablemap
