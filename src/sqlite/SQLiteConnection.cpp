/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of RAII SQLite connection wrapper.
 */

#include "SQLiteConnection.hpp"
#include "SQLiteStatement.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace tablemap {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath) : m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown error";
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, msg);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw ConnectionError(static_cast<unsigned int>(rc),
                              "Failed to open SQLite database '" + dbPath + "': " + msg);
    }

    spdlog::debug("Opened SQLite database '{}'", dbPath);
}

SQLiteConnection::~SQLiteConnection() {
    // Close database handle if open
    if (m_db) {
        sqlite3_close(m_db);
    }
}

// ============================================================================
// Query Execution
// ============================================================================

std::unique_ptr<Statement> SQLiteConnection::prepare(const std::string& sql) {
    // Compile SQL into a prepared statement for execution
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("SQLite prepare failed: {}", sqlite3_errmsg(m_db));
        return nullptr;
    }
    if (!stmt) {
        // Empty or comment-only SQL compiles to nothing
        spdlog::error("SQLite prepare produced no statement for '{}'", sql);
        return nullptr;
    }
    return std::make_unique<SQLiteStatement>(stmt, sql);
}

// ============================================================================
// Error and Status Information
// ============================================================================

std::string SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

unsigned int SQLiteConnection::errorCode() const {
    return static_cast<unsigned int>(m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR);
}

int64_t SQLiteConnection::lastInsertId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

}  // namespace tablemap
