#pragma once

/**
 * @file SQLiteStatement.hpp
 * @brief Statement implementation over an sqlite3_stmt.
 */

#include "Statement.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace tablemap {

/**
 * @class SQLiteStatement
 * @brief RAII wrapper for an SQLite prepared statement.
 *
 * SQLite uses step() both to execute and to fetch rows. execute() performs
 * the first step: for DML that completes the statement, for a query it
 * leaves the first row pending so that fetch() can hand it out before
 * stepping further.
 *
 * Column values keep SQLite's storage class: INTEGER columns come back as
 * integers, NULL as null, everything else as text.
 *
 * Thread Safety:
 * - Not thread-safe; a statement belongs to the call that prepared it.
 */
class SQLiteStatement : public Statement {
public:
    /**
     * @brief Take ownership of a prepared statement.
     * @param stmt sqlite3_stmt handle (finalized by the destructor).
     * @param sql Statement text as written by the caller.
     */
    SQLiteStatement(sqlite3_stmt* stmt, std::string sql);

    /**
     * @brief Destructor - finalizes the statement.
     */
    ~SQLiteStatement() override;

    const std::string& sql() const override { return m_sql; }
    int parameterCount() const override { return static_cast<int>(m_params.size()); }

    bool bindText(int index, const std::string& value) override;
    bool bindInt(int index, int64_t value) override;
    bool bindNamedText(const std::string& name, const std::string& value) override;
    bool bindNamedInt(const std::string& name, int64_t value) override;

    /**
     * @brief Run the statement up to its first row or completion.
     * @return true on SQLITE_ROW or SQLITE_DONE.
     *
     * A statement that was executed before is reset first; bindings are kept.
     * Binding onto an executed statement resets it as well.
     */
    bool execute() override;

    std::optional<Row> fetch() override;

    uint64_t rowCount() const override { return m_rowCount; }

    std::string errorMessage() const override;
    unsigned int errorCode() const override;

    std::string debugDumpParams() const override;

private:
    // Reset a statement that has been stepped so it accepts new bindings
    void rewind();
    bool record(int index, int rc, Value value);
    int namedIndex(const std::string& name) const;
    Row currentRow() const;

    sqlite3_stmt* m_stmt;                   ///< SQLite prepared statement handle (owned)
    std::string m_sql;
    std::vector<BoundParameter> m_params;   ///< Mirror of the bindings for dumps
    bool m_executed = false;
    bool m_hasPendingRow = false;           ///< execute() stepped onto a row
    bool m_done = false;
    uint64_t m_rowCount = 0;
    int m_lastRc = SQLITE_OK;
};

}  // namespace tablemap
