#pragma once

/**
 * @file MySQLStatement.hpp
 * @brief Statement implementation over a MYSQL_STMT prepared statement.
 */

#include "Statement.hpp"
#include <mysql/mysql.h>
#include <string>
#include <vector>

namespace tablemap {

/**
 * @class MySQLStatement
 * @brief RAII wrapper for a MySQL server-side prepared statement.
 *
 * Parameters are kept client-side until execute(), where they are
 * turned into MYSQL_BIND entries: integers as MYSQL_TYPE_LONGLONG,
 * text as MYSQL_TYPE_STRING. Result columns are always fetched as text,
 * so numeric columns arrive as their decimal representation.
 *
 * Named placeholders have already been rewritten to '?' by
 * MySQLPlaceholderRewriter; the name of each position is kept so that
 * bindNamedText()/bindNamedInt() fill every occurrence of a name.
 *
 * Thread Safety:
 * - Not thread-safe; a statement belongs to the call that prepared it.
 */
class MySQLStatement : public Statement {
public:
    /**
     * @brief Take ownership of a prepared handle.
     * @param stmt Prepared MYSQL_STMT (closed by the destructor).
     * @param sql Statement text as written by the caller.
     * @param names Placeholder name per '?' position (empty for native '?').
     */
    MySQLStatement(MYSQL_STMT* stmt, std::string sql, std::vector<std::string> names);

    /**
     * @brief Destructor - frees any result and closes the statement.
     */
    ~MySQLStatement() override;

    const std::string& sql() const override { return m_sql; }
    int parameterCount() const override { return static_cast<int>(m_params.size()); }

    bool bindText(int index, const std::string& value) override;
    bool bindInt(int index, int64_t value) override;
    bool bindNamedText(const std::string& name, const std::string& value) override;
    bool bindNamedInt(const std::string& name, int64_t value) override;

    /**
     * @brief Send parameters and execute.
     * @return true on success. A result set, if any, is buffered client-side
     *         with mysql_stmt_store_result() so fetch() never blocks the server.
     */
    bool execute() override;

    std::optional<Row> fetch() override;

    uint64_t rowCount() const override { return m_rowCount; }

    std::string errorMessage() const override;
    unsigned int errorCode() const override;

    std::string debugDumpParams() const override;

private:
    struct ColumnBuffer {
        std::string name;
        std::vector<char> data;
        unsigned long length = 0;
        bool isNull = false;
        bool error = false;
    };

    bool bindValue(int index, Value value);
    bool bindNamedValue(const std::string& name, const Value& value);
    bool storeResult();
    void freeResult();

    MYSQL_STMT* m_stmt;                     ///< Prepared statement handle (owned)
    std::string m_sql;                      ///< Original statement text
    std::vector<BoundParameter> m_params;   ///< One slot per '?'
    std::vector<ColumnBuffer> m_columns;    ///< Result column buffers
    std::vector<MYSQL_BIND> m_resultBinds;  ///< Bound onto m_columns
    bool m_hasResult = false;
    uint64_t m_rowCount = 0;
    std::string m_localError;               ///< Errors raised before reaching the server
};

}  // namespace tablemap
