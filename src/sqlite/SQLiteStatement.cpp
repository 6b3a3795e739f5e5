/**
 * @file SQLiteStatement.cpp
 * @brief Implementation of the SQLite prepared statement wrapper.
 *
 * Uses the step() iteration pattern to retrieve rows one at a time.
 */

#include "SQLiteStatement.hpp"
#include <spdlog/spdlog.h>

namespace tablemap {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteStatement::SQLiteStatement(sqlite3_stmt* stmt, std::string sql)
    : m_stmt(stmt), m_sql(std::move(sql)) {
    int count = sqlite3_bind_parameter_count(m_stmt);
    m_params.resize(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        const char* name = sqlite3_bind_parameter_name(m_stmt, i + 1);
        if (name && name[0] != '?') {
            m_params[static_cast<size_t>(i)].name = normalizeParameterName(name);
        }
    }
}

SQLiteStatement::~SQLiteStatement() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

// ============================================================================
// Parameter Binding
// ============================================================================

void SQLiteStatement::rewind() {
    if (m_executed) {
        sqlite3_reset(m_stmt);
        m_executed = false;
        m_hasPendingRow = false;
        m_done = false;
    }
}

bool SQLiteStatement::record(int index, int rc, Value value) {
    m_lastRc = rc;
    if (rc != SQLITE_OK) {
        return false;
    }
    auto& param = m_params[static_cast<size_t>(index - 1)];
    param.value = std::move(value);
    param.bound = true;
    return true;
}

int SQLiteStatement::namedIndex(const std::string& name) const {
    // Placeholders are stored with their ':' prefix
    return sqlite3_bind_parameter_index(m_stmt, (":" + normalizeParameterName(name)).c_str());
}

bool SQLiteStatement::bindText(int index, const std::string& value) {
    if (index < 1 || index > parameterCount()) return false;
    rewind();
    int rc = sqlite3_bind_text(m_stmt, index, value.c_str(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return record(index, rc, Value{value});
}

bool SQLiteStatement::bindInt(int index, int64_t value) {
    if (index < 1 || index > parameterCount()) return false;
    rewind();
    int rc = sqlite3_bind_int64(m_stmt, index, value);
    return record(index, rc, Value{value});
}

bool SQLiteStatement::bindNamedText(const std::string& name, const std::string& value) {
    int index = namedIndex(name);
    return index > 0 && bindText(index, value);
}

bool SQLiteStatement::bindNamedInt(const std::string& name, int64_t value) {
    int index = namedIndex(name);
    return index > 0 && bindInt(index, value);
}

// ============================================================================
// Execution and Row Iteration
// ============================================================================

bool SQLiteStatement::execute() {
    rewind();
    m_executed = true;
    m_hasPendingRow = false;
    m_done = false;
    m_rowCount = 0;

    m_lastRc = sqlite3_step(m_stmt);
    if (m_lastRc == SQLITE_ROW) {
        m_hasPendingRow = true;
        return true;
    }
    if (m_lastRc == SQLITE_DONE) {
        m_done = true;
        m_rowCount = static_cast<uint64_t>(sqlite3_changes(sqlite3_db_handle(m_stmt)));
        return true;
    }

    spdlog::debug("SQLite step failed: {}", sqlite3_errmsg(sqlite3_db_handle(m_stmt)));
    m_done = true;
    return false;
}

std::optional<Row> SQLiteStatement::fetch() {
    if (!m_executed || m_done) {
        return std::nullopt;
    }

    if (m_hasPendingRow) {
        m_hasPendingRow = false;
        return currentRow();
    }

    // SQLITE_ROW indicates a row is available; SQLITE_DONE means no more rows
    m_lastRc = sqlite3_step(m_stmt);
    if (m_lastRc == SQLITE_ROW) {
        return currentRow();
    }
    if (m_lastRc != SQLITE_DONE) {
        spdlog::error("SQLite step failed: {}", sqlite3_errmsg(sqlite3_db_handle(m_stmt)));
    }
    m_done = true;
    return std::nullopt;
}

Row SQLiteStatement::currentRow() const {
    Row row;
    int count = sqlite3_column_count(m_stmt);
    for (int i = 0; i < count; ++i) {
        const char* name = sqlite3_column_name(m_stmt, i);
        std::string column = name ? name : "";

        switch (sqlite3_column_type(m_stmt, i)) {
            case SQLITE_NULL:
                row.set(column, Value{});
                break;
            case SQLITE_INTEGER:
                row.set(column, Value{static_cast<int64_t>(sqlite3_column_int64(m_stmt, i))});
                break;
            default: {
                const unsigned char* text = sqlite3_column_text(m_stmt, i);
                int bytes = sqlite3_column_bytes(m_stmt, i);
                row.set(column, Value{text ? std::string(reinterpret_cast<const char*>(text),
                                                         static_cast<size_t>(bytes))
                                           : std::string()});
                break;
            }
        }
    }
    return row;
}

// ============================================================================
// Error and Status Information
// ============================================================================

std::string SQLiteStatement::errorMessage() const {
    if (m_lastRc == SQLITE_RANGE) return "bind or column index out of range";
    return sqlite3_errmsg(sqlite3_db_handle(m_stmt));
}

unsigned int SQLiteStatement::errorCode() const {
    return static_cast<unsigned int>(m_lastRc);
}

std::string SQLiteStatement::debugDumpParams() const {
    return formatParamDump(m_sql, m_params);
}

}  // namespace tablemap
