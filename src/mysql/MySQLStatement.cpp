/**
 * @file MySQLStatement.cpp
 * @brief Implementation of the MySQL prepared statement wrapper.
 */

#include "MySQLStatement.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace tablemap {

namespace {

// Initial capacity for a result column when the server reports no max length
constexpr size_t kMinColumnBuffer = 64;

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLStatement::MySQLStatement(MYSQL_STMT* stmt, std::string sql, std::vector<std::string> names)
    : m_stmt(stmt), m_sql(std::move(sql)) {
    size_t count = mysql_stmt_param_count(m_stmt);
    m_params.resize(count);
    for (size_t i = 0; i < count && i < names.size(); ++i) {
        m_params[i].name = names[i];
    }
}

MySQLStatement::~MySQLStatement() {
    freeResult();
    if (m_stmt) {
        mysql_stmt_close(m_stmt);
    }
}

// ============================================================================
// Parameter Binding
// ============================================================================

bool MySQLStatement::bindValue(int index, Value value) {
    if (index < 1 || index > static_cast<int>(m_params.size())) {
        return false;
    }
    auto& param = m_params[static_cast<size_t>(index - 1)];
    param.value = std::move(value);
    param.bound = true;
    return true;
}

bool MySQLStatement::bindNamedValue(const std::string& name, const Value& value) {
    const std::string wanted = normalizeParameterName(name);
    bool found = false;
    // Every occurrence of the name shares the value
    for (auto& param : m_params) {
        if (!param.name.empty() && param.name == wanted) {
            param.value = value;
            param.bound = true;
            found = true;
        }
    }
    return found;
}

bool MySQLStatement::bindText(int index, const std::string& value) {
    return bindValue(index, Value{value});
}

bool MySQLStatement::bindInt(int index, int64_t value) {
    return bindValue(index, Value{value});
}

bool MySQLStatement::bindNamedText(const std::string& name, const std::string& value) {
    return bindNamedValue(name, Value{value});
}

bool MySQLStatement::bindNamedInt(const std::string& name, int64_t value) {
    return bindNamedValue(name, Value{value});
}

// ============================================================================
// Execution
// ============================================================================

bool MySQLStatement::execute() {
    freeResult();
    m_localError.clear();
    m_rowCount = 0;

    const size_t count = m_params.size();
    std::vector<MYSQL_BIND> binds(count);
    std::vector<long long> integers(count, 0);
    std::vector<unsigned long> lengths(count, 0);

    for (size_t i = 0; i < count; ++i) {
        const auto& param = m_params[i];
        if (!param.bound) {
            m_localError = param.name.empty()
                ? "Parameter #" + std::to_string(i + 1) + " was not bound"
                : "Parameter :" + param.name + " was not bound";
            return false;
        }

        MYSQL_BIND& bind = binds[i];
        if (isInteger(param.value)) {
            integers[i] = std::get<int64_t>(param.value);
            bind.buffer_type = MYSQL_TYPE_LONGLONG;
            bind.buffer = &integers[i];
            bind.is_unsigned = false;
        } else if (isText(param.value)) {
            const auto& text = std::get<std::string>(param.value);
            lengths[i] = static_cast<unsigned long>(text.size());
            bind.buffer_type = MYSQL_TYPE_STRING;
            bind.buffer = const_cast<char*>(text.data());
            bind.buffer_length = lengths[i];
            bind.length = &lengths[i];
        } else {
            bind.buffer_type = MYSQL_TYPE_NULL;
        }
    }

    if (count > 0 && mysql_stmt_bind_param(m_stmt, binds.data())) {
        spdlog::error("mysql_stmt_bind_param failed: {}", mysql_stmt_error(m_stmt));
        return false;
    }

    if (mysql_stmt_execute(m_stmt) != 0) {
        unsigned int err = mysql_stmt_errno(m_stmt);
        if (ErrorHandler::isConnectionError(err)) {
            spdlog::error("Lost connection while executing statement: {}", mysql_stmt_error(m_stmt));
        } else {
            spdlog::debug("mysql_stmt_execute failed ({}): {}", err, mysql_stmt_error(m_stmt));
        }
        return false;
    }

    m_rowCount = mysql_stmt_affected_rows(m_stmt);
    return storeResult();
}

bool MySQLStatement::storeResult() {
    MYSQL_RES* meta = mysql_stmt_result_metadata(m_stmt);
    if (!meta) {
        // No result set (INSERT/UPDATE/DELETE)
        return true;
    }

    // Make mysql_stmt_store_result() fill MYSQL_FIELD::max_length
    bool updateMaxLength = true;
    mysql_stmt_attr_set(m_stmt, STMT_ATTR_UPDATE_MAX_LENGTH, &updateMaxLength);

    if (mysql_stmt_store_result(m_stmt) != 0) {
        spdlog::error("mysql_stmt_store_result failed: {}", mysql_stmt_error(m_stmt));
        mysql_free_result(meta);
        return false;
    }

    unsigned int fieldCount = mysql_num_fields(meta);
    MYSQL_FIELD* fields = mysql_fetch_fields(meta);

    m_columns.resize(fieldCount);
    m_resultBinds.assign(fieldCount, MYSQL_BIND{});

    for (unsigned int i = 0; i < fieldCount; ++i) {
        auto& column = m_columns[i];
        column.name = fields[i].name;
        column.data.resize(std::max<size_t>(fields[i].max_length, kMinColumnBuffer) + 1);

        MYSQL_BIND& bind = m_resultBinds[i];
        bind.buffer_type = MYSQL_TYPE_STRING;
        bind.buffer = column.data.data();
        bind.buffer_length = static_cast<unsigned long>(column.data.size());
        bind.length = &column.length;
        bind.is_null = &column.isNull;
        bind.error = &column.error;
    }
    mysql_free_result(meta);

    if (mysql_stmt_bind_result(m_stmt, m_resultBinds.data())) {
        spdlog::error("mysql_stmt_bind_result failed: {}", mysql_stmt_error(m_stmt));
        return false;
    }

    m_rowCount = mysql_stmt_num_rows(m_stmt);
    m_hasResult = true;
    return true;
}

void MySQLStatement::freeResult() {
    if (m_hasResult) {
        mysql_stmt_free_result(m_stmt);
        m_hasResult = false;
    }
    m_columns.clear();
    m_resultBinds.clear();
}

// ============================================================================
// Row Retrieval
// ============================================================================

std::optional<Row> MySQLStatement::fetch() {
    if (!m_hasResult) {
        return std::nullopt;
    }

    int rc = mysql_stmt_fetch(m_stmt);
    if (rc == MYSQL_NO_DATA) {
        return std::nullopt;
    }
    if (rc == 1) {
        spdlog::error("mysql_stmt_fetch failed: {}", mysql_stmt_error(m_stmt));
        return std::nullopt;
    }

    Row row;
    for (size_t i = 0; i < m_columns.size(); ++i) {
        const auto& column = m_columns[i];
        if (column.isNull) {
            row.set(column.name, Value{});
        } else if (column.length > column.data.size()) {
            // MYSQL_DATA_TRUNCATED for this column: fetch it again at full size
            std::string full(column.length, '\0');
            unsigned long length = 0;
            MYSQL_BIND bind{};
            bind.buffer_type = MYSQL_TYPE_STRING;
            bind.buffer = full.data();
            bind.buffer_length = column.length;
            bind.length = &length;
            if (mysql_stmt_fetch_column(m_stmt, &bind, static_cast<unsigned int>(i), 0) != 0) {
                spdlog::error("mysql_stmt_fetch_column failed for '{}'", column.name);
            }
            row.set(column.name, Value{std::move(full)});
        } else {
            row.set(column.name, Value{std::string(column.data.data(), column.length)});
        }
    }
    return row;
}

// ============================================================================
// Error and Status Information
// ============================================================================

std::string MySQLStatement::errorMessage() const {
    if (!m_localError.empty()) return m_localError;
    return mysql_stmt_error(m_stmt);
}

unsigned int MySQLStatement::errorCode() const {
    if (!m_localError.empty()) return 0;
    return mysql_stmt_errno(m_stmt);
}

std::string MySQLStatement::debugDumpParams() const {
    return formatParamDump(m_sql, m_params);
}

}  // namespace tablemap
