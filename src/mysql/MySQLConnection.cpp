/**
 * @file MySQLConnection.cpp
 * @brief Implementation of the RAII MySQL connection wrapper.
 */

#include "MySQLConnection.hpp"
#include "MySQLPlaceholderRewriter.hpp"
#include "MySQLStatement.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace tablemap {

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLConnection::MySQLConnection(const ConnectionConfig& config) {
    // Initialize MySQL library (thread-safe)
    static std::once_flag mysqlInitFlag;
    std::call_once(mysqlInitFlag, []() {
        mysql_library_init(0, nullptr, nullptr);
    });

    m_conn = mysql_init(nullptr);
    if (!m_conn) {
        throw ConnectionError(0, "Failed to initialize MySQL connection");
    }

    unsigned int timeout = static_cast<unsigned int>(config.connect_timeout.count() / 1000);
    mysql_options(m_conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    const char* socket = config.socket.empty() ? nullptr : config.socket.c_str();
    const char* db = config.dbname.empty() ? nullptr : config.dbname.c_str();

    if (!mysql_real_connect(m_conn,
                            config.host.c_str(),
                            config.user.c_str(),
                            config.password.c_str(),
                            db,
                            config.port,
                            socket,
                            0)) {
        unsigned int err = mysql_errno(m_conn);
        std::string msg = mysql_error(m_conn);
        if (msg.empty()) {
            msg = ErrorHandler::getErrorMessage(err);
        }
        mysql_close(m_conn);
        m_conn = nullptr;
        spdlog::error("Failed to connect to {}: {}", config.dsn(), msg);
        throw ConnectionError(err, "Failed to connect to MySQL: " + msg);
    }

    if (mysql_set_character_set(m_conn, config.charset.c_str()) != 0) {
        spdlog::warn("Could not set character set '{}': {}", config.charset, mysql_error(m_conn));
    }

    spdlog::debug("Connected to {}", config.dsn());
}

MySQLConnection::~MySQLConnection() {
    if (m_conn) {
        mysql_close(m_conn);
    }
}

// ============================================================================
// Statement Preparation
// ============================================================================

std::unique_ptr<Statement> MySQLConnection::prepare(const std::string& sql) {
    m_lastError.clear();
    m_lastErrno = 0;

    auto rewritten = MySQLPlaceholderRewriter::rewrite(sql);
    if (rewritten.hasNamed && rewritten.hasPositional) {
        m_lastError = "Statement mixes named and positional parameters";
        spdlog::error("MySQL prepare failed: {}", m_lastError);
        return nullptr;
    }

    MYSQL_STMT* stmt = mysql_stmt_init(m_conn);
    if (!stmt) {
        m_lastError = mysql_error(m_conn);
        m_lastErrno = mysql_errno(m_conn);
        return nullptr;
    }

    if (mysql_stmt_prepare(stmt, rewritten.sql.c_str(), rewritten.sql.size()) != 0) {
        m_lastError = mysql_stmt_error(stmt);
        m_lastErrno = mysql_stmt_errno(stmt);
        spdlog::error("MySQL prepare failed: {}", m_lastError);
        mysql_stmt_close(stmt);
        return nullptr;
    }

    return std::make_unique<MySQLStatement>(stmt, sql, std::move(rewritten.names));
}

// ============================================================================
// Error and Status Information
// ============================================================================

int64_t MySQLConnection::lastInsertId() const {
    return static_cast<int64_t>(mysql_insert_id(m_conn));
}

std::string MySQLConnection::error() const {
    if (!m_lastError.empty()) return m_lastError;
    return mysql_error(m_conn);
}

unsigned int MySQLConnection::errorCode() const {
    if (!m_lastError.empty()) return m_lastErrno;
    return mysql_errno(m_conn);
}

}  // namespace tablemap
