#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace tablemap {

// Base for everything the mapper throws
class MapperError : public std::runtime_error {
public:
    explicit MapperError(const std::string& message, unsigned int errorCode = 0);

    unsigned int errorCode() const { return m_errorCode; }

private:
    unsigned int m_errorCode;
};

// The driver could not open a connection
class ConnectionError : public MapperError {
public:
    ConnectionError(unsigned int errorCode, const std::string& message);
};

// A statement failed to prepare, bind or execute
class BindError : public MapperError {
public:
    BindError(std::string sql, std::string paramsDump,
              unsigned int errorCode, const std::string& message);

    const std::string& sql() const { return m_sql; }
    const std::string& paramsDump() const { return m_paramsDump; }

    // ErrorContext chain active where the failure was raised, outermost first
    const std::vector<std::string>& context() const { return m_context; }

private:
    std::string m_sql;
    std::string m_paramsDump;
    std::vector<std::string> m_context;
};

// An entity mapping is unusable (no id field, duplicate column, ...)
class MappingError : public MapperError {
public:
    explicit MappingError(const std::string& message);
};

// Connection settings are missing or malformed
class ConfigError : public MapperError {
public:
    explicit ConfigError(const std::string& message);
};

enum class LineStyle {
    Console,  // "\n"
    Html      // "</br>"
};

class ErrorHandler {
public:
    static std::string lineFeed(LineStyle style);

    // Statement dump followed by the context chain, one frame per line
    static std::string formatFailure(const BindError& error, LineStyle style);

    // {"outcome": false, "message": "Unable to connect"}
    static std::string connectionFailurePayload();

    // Check if a MySQL client/server error indicates a lost connection
    static bool isConnectionError(unsigned int mysqlError);

    // Get human-readable error message
    static std::string getErrorMessage(unsigned int mysqlError);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string current();
    static std::vector<std::string> frames();

private:
    static thread_local std::vector<std::string> s_frames;
};

}  // namespace tablemap
