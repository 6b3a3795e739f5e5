#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#include <nlohmann/json.hpp>
#include <sstream>

namespace tablemap {

thread_local std::vector<std::string> ErrorContext::s_frames;

MapperError::MapperError(const std::string& message, unsigned int errorCode)
    : std::runtime_error(message)
    , m_errorCode(errorCode) {
}

ConnectionError::ConnectionError(unsigned int errorCode, const std::string& message)
    : MapperError(message, errorCode) {
}

BindError::BindError(std::string sql, std::string paramsDump,
                     unsigned int errorCode, const std::string& message)
    : MapperError("Failed to execute statement: " + message, errorCode)
    , m_sql(std::move(sql))
    , m_paramsDump(std::move(paramsDump))
    , m_context(ErrorContext::frames()) {
}

MappingError::MappingError(const std::string& message)
    : MapperError(message) {
}

ConfigError::ConfigError(const std::string& message)
    : MapperError(message) {
}

std::string ErrorHandler::lineFeed(LineStyle style) {
    return style == LineStyle::Html ? "</br>" : "\n";
}

std::string ErrorHandler::formatFailure(const BindError& error, LineStyle style) {
    const std::string lf = lineFeed(style);
    std::ostringstream out;

    out << "Failed to execute statement:" << lf << lf;

    std::istringstream dump(error.paramsDump());
    std::string line;
    while (std::getline(dump, line)) {
        out << line << lf;
    }
    out << lf;

    out << error.what() << lf;

    // Innermost frame first, deeper frames get longer prefixes
    std::string prepend;
    const auto& frames = error.context();
    for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
        prepend += '-';
        out << " " << prepend << " " << *it << lf;
    }

    return out.str();
}

std::string ErrorHandler::connectionFailurePayload() {
    nlohmann::json payload = {
        {"outcome", false},
        {"message", "Unable to connect"}
    };
    return payload.dump();
}

bool ErrorHandler::isConnectionError(unsigned int mysql_error) {
    switch (mysql_error) {
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
        case CR_UNKNOWN_HOST:
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case CR_COMMANDS_OUT_OF_SYNC:
        case CR_SOCKET_CREATE_ERROR:
        case CR_IPSOCK_ERROR:
            return true;
        default:
            return false;
    }
}

std::string ErrorHandler::getErrorMessage(unsigned int mysql_error) {
    switch (mysql_error) {
        case 0:
            return "Success";
        case CR_CONNECTION_ERROR:
            return "Connection error";
        case CR_CONN_HOST_ERROR:
            return "Cannot connect to host";
        case CR_UNKNOWN_HOST:
            return "Unknown host";
        case CR_SERVER_GONE_ERROR:
            return "MySQL server has gone away";
        case CR_SERVER_LOST:
            return "Lost connection to MySQL server";
        case ER_ACCESS_DENIED_ERROR:
            return "Access denied";
        case ER_BAD_DB_ERROR:
            return "Unknown database";
        case ER_NO_SUCH_TABLE:
            return "Table does not exist";
        case ER_BAD_FIELD_ERROR:
            return "Unknown column";
        case ER_DUP_ENTRY:
            return "Duplicate entry";
        case ER_PARSE_ERROR:
            return "SQL parse error";
        case ER_WRONG_VALUE_COUNT_ON_ROW:
            return "Column count doesn't match value count";
        default:
            return "MySQL error " + std::to_string(mysql_error);
    }
}

ErrorContext::ErrorContext(const std::string& context) {
    s_frames.push_back(context);
}

ErrorContext::~ErrorContext() {
    s_frames.pop_back();
}

std::string ErrorContext::current() {
    std::string joined;
    for (const auto& frame : s_frames) {
        if (!joined.empty()) {
            joined += " > ";
        }
        joined += frame;
    }
    return joined;
}

std::vector<std::string> ErrorContext::frames() {
    return s_frames;
}

}  // namespace tablemap
