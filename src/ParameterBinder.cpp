#include "ParameterBinder.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace tablemap {

namespace {

int64_t coerceToInteger(const Value& value) {
    if (isInteger(value)) {
        return std::get<int64_t>(value);
    }
    return 0;
}

}  // namespace

void ParameterBinder::bind(Statement& statement, const Criteria& criteria) {
    const bool named = !criteria.isPositional();
    spdlog::debug("Binding {} value(s) in {} mode", criteria.size(),
                  named ? "named" : "positional");

    for (const auto& [key, value] : criteria) {
        bool ok = false;

        if (const size_t* index = std::get_if<size_t>(&key)) {
            // Driver indices start at 1
            int position = static_cast<int>(named ? *index : *index + 1);
            ok = isText(value)
                ? statement.bindText(position, std::get<std::string>(value))
                : statement.bindInt(position, coerceToInteger(value));
        } else {
            const auto& name = std::get<std::string>(key);
            ok = isText(value)
                ? statement.bindNamedText(name, std::get<std::string>(value))
                : statement.bindNamedInt(name, coerceToInteger(value));
        }

        if (!ok) {
            fail(statement, "Cannot bind parameter " + keyToString(key));
        }
    }
}

Statement& ParameterBinder::bindAndExecute(Statement& statement, const Criteria& criteria) {
    ErrorContext context("execute");

    bind(statement, criteria);

    if (!statement.execute()) {
        fail(statement, statement.errorMessage());
    }
    return statement;
}

void ParameterBinder::fail(const Statement& statement, const std::string& message) {
    spdlog::error("Failed to execute statement '{}': {}", statement.sql(), message);
    throw BindError(statement.sql(), statement.debugDumpParams(),
                    statement.errorCode(), message);
}

}  // namespace tablemap
