#pragma once

#include "Criteria.hpp"
#include "Statement.hpp"

namespace tablemap {

// Binds criteria onto a prepared statement and executes it.
//
// Positional criteria (keys exactly {0..n-1}) bind key k at index k + 1.
// Anything else is named mode: text keys bind by name, integer keys bind
// at that index verbatim. Text binds as text; every other value is
// coerced to an integer (null becomes 0).
class ParameterBinder {
public:
    // Throws BindError if a key does not exist in the statement
    static void bind(Statement& statement, const Criteria& criteria);

    // Throws BindError on a bind or execute failure
    static Statement& bindAndExecute(Statement& statement, const Criteria& criteria);

private:
    [[noreturn]] static void fail(const Statement& statement, const std::string& message);
};

}  // namespace tablemap
