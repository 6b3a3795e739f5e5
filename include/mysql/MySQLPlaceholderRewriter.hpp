#pragma once

#include <string>
#include <vector>

namespace tablemap {

/**
 * @class MySQLPlaceholderRewriter
 * @brief Converts ":name" placeholders into the '?' markers libmysqlclient accepts.
 *
 * The MySQL C API only understands positional '?' parameters. Statements
 * written with named placeholders are rewritten before mysql_stmt_prepare(),
 * remembering which name sits at each '?' so binding by name can fill every
 * occurrence.
 *
 * Placeholders inside quoted strings, quoted identifiers and comments are
 * left untouched. A ':' followed by something that is not an identifier
 * start (e.g. "::" or a time literal outside quotes) is copied verbatim.
 */
class MySQLPlaceholderRewriter {
public:
    struct Result {
        std::string sql;                 ///< SQL with '?' in place of every placeholder
        std::vector<std::string> names;  ///< Name per '?' position, empty for native '?'
        bool hasNamed = false;           ///< At least one ":name" was found
        bool hasPositional = false;      ///< At least one native '?' was found
    };

    /**
     * @brief Rewrite a statement.
     * @param sql Statement text using '?' or ":name" placeholders.
     * @return Rewritten text and the placeholder layout.
     */
    static Result rewrite(const std::string& sql);

private:
    static bool isNameStart(char c);
    static bool isNameChar(char c);
};

}  // namespace tablemap
