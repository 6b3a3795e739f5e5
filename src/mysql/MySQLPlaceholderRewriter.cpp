/**
 * @file MySQLPlaceholderRewriter.cpp
 * @brief Named-to-positional placeholder conversion for MySQL statements.
 */

#include "MySQLPlaceholderRewriter.hpp"
#include <cctype>

namespace tablemap {

bool MySQLPlaceholderRewriter::isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool MySQLPlaceholderRewriter::isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

MySQLPlaceholderRewriter::Result MySQLPlaceholderRewriter::rewrite(const std::string& sql) {
    Result result;
    result.sql.reserve(sql.size());

    size_t i = 0;
    const size_t n = sql.size();

    while (i < n) {
        char c = sql[i];

        // Quoted string or identifier: copy through the closing quote
        if (c == '\'' || c == '"' || c == '`') {
            const char quote = c;
            result.sql += c;
            ++i;
            while (i < n) {
                char q = sql[i];
                result.sql += q;
                ++i;
                if (q == '\\' && quote != '`' && i < n) {
                    result.sql += sql[i++];
                } else if (q == quote) {
                    // Doubled quote is an escaped quote
                    if (i < n && sql[i] == quote) {
                        result.sql += sql[i++];
                    } else {
                        break;
                    }
                }
            }
            continue;
        }

        // -- line comment (MySQL requires whitespace after --) or # comment
        if ((c == '-' && i + 2 < n && sql[i + 1] == '-' &&
             std::isspace(static_cast<unsigned char>(sql[i + 2]))) || c == '#') {
            while (i < n && sql[i] != '\n') {
                result.sql += sql[i++];
            }
            continue;
        }

        // /* block comment */
        if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            size_t end = sql.find("*/", i + 2);
            end = (end == std::string::npos) ? n : end + 2;
            result.sql.append(sql, i, end - i);
            i = end;
            continue;
        }

        if (c == '?') {
            result.sql += '?';
            result.names.emplace_back();
            result.hasPositional = true;
            ++i;
            continue;
        }

        if (c == ':' && i + 1 < n && isNameStart(sql[i + 1]) &&
            (i == 0 || sql[i - 1] != ':')) {
            size_t start = i + 1;
            size_t end = start;
            while (end < n && isNameChar(sql[end])) {
                ++end;
            }
            result.sql += '?';
            result.names.push_back(sql.substr(start, end - start));
            result.hasNamed = true;
            i = end;
            continue;
        }

        result.sql += c;
        ++i;
    }

    return result;
}

}  // namespace tablemap
