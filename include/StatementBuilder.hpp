#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tablemap {

// SQL text for the single-table CRUD statements. Column names are expected
// to be sanitized already; values are always '?' placeholders except the
// UPDATE's WHERE id, which is written as a literal.
class StatementBuilder {
public:
    // SELECT * FROM <table> WHERE id = ?
    static std::string selectById(const std::string& table);

    // INSERT INTO <table> (a,b) VALUES (?,?)
    static std::string insert(const std::string& table, const std::vector<std::string>& columns);

    // UPDATE <table> SET a = ?,b = ? WHERE id = <id>
    static std::string update(const std::string& table, const std::vector<std::string>& columns,
                              int64_t id);

    // DELETE FROM <table> WHERE id = ?
    static std::string deleteById(const std::string& table);
};

}  // namespace tablemap
