#include "StatementBuilder.hpp"

namespace tablemap {

std::string StatementBuilder::selectById(const std::string& table) {
    return "SELECT * FROM " + table + " WHERE id = ?";
}

std::string StatementBuilder::insert(const std::string& table,
                                     const std::vector<std::string>& columns) {
    std::string fields;
    std::string placeholders;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            fields += ',';
            placeholders += ',';
        }
        fields += columns[i];
        placeholders += '?';
    }
    return "INSERT INTO " + table + " (" + fields + ") VALUES (" + placeholders + ")";
}

std::string StatementBuilder::update(const std::string& table,
                                     const std::vector<std::string>& columns, int64_t id) {
    std::string assignments;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            assignments += ',';
        }
        assignments += columns[i] + " = ?";
    }
    return "UPDATE " + table + " SET " + assignments + " WHERE id = " + std::to_string(id);
}

std::string StatementBuilder::deleteById(const std::string& table) {
    return "DELETE FROM " + table + " WHERE id = ?";
}

}  // namespace tablemap
