#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tablemap {

// A scalar exchanged with the driver: NULL, integer or text
using Value = std::variant<std::monostate, int64_t, std::string>;

// Ordered (column, value) pairs extracted from an entity
using FieldValues = std::vector<std::pair<std::string, Value>>;

inline bool isNull(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

inline bool isText(const Value& value) {
    return std::holds_alternative<std::string>(value);
}

inline bool isInteger(const Value& value) {
    return std::holds_alternative<int64_t>(value);
}

// Display form used in logs and parameter dumps ("NULL" for null)
std::string valueToString(const Value& value);

// True for text a scripting runtime would treat as a number:
// optional leading whitespace, sign, digits with optional fraction,
// optional exponent ("42", " -3.5", "1e3", ".5").
bool isNumeric(const std::string& text);

// Integer value of text, truncated toward zero. Only the leading numeric
// part counts ("12abc" is 12); text without one is 0.
int64_t textToInteger(const std::string& text);

// Truncates toward zero, saturating at the int64_t limits (NaN is 0)
int64_t doubleToInteger(double value);

// Numeric-looking text becomes an integer; anything else passes through
Value coerceNumeric(const Value& value);

// One fetched record. Columns keep result-set order; lookup is by name.
class Row {
public:
    using Column = std::pair<std::string, Value>;
    using const_iterator = std::vector<Column>::const_iterator;

    Row() = default;
    Row(std::initializer_list<Column> columns);

    // Replaces the value if the column is already present
    void set(const std::string& column, Value value);

    const Value* find(const std::string& column) const;
    bool contains(const std::string& column) const { return find(column) != nullptr; }

    const std::vector<Column>& columns() const { return m_columns; }
    std::vector<std::string> columnNames() const;

    size_t size() const { return m_columns.size(); }
    bool empty() const { return m_columns.empty(); }

    const_iterator begin() const { return m_columns.begin(); }
    const_iterator end() const { return m_columns.end(); }

    bool operator==(const Row& other) const { return m_columns == other.m_columns; }
    bool operator!=(const Row& other) const { return !(*this == other); }

private:
    std::vector<Column> m_columns;
};

}  // namespace tablemap
