#include "Value.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tablemap {

std::string valueToString(const Value& value) {
    if (isInteger(value)) {
        return std::to_string(std::get<int64_t>(value));
    }
    if (isText(value)) {
        return std::get<std::string>(value);
    }
    return "NULL";
}

Row::Row(std::initializer_list<Column> columns) {
    for (const auto& column : columns) {
        set(column.first, column.second);
    }
}

void Row::set(const std::string& column, Value value) {
    for (auto& existing : m_columns) {
        if (existing.first == column) {
            existing.second = std::move(value);
            return;
        }
    }
    m_columns.emplace_back(column, std::move(value));
}

const Value* Row::find(const std::string& column) const {
    for (const auto& existing : m_columns) {
        if (existing.first == column) {
            return &existing.second;
        }
    }
    return nullptr;
}

std::vector<std::string> Row::columnNames() const {
    std::vector<std::string> names;
    names.reserve(m_columns.size());
    for (const auto& column : m_columns) {
        names.push_back(column.first);
    }
    return names;
}

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Length of the numeric prefix starting at pos, 0 if there is none
size_t numericPrefix(const std::string& text, size_t pos) {
    size_t i = pos;
    const size_t n = text.size();

    if (i < n && (text[i] == '+' || text[i] == '-')) ++i;

    size_t digits = 0;
    while (i < n && isDigit(text[i])) { ++i; ++digits; }
    if (i < n && text[i] == '.') {
        ++i;
        while (i < n && isDigit(text[i])) { ++i; ++digits; }
    }
    if (digits == 0) {
        return 0;
    }

    // Exponent only counts when digits follow it
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        size_t e = i + 1;
        if (e < n && (text[e] == '+' || text[e] == '-')) ++e;
        if (e < n && isDigit(text[e])) {
            while (e < n && isDigit(text[e])) ++e;
            i = e;
        }
    }
    return i - pos;
}

size_t skipLeadingSpace(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    return i;
}

}  // namespace

bool isNumeric(const std::string& text) {
    size_t start = skipLeadingSpace(text);
    size_t length = numericPrefix(text, start);
    if (length == 0) {
        return false;
    }
    // Trailing whitespace is tolerated, nothing else
    for (size_t i = start + length; i < text.size(); ++i) {
        if (!std::isspace(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

int64_t textToInteger(const std::string& text) {
    size_t start = skipLeadingSpace(text);
    size_t length = numericPrefix(text, start);
    if (length == 0) {
        return 0;
    }

    std::string number = text.substr(start, length);
    if (number.find_first_of(".eE") == std::string::npos) {
        errno = 0;
        long long parsed = std::strtoll(number.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            return parsed;
        }
    }

    return doubleToInteger(std::strtod(number.c_str(), nullptr));
}

int64_t doubleToInteger(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    if (value >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return std::numeric_limits<int64_t>::max();
    }
    if (value <= static_cast<double>(std::numeric_limits<int64_t>::min())) {
        return std::numeric_limits<int64_t>::min();
    }
    return static_cast<int64_t>(value);
}

Value coerceNumeric(const Value& value) {
    if (isText(value)) {
        const auto& text = std::get<std::string>(value);
        if (isNumeric(text)) {
            return Value{textToInteger(text)};
        }
    }
    return value;
}

}  // namespace tablemap
