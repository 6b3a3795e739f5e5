#include "FormatConverter.hpp"
#include <sstream>

namespace tablemap {

json FormatConverter::rowToJSONObject(const Row& row, const JSONOptions& options) {
    json obj = json::object();

    for (const auto& [column, value] : row) {
        if (isInteger(value)) {
            obj[column] = std::get<int64_t>(value);
        } else if (isText(value)) {
            obj[column] = std::get<std::string>(value);
        } else if (options.includeNull) {
            obj[column] = nullptr;
        }
    }

    return obj;
}

std::string FormatConverter::rowToJSON(const Row& row, const JSONOptions& options) {
    json obj = rowToJSONObject(row, options);
    return options.pretty ? obj.dump(options.indent) : obj.dump();
}

std::string FormatConverter::rowsToJSON(const std::vector<Row>& rows,
                                        const JSONOptions& options) {
    json arr = json::array();

    for (const auto& row : rows) {
        arr.push_back(rowToJSONObject(row, options));
    }

    return options.pretty ? arr.dump(options.indent) : arr.dump();
}

std::string FormatConverter::rowsToCSV(const std::vector<Row>& rows,
                                       const CSVOptions& options) {
    std::ostringstream out;
    if (rows.empty()) {
        return out.str();
    }

    const auto columns = rows.front().columnNames();

    // Header
    if (options.includeHeader) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(columns[i], options);
        }
        out << options.lineEnding;
    }

    // Rows
    for (const auto& row : rows) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;

            const Value* value = row.find(columns[i]);
            if (value && !isNull(*value)) {
                out << escapeCSVField(valueToString(*value), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

}  // namespace tablemap
