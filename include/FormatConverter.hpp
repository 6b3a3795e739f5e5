#pragma once

#include "Value.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tablemap {

using json = nlohmann::json;

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
};

// Renders fetched rows for display
class FormatConverter {
public:
    // Integers as numbers, text as strings, null as null (or omitted)
    static json rowToJSONObject(const Row& row, const JSONOptions& options = JSONOptions{});

    static std::string rowToJSON(const Row& row, const JSONOptions& options = JSONOptions{});
    static std::string rowsToJSON(const std::vector<Row>& rows,
                                  const JSONOptions& options = JSONOptions{});

    // Header taken from the first row; NULL is an empty field
    static std::string rowsToCSV(const std::vector<Row>& rows,
                                 const CSVOptions& options = CSVOptions{});

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});
};

}  // namespace tablemap
