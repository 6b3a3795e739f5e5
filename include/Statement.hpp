#pragma once

#include "Value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tablemap {

// A parameter slot as remembered by a driver statement, for debug dumps
struct BoundParameter {
    std::string name;  // empty for '?' placeholders
    Value value;
    bool bound = false;
};

// Prepared statement handle. Owned by whoever prepared it; never shared
// between operations. Parameter indices are 1-based.
class Statement {
public:
    virtual ~Statement() = default;

    // Non-copyable, non-movable
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    virtual const std::string& sql() const = 0;
    virtual int parameterCount() const = 0;

    // Binding returns false when the index or name does not exist
    virtual bool bindText(int index, const std::string& value) = 0;
    virtual bool bindInt(int index, int64_t value) = 0;
    virtual bool bindNamedText(const std::string& name, const std::string& value) = 0;
    virtual bool bindNamedInt(const std::string& name, int64_t value) = 0;

    // Run the statement; on false, errorMessage()/errorCode() tell why
    virtual bool execute() = 0;

    // Next row of the last execution, or nullopt when exhausted
    virtual std::optional<Row> fetch() = 0;
    virtual std::vector<Row> fetchAll();

    // Rows changed by the last INSERT/UPDATE/DELETE
    virtual uint64_t rowCount() const = 0;

    virtual std::string errorMessage() const = 0;
    virtual unsigned int errorCode() const = 0;

    // SQL text plus the bound parameter slots
    virtual std::string debugDumpParams() const = 0;

protected:
    Statement() = default;
};

// Strips a leading ':' so ":id" and "id" name the same parameter
std::string normalizeParameterName(const std::string& name);

// Layout shared by the driver statements:
//   SQL: [len] text
//   Params:  n
//   Key: Position #0: / Key: Name: [len] :name
//   paramno=0
//   param_type=1 (int) | 2 (text) | 0 (unbound/null)
//   value=...
std::string formatParamDump(const std::string& sql,
                            const std::vector<BoundParameter>& params);

}  // namespace tablemap
