#pragma once

#include "Statement.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace tablemap {

struct ConnectionConfig;

// One open database handle. Held for the owner's lifetime and closed on
// destruction; not safe for concurrent use.
class Connection {
public:
    virtual ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Compile SQL; nullptr on failure (see error()/errorCode())
    virtual std::unique_ptr<Statement> prepare(const std::string& sql) = 0;

    // Auto-generated id of the last INSERT on this connection
    virtual int64_t lastInsertId() const = 0;

    virtual std::string error() const = 0;
    virtual unsigned int errorCode() const = 0;

    // "mysql" or "sqlite"
    virtual std::string driverName() const = 0;

protected:
    Connection() = default;
};

// Open the driver named by config.driver. Throws ConnectionError.
std::unique_ptr<Connection> openConnection(const ConnectionConfig& config);

}  // namespace tablemap
