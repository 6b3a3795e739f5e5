#pragma once

#include "Connection.hpp"
#include "Criteria.hpp"
#include "EntityMapping.hpp"
#include "ErrorHandler.hpp"
#include "RowMapper.hpp"
#include "Statement.hpp"
#include "Value.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tablemap {

struct ConnectionConfig;

// Binds entities to table rows. Owns a single connection for its lifetime;
// every call is synchronous and there is no state between calls. Not safe
// for concurrent use.
//
// Entity types provide `static const EntityMapping<T>& mapping()` with an
// "id" field; id 0 marks an entity that has not been stored yet.
//
// Failures throw: ConnectionError from the constructor, BindError from any
// statement that does not prepare or execute.
class Mapper {
public:
    // Throws ConnectionError
    explicit Mapper(const ConnectionConfig& config);
    explicit Mapper(std::unique_ptr<Connection> connection);
    ~Mapper();

    // Non-copyable
    Mapper(const Mapper&) = delete;
    Mapper& operator=(const Mapper&) = delete;

    Connection& connection() { return *m_conn; }

    // Throws BindError if the driver rejects the SQL
    std::unique_ptr<Statement> prepare(const std::string& sql);

    int64_t lastInsertId() const;

    Statement& execute(Statement& statement, const Criteria& criteria = {});

    std::optional<Row> findOne(Statement& statement, const Criteria& criteria = {});
    std::vector<Row> findAll(Statement& statement, const Criteria& criteria = {});

    // Entity stored under id, or nullopt
    template <typename T>
    std::optional<T> get(int64_t id);

    // Every row of a hand-written query hydrated as T
    template <typename T>
    std::vector<T> findAllAs(Statement& statement, const Criteria& criteria = {});

    // INSERT when the id is 0, UPDATE otherwise. Returns the stored id.
    template <typename T>
    int64_t persist(const T& entity);

    // DELETE by id. The entity keeps its id.
    template <typename T>
    bool remove(const T& entity);

    // Untyped forms of the entity operations
    std::optional<Row> selectById(const std::string& table, int64_t id);
    int64_t insertRow(const std::string& table, const FieldValues& fields);
    int64_t updateRow(const std::string& table, int64_t id, const FieldValues& fields);
    bool deleteRow(const std::string& table, int64_t id);

private:
    std::unique_ptr<Connection> m_conn;
};

template <typename T>
std::optional<T> Mapper::get(int64_t id) {
    const auto& mapping = T::mapping();
    ErrorContext context("get " + mapping.table());

    auto row = selectById(mapping.table(), id);
    if (!row) {
        return std::nullopt;
    }
    return RowMapper<T>::hydrate(*row);
}

template <typename T>
std::vector<T> Mapper::findAllAs(Statement& statement, const Criteria& criteria) {
    std::vector<T> entities;
    for (const auto& row : findAll(statement, criteria)) {
        entities.push_back(RowMapper<T>::hydrate(row));
    }
    return entities;
}

template <typename T>
int64_t Mapper::persist(const T& entity) {
    const auto& mapping = T::mapping();
    ErrorContext context("persist " + mapping.table());

    FieldValues fields = RowMapper<T>::extractFields(entity);
    const int64_t id = mapping.idOf(entity);

    if (id == 0) {
        // The 0 sentinel means "not assigned yet". The id column is left out
        // of the INSERT instead of being written as 0, so the database
        // assigns it even where 0 would be stored literally.
        fields[mapping.idIndex()].second = Value{};
        return insertRow(mapping.table(), fields);
    }
    return updateRow(mapping.table(), id, fields);
}

template <typename T>
bool Mapper::remove(const T& entity) {
    const auto& mapping = T::mapping();
    ErrorContext context("remove " + mapping.table());
    return deleteRow(mapping.table(), mapping.idOf(entity));
}

}  // namespace tablemap
