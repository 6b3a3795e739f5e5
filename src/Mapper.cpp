#include "Mapper.hpp"
#include "Config.hpp"
#include "ParameterBinder.hpp"
#include "StatementBuilder.hpp"
#include <spdlog/spdlog.h>

namespace tablemap {

Mapper::Mapper(const ConnectionConfig& config)
    : m_conn(openConnection(config)) {
}

Mapper::Mapper(std::unique_ptr<Connection> connection)
    : m_conn(std::move(connection)) {
    if (!m_conn) {
        throw ConnectionError(0, "Mapper needs an open connection");
    }
}

Mapper::~Mapper() = default;

std::unique_ptr<Statement> Mapper::prepare(const std::string& sql) {
    spdlog::debug("Preparing: {}", sql);

    auto statement = m_conn->prepare(sql);
    if (!statement) {
        const std::string message = m_conn->error();
        spdlog::error("Failed to prepare '{}': {}", sql, message);
        throw BindError(sql, formatParamDump(sql, {}), m_conn->errorCode(), message);
    }
    return statement;
}

int64_t Mapper::lastInsertId() const {
    return m_conn->lastInsertId();
}

Statement& Mapper::execute(Statement& statement, const Criteria& criteria) {
    return ParameterBinder::bindAndExecute(statement, criteria);
}

std::optional<Row> Mapper::findOne(Statement& statement, const Criteria& criteria) {
    return execute(statement, criteria).fetch();
}

std::vector<Row> Mapper::findAll(Statement& statement, const Criteria& criteria) {
    return execute(statement, criteria).fetchAll();
}

std::optional<Row> Mapper::selectById(const std::string& table, int64_t id) {
    auto statement = prepare(StatementBuilder::selectById(table));
    return findOne(*statement, {id});
}

int64_t Mapper::insertRow(const std::string& table, const FieldValues& fields) {
    ErrorContext context("insert");

    // Null fields are left out so the column default applies
    std::vector<std::string> columns;
    Criteria criteria;
    for (const auto& [column, value] : fields) {
        if (isNull(value)) {
            continue;
        }
        columns.push_back(column);
        criteria.add(value);
    }

    auto statement = prepare(StatementBuilder::insert(table, columns));
    execute(*statement, criteria);

    int64_t id = lastInsertId();
    spdlog::debug("Inserted into {} with id {}", table, id);
    return id;
}

int64_t Mapper::updateRow(const std::string& table, int64_t id, const FieldValues& fields) {
    ErrorContext context("update");

    // Every field is written, id included, while the WHERE uses the literal id
    std::vector<std::string> columns;
    Criteria criteria;
    for (const auto& [column, value] : fields) {
        columns.push_back(column);
        criteria.add(value);
    }

    auto statement = prepare(StatementBuilder::update(table, columns, id));
    execute(*statement, criteria);

    spdlog::debug("Updated {} id {} ({} row(s))", table, id, statement->rowCount());
    return id;
}

bool Mapper::deleteRow(const std::string& table, int64_t id) {
    ErrorContext context("delete");

    auto statement = prepare(StatementBuilder::deleteById(table));
    execute(*statement, {id});

    spdlog::debug("Deleted from {} id {} ({} row(s))", table, id, statement->rowCount());
    return true;
}

}  // namespace tablemap
