#pragma once

#include "Connection.hpp"
#include "Statement.hpp"
#include <gmock/gmock.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tablemap {
namespace test {

class MockStatement : public Statement {
public:
    explicit MockStatement(std::string sql = "SELECT 1") : m_sql(std::move(sql)) {
        using ::testing::_;
        using ::testing::Return;
        using ::testing::ReturnRef;

        ON_CALL(*this, sql()).WillByDefault(ReturnRef(m_sql));
        ON_CALL(*this, bindText(_, _)).WillByDefault(Return(true));
        ON_CALL(*this, bindInt(_, _)).WillByDefault(Return(true));
        ON_CALL(*this, bindNamedText(_, _)).WillByDefault(Return(true));
        ON_CALL(*this, bindNamedInt(_, _)).WillByDefault(Return(true));
        ON_CALL(*this, execute()).WillByDefault(Return(true));
        ON_CALL(*this, fetch()).WillByDefault(Return(std::nullopt));
        ON_CALL(*this, debugDumpParams()).WillByDefault(Return("SQL: [" + std::to_string(m_sql.size()) + "] " + m_sql + "\nParams:  0\n"));
    }

    MOCK_METHOD(const std::string&, sql, (), (const, override));
    MOCK_METHOD(int, parameterCount, (), (const, override));
    MOCK_METHOD(bool, bindText, (int index, const std::string& value), (override));
    MOCK_METHOD(bool, bindInt, (int index, int64_t value), (override));
    MOCK_METHOD(bool, bindNamedText, (const std::string& name, const std::string& value), (override));
    MOCK_METHOD(bool, bindNamedInt, (const std::string& name, int64_t value), (override));
    MOCK_METHOD(bool, execute, (), (override));
    MOCK_METHOD(std::optional<Row>, fetch, (), (override));
    MOCK_METHOD(uint64_t, rowCount, (), (const, override));
    MOCK_METHOD(std::string, errorMessage, (), (const, override));
    MOCK_METHOD(unsigned int, errorCode, (), (const, override));
    MOCK_METHOD(std::string, debugDumpParams, (), (const, override));

private:
    std::string m_sql;
};

// Hands out NiceMock statements and remembers the SQL it was asked for
class RecordingConnection : public Connection {
public:
    std::unique_ptr<Statement> prepare(const std::string& sql) override {
        prepared.push_back(sql);
        auto statement = std::make_unique<::testing::NiceMock<MockStatement>>(sql);
        if (onPrepare) {
            onPrepare(*statement);
        }
        return statement;
    }

    int64_t lastInsertId() const override { return nextInsertId; }
    std::string error() const override { return ""; }
    unsigned int errorCode() const override { return 0; }
    std::string driverName() const override { return "mock"; }

    std::vector<std::string> prepared;
    int64_t nextInsertId = 1;
    std::function<void(::testing::NiceMock<MockStatement>&)> onPrepare;
};

}  // namespace test
}  // namespace tablemap
