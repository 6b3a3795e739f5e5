#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#include <nlohmann/json.hpp>

using namespace tablemap;
using ::testing::HasSubstr;
using ::testing::Not;

class ErrorHandlerTest : public ::testing::Test {
protected:
    const std::string dump_ =
        "SQL: [33] SELECT * FROM user WHERE id = ?\n"
        "Params:  1\n"
        "Key: Position #0:\n"
        "paramno=0\n"
        "param_type=1\n"
        "value=5\n";
};

TEST_F(ErrorHandlerTest, LineFeed) {
    EXPECT_EQ(ErrorHandler::lineFeed(LineStyle::Console), "\n");
    EXPECT_EQ(ErrorHandler::lineFeed(LineStyle::Html), "</br>");
}

TEST_F(ErrorHandlerTest, FormatFailureConsole) {
    std::string output;
    {
        ErrorContext outer("persist user");
        ErrorContext inner("execute");
        BindError error("SELECT * FROM user WHERE id = ?", dump_, ER_NO_SUCH_TABLE,
                        "Table 'app.user' doesn't exist");
        output = ErrorHandler::formatFailure(error, LineStyle::Console);
    }

    EXPECT_EQ(output.rfind("Failed to execute statement:\n\n", 0), 0u);
    EXPECT_THAT(output, HasSubstr("SQL: [33] SELECT * FROM user WHERE id = ?\n"));
    EXPECT_THAT(output, HasSubstr("param_type=1\n"));
    EXPECT_THAT(output, HasSubstr("Table 'app.user' doesn't exist\n"));
    // Innermost frame first, each deeper line one dash longer
    EXPECT_THAT(output, HasSubstr(" - execute\n -- persist user\n"));
    EXPECT_THAT(output, Not(HasSubstr("</br>")));
}

TEST_F(ErrorHandlerTest, FormatFailureHtml) {
    BindError error("SELECT 1", "SQL: [8] SELECT 1\nParams:  0\n", 0, "boom");

    std::string output = ErrorHandler::formatFailure(error, LineStyle::Html);

    EXPECT_EQ(output.rfind("Failed to execute statement:</br></br>", 0), 0u);
    EXPECT_THAT(output, HasSubstr("SQL: [8] SELECT 1</br>Params:  0</br>"));
    EXPECT_THAT(output, Not(HasSubstr("\n")));
}

TEST_F(ErrorHandlerTest, ConnectionFailurePayload) {
    auto payload = nlohmann::json::parse(ErrorHandler::connectionFailurePayload());

    ASSERT_TRUE(payload.is_object());
    EXPECT_EQ(payload.size(), 2u);
    EXPECT_EQ(payload["outcome"], false);
    EXPECT_EQ(payload["message"], "Unable to connect");
}

TEST_F(ErrorHandlerTest, IsConnectionError) {
    EXPECT_TRUE(ErrorHandler::isConnectionError(CR_CONNECTION_ERROR));
    EXPECT_TRUE(ErrorHandler::isConnectionError(CR_CONN_HOST_ERROR));
    EXPECT_TRUE(ErrorHandler::isConnectionError(CR_UNKNOWN_HOST));
    EXPECT_TRUE(ErrorHandler::isConnectionError(CR_SERVER_GONE_ERROR));
    EXPECT_TRUE(ErrorHandler::isConnectionError(CR_SERVER_LOST));
}

TEST_F(ErrorHandlerTest, IsNotConnectionError) {
    EXPECT_FALSE(ErrorHandler::isConnectionError(0));
    EXPECT_FALSE(ErrorHandler::isConnectionError(ER_ACCESS_DENIED_ERROR));
    EXPECT_FALSE(ErrorHandler::isConnectionError(ER_NO_SUCH_TABLE));
}

TEST_F(ErrorHandlerTest, GetErrorMessageKnownErrors) {
    EXPECT_EQ(ErrorHandler::getErrorMessage(0), "Success");
    EXPECT_EQ(ErrorHandler::getErrorMessage(ER_ACCESS_DENIED_ERROR), "Access denied");
    EXPECT_EQ(ErrorHandler::getErrorMessage(ER_NO_SUCH_TABLE), "Table does not exist");
    EXPECT_EQ(ErrorHandler::getErrorMessage(ER_BAD_FIELD_ERROR), "Unknown column");
}

TEST_F(ErrorHandlerTest, GetErrorMessageUnknown) {
    EXPECT_THAT(ErrorHandler::getErrorMessage(99999), HasSubstr("MySQL error 99999"));
}

// ErrorContext tests
class ErrorContextTest : public ::testing::Test {
};

TEST_F(ErrorContextTest, SetAndGetContext) {
    EXPECT_TRUE(ErrorContext::current().empty());

    {
        ErrorContext ctx("operation1");
        EXPECT_EQ(ErrorContext::current(), "operation1");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, NestedContext) {
    {
        ErrorContext ctx1("level1");
        {
            ErrorContext ctx2("level2");
            {
                ErrorContext ctx3("level3");
                EXPECT_EQ(ErrorContext::current(), "level1 > level2 > level3");
                EXPECT_EQ(ErrorContext::frames().size(), 3u);
            }
            EXPECT_EQ(ErrorContext::current(), "level1 > level2");
        }
        EXPECT_EQ(ErrorContext::current(), "level1");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, ContextRestoredOnException) {
    try {
        ErrorContext ctx1("outer");
        ErrorContext ctx2("inner");
        throw BindError("SELECT 1", "", 0, "test");
    } catch (const BindError& e) {
        // The error keeps the chain that was active when it was raised
        ASSERT_EQ(e.context().size(), 2u);
        EXPECT_EQ(e.context()[0], "outer");
        EXPECT_EQ(e.context()[1], "inner");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

// Exception hierarchy tests
class MapperErrorTest : public ::testing::Test {
};

TEST_F(MapperErrorTest, ConnectionErrorCarriesCode) {
    ConnectionError ex(CR_CONN_HOST_ERROR, "Can't connect to MySQL server on 'db'");

    EXPECT_EQ(ex.errorCode(), static_cast<unsigned int>(CR_CONN_HOST_ERROR));
    EXPECT_STREQ(ex.what(), "Can't connect to MySQL server on 'db'");
}

TEST_F(MapperErrorTest, BindErrorMessage) {
    BindError ex("SELECT 1", "dump", ER_PARSE_ERROR, "syntax error");

    EXPECT_STREQ(ex.what(), "Failed to execute statement: syntax error");
    EXPECT_EQ(ex.sql(), "SELECT 1");
    EXPECT_EQ(ex.paramsDump(), "dump");
    EXPECT_TRUE(ex.context().empty());
}

TEST_F(MapperErrorTest, CanBeCaughtAsBase) {
    EXPECT_THROW(throw MappingError("no id"), MapperError);
    EXPECT_THROW(throw ConfigError("missing"), std::runtime_error);
}
