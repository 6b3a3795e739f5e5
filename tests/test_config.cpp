#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include "ErrorHandler.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <vector>

using namespace tablemap;
using namespace std::chrono_literals;
using ::testing::HasSubstr;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "tablemap_config_test";
        std::filesystem::create_directories(tempDir_);
        unsetenv("MYSQL_PWD");
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
        unsetenv("MYSQL_PWD");
    }

    std::filesystem::path tempDir_;

    void writeConfigFile(const std::string& filename, const std::string& content) {
        std::ofstream file(tempDir_ / filename);
        file << content;
    }

    // CLI11 wants a mutable argv
    static Config parse(std::vector<std::string> args) {
        args.insert(args.begin(), "tablemap");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return Config::parseArgs(static_cast<int>(argv.size()), argv.data());
    }
};

// Default configuration tests
TEST_F(ConfigTest, DefaultConnectionConfig) {
    ConnectionConfig config;

    EXPECT_EQ(config.driver, "mysql");
    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 3306);
    EXPECT_TRUE(config.dbname.empty());
    EXPECT_TRUE(config.user.empty());
    EXPECT_TRUE(config.password.empty());
    EXPECT_EQ(config.charset, "utf8mb4");
    EXPECT_EQ(config.connect_timeout, 5000ms);
}

TEST_F(ConfigTest, DefaultOutputConfig) {
    OutputConfig config;

    EXPECT_EQ(config.format, "json");
    EXPECT_TRUE(config.pretty);
    EXPECT_EQ(config.line_style, "console");
}

// Key/value construction
TEST_F(ConfigTest, FromMapMySQL) {
    auto config = ConnectionConfig::fromMap({
        {"host", "db.example.com"},
        {"dbname", "app"},
        {"user", "appuser"},
        {"password", "secret"},
        {"port", "3307"},
    });

    EXPECT_EQ(config.driver, "mysql");
    EXPECT_EQ(config.host, "db.example.com");
    EXPECT_EQ(config.dbname, "app");
    EXPECT_EQ(config.user, "appuser");
    EXPECT_EQ(config.password, "secret");
    EXPECT_EQ(config.port, 3307);
}

TEST_F(ConfigTest, FromMapNamesMissingKeys) {
    try {
        ConnectionConfig::fromMap({{"host", "localhost"}, {"user", "root"}});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_THAT(e.what(), HasSubstr("dbname"));
        EXPECT_THAT(e.what(), HasSubstr("password"));
        EXPECT_THAT(e.what(), ::testing::Not(HasSubstr("host")));
    }
}

TEST_F(ConfigTest, FromMapSQLiteNeedsOnlyDbname) {
    auto config = ConnectionConfig::fromMap({{"driver", "sqlite"}, {"dbname", ":memory:"}});

    EXPECT_TRUE(config.isSqlite());
    EXPECT_EQ(config.dbname, ":memory:");
}

TEST_F(ConfigTest, FromMapRejectsBadPort) {
    EXPECT_THROW(ConnectionConfig::fromMap({
        {"host", "h"}, {"dbname", "d"}, {"user", "u"}, {"password", "p"}, {"port", "99999"},
    }), ConfigError);
    EXPECT_THROW(ConnectionConfig::fromMap({
        {"host", "h"}, {"dbname", "d"}, {"user", "u"}, {"password", "p"}, {"port", "abc"},
    }), ConfigError);
}

TEST_F(ConfigTest, FromMapIgnoresUnknownKeys) {
    auto config = ConnectionConfig::fromMap({
        {"host", "h"}, {"dbname", "d"}, {"user", "u"}, {"password", "p"}, {"flavour", "x"},
    });

    EXPECT_EQ(config.host, "h");
}

TEST_F(ConfigTest, Dsn) {
    ConnectionConfig mysql;
    mysql.host = "db";
    mysql.dbname = "app";
    EXPECT_EQ(mysql.dsn(), "mysql:host=db;dbname=app;charset=utf8mb4");

    ConnectionConfig sqlite;
    sqlite.driver = "sqlite3";
    sqlite.dbname = "/tmp/app.db";
    EXPECT_EQ(sqlite.dsn(), "sqlite:/tmp/app.db");
}

// Config file loading tests
TEST_F(ConfigTest, LoadFromValidFile) {
    writeConfigFile("valid.conf", R"(
# connection settings
[connection]
host = mysql.example.com
port = 3307
dbname = "app"
user = testuser
password = 'testpass'
connect_timeout = 10000

[output]
format = csv
pretty = false
line_style = html
)");

    auto config = Config::loadFromFile(tempDir_ / "valid.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->connection.host, "mysql.example.com");
    EXPECT_EQ(config->connection.port, 3307);
    EXPECT_EQ(config->connection.dbname, "app");
    EXPECT_EQ(config->connection.user, "testuser");
    EXPECT_EQ(config->connection.password, "testpass");
    EXPECT_EQ(config->connection.connect_timeout, 10000ms);
    EXPECT_EQ(config->output.format, "csv");
    EXPECT_FALSE(config->output.pretty);
    EXPECT_EQ(config->output.line_style, "html");
}

TEST_F(ConfigTest, LoadFromNonExistentFile) {
    auto config = Config::loadFromFile("/nonexistent/path/config.conf");

    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, LoadFromEmptyFile) {
    writeConfigFile("empty.conf", "");

    auto config = Config::loadFromFile(tempDir_ / "empty.conf");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->connection.host, "localhost");
}

TEST_F(ConfigTest, LoadFileWithInvalidPort) {
    writeConfigFile("invalid.conf", R"(
[connection]
port = not_a_number
)");

    EXPECT_THROW(Config::loadFromFile(tempDir_ / "invalid.conf"), ConfigError);
}

// Command line tests
TEST_F(ConfigTest, ParseArgsBasic) {
    auto config = parse({"-t", "sqlite", "-D", "app.db", "--criteria", "[1]", "SELECT * FROM user WHERE id = ?"});

    EXPECT_EQ(config.connection.driver, "sqlite");
    EXPECT_EQ(config.connection.dbname, "app.db");
    EXPECT_EQ(config.criteria, "[1]");
    EXPECT_EQ(config.sql, "SELECT * FROM user WHERE id = ?");
    EXPECT_EQ(config.output.line_style, "console");
    EXPECT_TRUE(config.output.pretty);
}

TEST_F(ConfigTest, ParseArgsFlags) {
    auto config = parse({"-D", "app", "-u", "root", "--html", "--compact", "-f", "csv", "-d", "SELECT 1"});

    EXPECT_EQ(config.output.line_style, "html");
    EXPECT_FALSE(config.output.pretty);
    EXPECT_EQ(config.output.format, "csv");
    EXPECT_TRUE(config.debug);
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    writeConfigFile("base.conf", R"(
[connection]
host = filehost
dbname = filedb
user = fileuser
)");
    std::string path = (tempDir_ / "base.conf").string();

    auto config = parse({"-c", path, "-H", "clihost", "SELECT 1"});

    EXPECT_EQ(config.connection.host, "clihost");
    EXPECT_EQ(config.connection.dbname, "filedb");
    EXPECT_EQ(config.connection.user, "fileuser");
}

// Config validation tests
TEST_F(ConfigTest, ValidateMySQL) {
    Config config;
    config.connection.dbname = "app";
    config.connection.user = "root";
    config.sql = "SELECT 1";

    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateWithoutUser) {
    Config config;
    config.connection.dbname = "app";
    config.sql = "SELECT 1";

    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateSQLiteWithoutUser) {
    Config config;
    config.connection.driver = "sqlite";
    config.connection.dbname = ":memory:";
    config.sql = "SELECT 1";

    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsUnknownDriverAndFormat) {
    Config config;
    config.connection.dbname = "app";
    config.connection.user = "root";
    config.sql = "SELECT 1";

    config.connection.driver = "oracle";
    EXPECT_FALSE(config.validate());

    config.connection.driver = "mysql";
    config.output.format = "xml";
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateWithoutStatement) {
    Config config;
    config.connection.driver = "sqlite";
    config.connection.dbname = ":memory:";

    EXPECT_FALSE(config.validate());
}

// Password resolution tests
TEST_F(ConfigTest, ResolvePasswordFromEnv) {
    Config config;
    setenv("MYSQL_PWD", "env_password", 1);

    config.resolvePassword();

    EXPECT_EQ(config.connection.password, "env_password");
}

TEST_F(ConfigTest, ResolvePasswordKeepsExisting) {
    Config config;
    config.connection.password = "existing_password";
    setenv("MYSQL_PWD", "env_password", 1);

    config.resolvePassword();

    EXPECT_EQ(config.connection.password, "existing_password");
}

TEST_F(ConfigTest, ResolvePasswordNoEnvVar) {
    Config config;

    config.resolvePassword();

    EXPECT_TRUE(config.connection.password.empty());
}
