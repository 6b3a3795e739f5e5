#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace tablemap {

struct ConnectionConfig {
    std::string driver = "mysql";  // mysql, sqlite
    std::string host = "localhost";
    uint16_t port = 3306;
    std::string dbname;            // database name, or file path for sqlite
    std::string user;
    std::string password;
    std::string socket;
    std::string charset = "utf8mb4";

    std::chrono::milliseconds connect_timeout{5000};

    // Build from a key/value mapping. host, dbname, user and password are
    // required for mysql, dbname alone for sqlite. Throws ConfigError.
    static ConnectionConfig fromMap(const std::map<std::string, std::string>& values);

    // Driver connection string, e.g. mysql:host=db;dbname=app;charset=utf8mb4
    std::string dsn() const;

    bool isSqlite() const;
};

struct OutputConfig {
    std::string format = "json";        // json, csv
    bool pretty = true;
    std::string line_style = "console"; // console, html
};

struct Config {
    ConnectionConfig connection;
    OutputConfig output;

    std::string sql;
    std::string criteria;  // JSON array or object
    std::string log_file;
    bool debug = false;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments; a -c file is read first, flags override it
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();
};

}  // namespace tablemap
