#include "Config.hpp"
#include "ErrorHandler.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <vector>

namespace tablemap {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

uint16_t parsePort(const std::string& value) {
    try {
        int port = std::stoi(value);
        if (port <= 0 || port > 65535) {
            throw ConfigError("Port out of range: " + value);
        }
        return static_cast<uint16_t>(port);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid port: " + value);
    }
}

std::chrono::milliseconds parseTimeout(const std::string& value) {
    try {
        return std::chrono::milliseconds(std::stoi(value));
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid connect_timeout: " + value);
    }
}

}  // namespace

ConnectionConfig ConnectionConfig::fromMap(const std::map<std::string, std::string>& values) {
    ConnectionConfig config;

    auto driver = values.find("driver");
    if (driver != values.end()) {
        config.driver = driver->second;
    }

    std::vector<std::string> required = {"dbname"};
    if (!config.isSqlite()) {
        required = {"host", "dbname", "user", "password"};
    }

    std::string missing;
    for (const auto& key : required) {
        if (values.find(key) == values.end()) {
            missing += missing.empty() ? key : ", " + key;
        }
    }
    if (!missing.empty()) {
        throw ConfigError("Missing connection settings: " + missing);
    }

    for (const auto& [key, value] : values) {
        if (key == "host") config.host = value;
        else if (key == "dbname") config.dbname = value;
        else if (key == "user") config.user = value;
        else if (key == "password") config.password = value;
        else if (key == "port") config.port = parsePort(value);
        else if (key == "socket") config.socket = value;
        else if (key == "charset") config.charset = value;
        else if (key == "connect_timeout")
            config.connect_timeout = parseTimeout(value);
        else if (key != "driver")
            spdlog::warn("Ignoring unknown connection setting '{}'", key);
    }

    return config;
}

std::string ConnectionConfig::dsn() const {
    if (isSqlite()) {
        return "sqlite:" + dbname;
    }
    return driver + ":host=" + host + ";dbname=" + dbname + ";charset=" + charset;
}

bool ConnectionConfig::isSqlite() const {
    return driver == "sqlite" || driver == "sqlite3";
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::map<std::string, std::string> connection;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (current_section == "connection") {
            connection[key] = value;
        }
        else if (current_section == "output") {
            if (key == "format") config.output.format = value;
            else if (key == "pretty") config.output.pretty = parseBool(value);
            else if (key == "line_style") config.output.line_style = value;
        }
    }

    // Apply whatever is present; completeness is checked by validate()
    for (const auto& [key, value] : connection) {
        if (key == "driver") config.connection.driver = value;
        else if (key == "host") config.connection.host = value;
        else if (key == "port") config.connection.port = parsePort(value);
        else if (key == "dbname") config.connection.dbname = value;
        else if (key == "user") config.connection.user = value;
        else if (key == "password") config.connection.password = value;
        else if (key == "socket") config.connection.socket = value;
        else if (key == "charset") config.connection.charset = value;
        else if (key == "connect_timeout")
            config.connection.connect_timeout = parseTimeout(value);
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"tablemap - run a statement through the entity mapper"};

    std::string config_file;
    std::string driver, host, dbname, user, password, socket, format;
    uint16_t port = 0;
    bool html = false;
    bool compact = false;
    bool debug = false;
    std::string sql, criteria, log_file;

    app.add_option("-c,--config", config_file, "Path to configuration file");
    auto* driverOpt = app.add_option("-t,--driver", driver, "Database driver (mysql, sqlite)");
    auto* hostOpt = app.add_option("-H,--host", host, "Database server host");
    auto* portOpt = app.add_option("-P,--port", port, "Database server port");
    auto* dbOpt = app.add_option("-D,--dbname", dbname, "Database name (or SQLite file path)");
    auto* userOpt = app.add_option("-u,--user", user, "Database username");
    auto* passOpt = app.add_option("-p,--password", password, "Database password");
    auto* socketOpt = app.add_option("-S,--socket", socket, "Unix socket path");
    auto* formatOpt = app.add_option("-f,--format", format, "Output format (json, csv)");
    app.add_option("--criteria", criteria, "Bind values as a JSON array or object");
    auto* htmlOpt = app.add_flag("--html", html, "Use </br> line feeds in failure output");
    auto* compactOpt = app.add_flag("--compact", compact, "Compact JSON output");
    app.add_flag("-d,--debug", debug, "Enable debug output");
    app.add_option("--log-file", log_file, "Also write logs to this file");
    app.add_option("sql", sql, "Statement to execute")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Command line args override file config
    if (driverOpt->count()) config.connection.driver = driver;
    if (hostOpt->count()) config.connection.host = host;
    if (portOpt->count()) config.connection.port = port;
    if (dbOpt->count()) config.connection.dbname = dbname;
    if (userOpt->count()) config.connection.user = user;
    if (passOpt->count()) config.connection.password = password;
    if (socketOpt->count()) config.connection.socket = socket;
    if (formatOpt->count()) config.output.format = format;
    if (htmlOpt->count()) config.output.line_style = "html";
    if (compactOpt->count()) config.output.pretty = false;

    config.sql = sql;
    config.criteria = criteria;
    config.log_file = log_file;
    config.debug = debug;

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    if (connection.dbname.empty()) {
        spdlog::error("Database name is required (use -D option)");
        return false;
    }

    if (!connection.isSqlite()) {
        if (connection.driver != "mysql") {
            spdlog::error("Unsupported driver: {}", connection.driver);
            return false;
        }
        if (connection.user.empty()) {
            spdlog::error("Database username is required (use -u option)");
            return false;
        }
    }

    if (output.format != "json" && output.format != "csv") {
        spdlog::error("Unsupported output format: {}", output.format);
        return false;
    }

    if (output.line_style != "console" && output.line_style != "html") {
        spdlog::error("Unsupported line style: {}", output.line_style);
        return false;
    }

    if (sql.empty()) {
        spdlog::error("No statement given");
        return false;
    }

    return true;
}

void Config::resolvePassword() {
    if (connection.password.empty()) {
        const char* env_pwd = std::getenv("MYSQL_PWD");
        if (env_pwd) {
            connection.password = env_pwd;
        }
    }
}

}  // namespace tablemap
