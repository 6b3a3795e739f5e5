#include "Connection.hpp"
#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "MySQLConnection.hpp"
#include "SQLiteConnection.hpp"
#include <spdlog/spdlog.h>

namespace tablemap {

std::unique_ptr<Connection> openConnection(const ConnectionConfig& config) {
    spdlog::info("Connecting to {} as {}", config.dsn(),
                 config.user.empty() ? std::string("<none>") : config.user);

    if (config.isSqlite()) {
        return std::make_unique<SQLiteConnection>(config.dbname);
    }
    if (config.driver == "mysql") {
        return std::make_unique<MySQLConnection>(config);
    }

    throw ConnectionError(0, "Unsupported driver: " + config.driver);
}

}  // namespace tablemap
