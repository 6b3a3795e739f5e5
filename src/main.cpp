#include "Config.hpp"
#include "Criteria.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "Mapper.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace tablemap;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Diagnostics go to stderr so stdout carries only the result
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("tablemap", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    setupLogging(config.debug, config.log_file);

    if (!config.validate()) {
        return 1;
    }

    const LineStyle style = config.output.line_style == "html" ? LineStyle::Html
                                                               : LineStyle::Console;

    Criteria criteria;
    if (!config.criteria.empty()) {
        try {
            criteria = Criteria::fromJson(config.criteria);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    try {
        Mapper mapper(config.connection);

        auto statement = mapper.prepare(config.sql);
        auto rows = mapper.findAll(*statement, criteria);

        if (config.output.format == "csv") {
            std::cout << FormatConverter::rowsToCSV(rows);
        } else {
            JSONOptions options;
            options.pretty = config.output.pretty;
            std::cout << FormatConverter::rowsToJSON(rows, options) << std::endl;
        }

        spdlog::info("{} row(s), {} affected", rows.size(), statement->rowCount());

    } catch (const ConnectionError& e) {
        spdlog::debug("Connection failed: {}", e.what());
        std::cout << ErrorHandler::connectionFailurePayload() << std::endl;
        return 1;
    } catch (const BindError& e) {
        std::cout << ErrorHandler::formatFailure(e, style) << std::flush;
        return 1;
    } catch (const MapperError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
