#include "gmailcli/spdlog_extensions.hpp"

#include <vector>
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

std::shared_ptr<spdlog::logger> CreateGmailLogger(const std::string & name, const std::string & logPath, bool verbose) {
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;

    // stdout carries the JSON result, so the console sink writes to stderr.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    stderr_sink->set_pattern("%l: %v");
    sinks.push_back(stderr_sink);

    std::string fileError = "";
    if (logPath != "") {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3);
            file_sink->set_level(spdlog::level::info);
            file_sink->set_pattern("%P %+");
            sinks.push_back(file_sink);
        } catch (spdlog::spdlog_ex & ex) {
            fileError = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(name, std::begin(sinks), std::end(sinks));
    logger->set_level(spdlog::level::debug);
    if (fileError != "") {
        logger->warn("Logging to stderr only, unable to open {}: {}", logPath, fileError);
    }
    return logger;
}
