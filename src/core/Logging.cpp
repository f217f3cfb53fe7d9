/**
 * XmlGuard - Logging Setup Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Logging.hpp"

#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace xmlguard {

namespace {

spdlog::level::level_enum levelFromString(const std::string& verbosity) {
    if (verbosity == "debug") return spdlog::level::debug;
    if (verbosity == "warning") return spdlog::level::warn;
    if (verbosity == "error") return spdlog::level::err;
    return spdlog::level::info;
}

} // anonymous namespace

bool setupLogging(const std::filesystem::path& logDirectory, const std::string& verbosity) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(levelFromString(verbosity));

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    // Ensure log directory exists
    std::error_code ec;
    std::filesystem::create_directories(logDirectory, ec);

    std::string fileError = ec ? ec.message() : std::string();
    if (fileError.empty()) {
        try {
            auto logPath = logDirectory / "xmlguard.log";
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), 1024 * 1024 * 5, 3);
            file_sink->set_level(spdlog::level::debug);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("xmlguard", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);

    if (!fileError.empty()) {
        spdlog::warn("File logging disabled, cannot use {}: {}", logDirectory.string(), fileError);
    }
    spdlog::info("XmlGuard {} starting up...", XMLGUARD_VERSION);
    return fileError.empty();
}

} // namespace xmlguard
