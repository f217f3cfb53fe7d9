/**
 * XmlGuard - Command line validator
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <QCoreApplication>
#include <QCommandLineParser>

#include <filesystem>
#include <iostream>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/Logging.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"
#include "safety/FileSafetyManager.hpp"
#include "validation/ReportFormatter.hpp"
#include "validation/ValidationEngine.hpp"

namespace {

constexpr int EXIT_FINDINGS = 1;
constexpr int EXIT_USAGE = 2;

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("xmlguard-validate");
    app.setApplicationVersion(XMLGUARD_VERSION);
    app.setOrganizationName("xmlguard");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Check XML game data for consistency problems");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);

    QCommandLineOption htmlOption(
        QStringList() << "html",
        "Write an HTML report to this file",
        "file"
    );
    parser.addOption(htmlOption);

    parser.addPositionalArgument("directories", "Data directories to validate", "<dir>...");

    parser.process(app);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        std::cerr << parser.helpText().toStdString();
        return EXIT_USAGE;
    }

    // Initialize configuration
    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = parser.value(configDirOption).toStdString();
    } else {
        configPath = xmlguard::Platform::getConfigPath();
    }

    auto& configManager = xmlguard::ConfigManager::instance();
    const bool configLoaded = configManager.initialize(configPath, xmlguard::Platform::getDataPath());

    xmlguard::setupLogging(xmlguard::Platform::getLogPath(),
                           configManager.programConfig().logVerbosity);

    if (!configLoaded) {
        spdlog::error("Failed to initialize configuration");
        return EXIT_USAGE;
    }
    spdlog::info("Configuration loaded from: {}", configPath.string());

    std::vector<std::filesystem::path> directories;
    for (const auto& dir : positional) {
        directories.emplace_back(dir.toStdString());
    }

    xmlguard::FileSafetyManager safety(configManager.safetyConfig());
    xmlguard::ValidationEngine engine(safety, configManager.validationConfig());

    auto report = engine.validateAll(directories);

    std::cout << xmlguard::ReportFormatter::summary(report).toStdString() << "\n";
    for (const auto& skipped : report.skippedRules()) {
        std::cout << "  skipped " << skipped.name << ": " << skipped.reason << "\n";
    }

    if (parser.isSet(htmlOption)) {
        const auto htmlPath = parser.value(htmlOption);
        QString error;
        if (!xmlguard::ReportFormatter::writeHtml(report, htmlPath, &error)) {
            spdlog::error("Cannot write report {}: {}", htmlPath.toStdString(), error.toStdString());
            return EXIT_USAGE;
        }
        spdlog::info("HTML report written to {}", htmlPath.toStdString());
    }

    return report.hasErrors() ? EXIT_FINDINGS : 0;
}
