/**
 * XmlGuard - Safety Config Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SafetyConfig.hpp"
#include "core/platform/Platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace xmlguard {

std::string SafetyConfig::resolvedActor() const {
    if (!defaultActor.empty()) {
        return defaultActor;
    }
    return Platform::currentUserName();
}

SafetyConfig SafetyConfig::fromJson(const std::string& json) {
    SafetyConfig config;

    try {
        auto j = nlohmann::json::parse(json);

        if (j.contains("backupDirectory")) {
            config.backupDirectory = j["backupDirectory"].get<std::string>();
        }
        if (j.contains("auditLogPath")) {
            config.auditLogPath = j["auditLogPath"].get<std::string>();
        }
        if (j.contains("maxBackupVersions")) {
            config.maxBackupVersions = j["maxBackupVersions"].get<int>();
        }
        if (j.contains("maxFileSize")) {
            config.maxFileSize = j["maxFileSize"].get<std::uint64_t>();
        }
        if (j.contains("defaultActor")) {
            config.defaultActor = j["defaultActor"].get<std::string>();
        }

    } catch (const std::exception& e) {
        spdlog::warn("Invalid safety config, using defaults: {}", e.what());
        return SafetyConfig{};
    }

    if (config.maxBackupVersions < 1) {
        spdlog::warn("maxBackupVersions must be at least 1 (got {}), using 1",
                     config.maxBackupVersions);
        config.maxBackupVersions = 1;
    }

    return config;
}

std::string SafetyConfig::toJson() const {
    nlohmann::json j;

    j["backupDirectory"] = backupDirectory.string();
    j["auditLogPath"] = auditLogPath.string();
    j["maxBackupVersions"] = maxBackupVersions;
    j["maxFileSize"] = maxFileSize;
    j["defaultActor"] = defaultActor;

    return j.dump(2);
}

} // namespace xmlguard
