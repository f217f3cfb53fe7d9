/**
 * XmlGuard - Platform Implementation (Linux)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_LINUX

#include "Platform.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace xmlguard {

std::filesystem::path Platform::getConfigPath() {
    // Use XDG_CONFIG_HOME if set, otherwise ~/.config
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return std::filesystem::path(xdgConfig) / "xmlguard";
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "xmlguard";
    }

    return std::filesystem::path(".config") / "xmlguard";
}

std::filesystem::path Platform::getDataPath() {
    // Use XDG_DATA_HOME if set, otherwise ~/.local/share
    const char* xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && xdgData[0] != '\0') {
        return std::filesystem::path(xdgData) / "xmlguard";
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".local" / "share" / "xmlguard";
    }

    return std::filesystem::path(".local/share") / "xmlguard";
}

std::string Platform::currentUserName() {
    const char* user = std::getenv("USER");
    if (user && user[0] != '\0') {
        return user;
    }

    if (const passwd* pw = getpwuid(geteuid())) {
        if (pw->pw_name && pw->pw_name[0] != '\0') {
            return pw->pw_name;
        }
    }

    spdlog::debug("Could not determine the current user name");
    return "unknown";
}

} // namespace xmlguard

#endif // PLATFORM_LINUX
