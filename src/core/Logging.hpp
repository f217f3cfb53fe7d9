/**
 * XmlGuard - Logging Setup
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

namespace xmlguard {

/**
 * Install the default spdlog logger
 *
 * Colored console output at the requested verbosity plus a rotating
 * xmlguard.log (5 MB x 3) in logDirectory that always records debug.
 *
 * @param verbosity debug, info, warning or error; unknown values mean info
 * @return false if the log directory could not be created (console only)
 */
bool setupLogging(const std::filesystem::path& logDirectory,
                  const std::string& verbosity = "info");

} // namespace xmlguard
