/**
 * XmlGuard - Platform Common Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Platform.hpp"

// Directory lookups and the user name are implemented in LinuxPlatform.cpp

namespace xmlguard {

std::filesystem::path Platform::getLogPath() {
    return getDataPath() / "logs";
}

} // namespace xmlguard
