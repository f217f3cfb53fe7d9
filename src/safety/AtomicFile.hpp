/**
 * XmlGuard - Atomic File I/O
 *
 * Low-level helpers used only by the safety layer. Writes go to a sibling
 * temp file, are read back and compared, then renamed over the target.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

#include <QByteArray>

namespace xmlguard::fileio {

/**
 * Read a whole file
 *
 * @throws NotFoundError if the file does not exist
 * @throws IOFailure if it cannot be read
 */
QByteArray readAll(const std::filesystem::path& path);

/**
 * Replace a file's content atomically
 *
 * On any failure the temp file is removed and the target is untouched.
 *
 * @throws IOFailure describing the failed step
 */
void atomicWrite(const std::filesystem::path& path, const QByteArray& content);

/**
 * Write a new file that must not already exist (used for backups)
 *
 * @throws IOFailure if the file exists or cannot be written
 */
void writeNew(const std::filesystem::path& path, const QByteArray& content);

/**
 * Temp file used by atomicWrite for the given target
 */
std::filesystem::path tempPathFor(const std::filesystem::path& path);

} // namespace xmlguard::fileio
