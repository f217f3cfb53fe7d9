/**
 * XmlGuard - Safety Errors
 *
 * Exceptions raised by the file safety layer.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "SafetyRecords.hpp"

namespace xmlguard {

/**
 * Base class for every error the safety layer reports
 */
class SafetyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Content failed validateXmlIntegrity; nothing was written
 */
class DataIntegrityError : public SafetyError {
public:
    DataIntegrityError(const std::filesystem::path& path, IntegrityCheckResult result)
        : SafetyError("Integrity check failed for " + path.string() + ": " + result.summary())
        , m_path(path)
        , m_result(std::move(result))
    {
    }

    const std::filesystem::path& path() const { return m_path; }
    const IntegrityCheckResult& result() const { return m_result; }

private:
    std::filesystem::path m_path;
    IntegrityCheckResult m_result;
};

/**
 * The actor already owns an active transaction
 */
class TransactionAlreadyActive : public SafetyError {
public:
    TransactionAlreadyActive(const std::string& actor, const std::string& activeId)
        : SafetyError("Actor '" + actor + "' already has active transaction " + activeId)
        , m_activeId(activeId)
    {
    }

    const std::string& activeTransactionId() const { return m_activeId; }

private:
    std::string m_activeId;
};

/**
 * The transaction handle is not (or no longer) active
 */
class NoActiveTransaction : public SafetyError {
public:
    using SafetyError::SafetyError;
};

/**
 * A filesystem step failed
 */
class IOFailure : public SafetyError {
public:
    IOFailure(const std::string& step, const std::filesystem::path& path, const std::string& reason)
        : SafetyError(step + " failed for " + path.string() + ": " + reason)
        , m_step(step)
        , m_path(path)
    {
    }

    const std::string& step() const { return m_step; }
    const std::filesystem::path& path() const { return m_path; }

private:
    std::string m_step;
    std::filesystem::path m_path;
};

/**
 * The requested file (or backup) does not exist
 */
class NotFoundError : public IOFailure {
public:
    explicit NotFoundError(const std::filesystem::path& path)
        : IOFailure("Lookup", path, "no such file")
    {
    }
};

} // namespace xmlguard
