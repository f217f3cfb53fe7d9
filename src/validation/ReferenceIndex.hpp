/**
 * XmlGuard - Reference Index
 *
 * Entity definitions and cross-document references of one document
 * snapshot, built once per validation run and shared read-only by every
 * rule.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <QString>

#include "EntityCatalog.hpp"

namespace xmlguard {

/**
 * Definitions, references and the reverse-reference map of a snapshot
 *
 * Element pointers point into the snapshot's documents; the index must not
 * outlive the snapshot it was built from.
 */
class ReferenceIndex {
public:
    struct Reference {
        const ReferenceKind* kind = nullptr;
        QString id;
        ElementRef source;
    };

    static ReferenceIndex build(const DocumentMap& documents);

    /**
     * Identifiers defined for a kind
     */
    const std::set<QString>& ids(EntityKind kind) const;
    bool contains(EntityKind kind, const QString& id) const;

    /**
     * Every definition of every identifier of a kind (more than one
     * location means a duplicate)
     */
    const std::map<QString, std::vector<ElementRef>>& definitions(EntityKind kind) const;

    /**
     * Documents holding a reference to the given entity
     */
    const std::set<std::string>& referencingFiles(EntityKind kind, const QString& id) const;
    bool isReferenced(EntityKind kind, const QString& id) const;

    /**
     * Documents that reference any entity defined in the given document
     */
    std::set<std::string> filesReferencing(const std::string& file) const;

    const std::vector<Reference>& references() const { return m_references; }

private:
    std::map<EntityKind, std::map<QString, std::vector<ElementRef>>> m_definitions;
    std::map<EntityKind, std::set<QString>> m_ids;
    std::map<std::pair<EntityKind, QString>, std::set<std::string>> m_reverse;
    std::vector<Reference> m_references;
};

} // namespace xmlguard
