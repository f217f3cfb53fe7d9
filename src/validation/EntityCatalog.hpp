/**
 * XmlGuard - Entity Catalog
 *
 * Which documents define which kind of game entity, and which attributes
 * refer to them. A document belongs to a kind when its lower-case file name
 * contains one of the kind's markers (e.g. "item" for item_weapons.xml).
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>
#include <vector>

#include <QString>

#include "documents/DocumentStore.hpp"

namespace xmlguard {

/**
 * Kinds of entity with a primary identifier
 */
enum class EntityKind {
    Item,
    Npc,
    Skill,
    Quest
};

std::string entityKindToString(EntityKind kind);

/**
 * Where entities of a kind are defined
 */
struct EntityKindInfo {
    EntityKind kind;
    QString tag;                          // Element name, e.g. "item"
    QString idAttribute;                  // Primary identifier attribute
    std::vector<std::string> fileMarkers; // File name fragments
};

const std::vector<EntityKindInfo>& entityKinds();
const EntityKindInfo& entityKindInfo(EntityKind kind);

/**
 * An attribute that refers to an entity of another document
 */
struct ReferenceKind {
    std::string name;                     // e.g. "drop@item_id"
    QString tag;
    QString attribute;
    EntityKind target;
};

/**
 * Every reference attribute known to the index: drop, goods and quest
 * reward item ids, and learn skill ids
 */
const std::vector<ReferenceKind>& referenceKinds();

/**
 * An element together with the document it was found in
 */
struct ElementRef {
    std::string file;
    const xml::XmlElement* element = nullptr;
};

/**
 * Lower-case last path component of a document key
 */
std::string lowerFileName(const std::string& key);

/**
 * True when the key's file name contains one of the markers
 */
bool fileMatches(const std::string& key, const std::vector<std::string>& markers);

/**
 * All elements named tag in documents whose file name matches markers,
 * ordered by document key and then document order
 */
std::vector<ElementRef> collectElements(const DocumentMap& documents,
                                        const std::vector<std::string>& markers,
                                        const QString& tag);

} // namespace xmlguard
