/**
 * XmlGuard - Entity Catalog Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "EntityCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace xmlguard {

std::string entityKindToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::Item:  return "item";
        case EntityKind::Npc:   return "npc";
        case EntityKind::Skill: return "skill";
        case EntityKind::Quest: return "quest";
    }
    return "unknown";
}

const std::vector<EntityKindInfo>& entityKinds() {
    static const std::vector<EntityKindInfo> kinds = {
        {EntityKind::Item,  "item",  "id", {"item"}},
        {EntityKind::Npc,   "npc",   "id", {"npc"}},
        {EntityKind::Skill, "skill", "id", {"skill"}},
        {EntityKind::Quest, "quest", "id", {"quest"}},
    };
    return kinds;
}

const EntityKindInfo& entityKindInfo(EntityKind kind) {
    for (const auto& info : entityKinds()) {
        if (info.kind == kind) {
            return info;
        }
    }
    throw std::out_of_range("Unknown entity kind");
}

const std::vector<ReferenceKind>& referenceKinds() {
    static const std::vector<ReferenceKind> kinds = {
        {"drop@item_id",   "drop",   "item_id",  EntityKind::Item},
        {"goods@item_id",  "goods",  "item_id",  EntityKind::Item},
        {"reward@item_id", "reward", "item_id",  EntityKind::Item},
        {"learn@skill_id", "learn",  "skill_id", EntityKind::Skill},
    };
    return kinds;
}

std::string lowerFileName(const std::string& key) {
    auto name = std::filesystem::path(key).filename().string();
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

bool fileMatches(const std::string& key, const std::vector<std::string>& markers) {
    const auto name = lowerFileName(key);
    return std::any_of(markers.begin(), markers.end(), [&name](const std::string& marker) {
        return name.find(marker) != std::string::npos;
    });
}

std::vector<ElementRef> collectElements(const DocumentMap& documents,
                                        const std::vector<std::string>& markers,
                                        const QString& tag) {
    std::vector<ElementRef> elements;
    for (const auto& [key, doc] : documents) {
        if (!doc || !fileMatches(key, markers)) {
            continue;
        }
        for (const auto* element : doc->elementsByTagName(tag)) {
            elements.push_back({key, element});
        }
    }
    return elements;
}

} // namespace xmlguard
