/**
 * XmlGuard - Reference Index Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ReferenceIndex.hpp"

#include <spdlog/spdlog.h>

namespace xmlguard {

ReferenceIndex ReferenceIndex::build(const DocumentMap& documents) {
    ReferenceIndex index;

    for (const auto& info : entityKinds()) {
        auto& definitions = index.m_definitions[info.kind];
        auto& ids = index.m_ids[info.kind];

        for (const auto& ref : collectElements(documents, info.fileMarkers, info.tag)) {
            auto id = ref.element->attribute(info.idAttribute);
            if (id.isEmpty()) {
                continue;
            }
            definitions[id].push_back(ref);
            ids.insert(id);
        }
    }

    // References count wherever they appear, whatever the file name
    for (const auto& [key, doc] : documents) {
        if (!doc) {
            continue;
        }
        for (const auto& kind : referenceKinds()) {
            for (const auto* element : doc->elementsByTagName(kind.tag)) {
                auto id = element->attribute(kind.attribute);
                if (id.isEmpty()) {
                    continue;
                }
                index.m_references.push_back({&kind, id, {key, element}});
                index.m_reverse[{kind.target, id}].insert(key);
            }
        }
    }

    spdlog::debug("Reference index: {} items, {} npcs, {} skills, {} quests, {} references",
                  index.ids(EntityKind::Item).size(), index.ids(EntityKind::Npc).size(),
                  index.ids(EntityKind::Skill).size(), index.ids(EntityKind::Quest).size(),
                  index.m_references.size());
    return index;
}

const std::set<QString>& ReferenceIndex::ids(EntityKind kind) const {
    static const std::set<QString> empty;
    auto it = m_ids.find(kind);
    return it != m_ids.end() ? it->second : empty;
}

bool ReferenceIndex::contains(EntityKind kind, const QString& id) const {
    return ids(kind).count(id) > 0;
}

const std::map<QString, std::vector<ElementRef>>& ReferenceIndex::definitions(EntityKind kind) const {
    static const std::map<QString, std::vector<ElementRef>> empty;
    auto it = m_definitions.find(kind);
    return it != m_definitions.end() ? it->second : empty;
}

const std::set<std::string>& ReferenceIndex::referencingFiles(EntityKind kind, const QString& id) const {
    static const std::set<std::string> empty;
    auto it = m_reverse.find({kind, id});
    return it != m_reverse.end() ? it->second : empty;
}

bool ReferenceIndex::isReferenced(EntityKind kind, const QString& id) const {
    return !referencingFiles(kind, id).empty();
}

std::set<std::string> ReferenceIndex::filesReferencing(const std::string& file) const {
    std::set<std::string> files;
    for (const auto& [kind, definitions] : m_definitions) {
        for (const auto& [id, locations] : definitions) {
            for (const auto& location : locations) {
                if (location.file != file) {
                    continue;
                }
                const auto& referencing = referencingFiles(kind, id);
                files.insert(referencing.begin(), referencing.end());
            }
        }
    }
    files.erase(file);
    return files;
}

} // namespace xmlguard
