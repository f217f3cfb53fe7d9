/**
 * XmlGuard - Orphan Rules Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "OrphanRules.hpp"

namespace xmlguard::rules {

std::vector<ValidationResult> findOrphanedItems(const DocumentMap& /*documents*/,
                                                const ReferenceIndex& index) {
    std::vector<ValidationResult> results;

    for (const auto& [id, locations] : index.definitions(EntityKind::Item)) {
        if (index.isReferenced(EntityKind::Item, id)) {
            continue;
        }

        for (const auto& location : locations) {
            ValidationResult result;
            result.severity = Severity::Info;
            result.type = result_type::ORPHANED_DATA;
            result.message = "Item " + id.toStdString() + " is not referenced anywhere";
            result.file = location.file;
            result.elementPath = location.element->path().toStdString();
            result.details["item_id"] = id.toStdString();
            result.details["item_name"] = location.element->attribute("name").toStdString();
            result.suggestions = {
                "Add the item to a drop table",
                "Or offer it in a shop",
                "Delete it if it is no longer needed"
            };

            results.push_back(std::move(result));
        }
    }
    return results;
}

} // namespace xmlguard::rules
