/**
 * XmlGuard - Reference Rules Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ReferenceRules.hpp"

#include <algorithm>
#include <functional>

namespace xmlguard::rules {

namespace {

/**
 * Where a reference lives and what it must point at
 */
struct ExistenceCheck {
    std::vector<std::string> sourceMarkers;
    QString tag;
    QString attribute;
    EntityKind target;
    std::string sourceLabel;
    std::vector<std::string> suggestions;
};

using DetailFiller = std::function<void(const ElementRef&, std::map<std::string, std::string>&)>;

std::vector<ValidationResult> checkExistence(const DocumentMap& documents,
                                             const ReferenceIndex& index,
                                             const ExistenceCheck& check,
                                             const DetailFiller& fillDetails) {
    std::vector<ValidationResult> results;
    const auto targetName = entityKindToString(check.target);

    for (const auto& ref : collectElements(documents, check.sourceMarkers, check.tag)) {
        auto id = ref.element->attribute(check.attribute);
        if (id.isEmpty() || index.contains(check.target, id)) {
            continue;
        }

        ValidationResult result;
        result.severity = Severity::Error;
        result.type = result_type::DANGLING_REFERENCE;
        result.message = check.sourceLabel + " references unknown " + targetName +
                         " id: " + id.toStdString();
        result.file = ref.file;
        result.elementPath = ref.element->path().toStdString();
        result.details[check.attribute.toStdString()] = id.toStdString();
        if (fillDetails) {
            fillDetails(ref, result.details);
        }
        result.suggestions = check.suggestions;

        results.push_back(std::move(result));
    }
    return results;
}

/**
 * id of the nearest enclosing element with the given name
 */
QString ancestorId(const xml::XmlElement* element, const QString& tag) {
    for (auto* current = element->parent(); current; current = current->parent()) {
        if (current->name() == tag) {
            return current->attribute("id");
        }
    }
    return QString();
}

} // anonymous namespace

std::vector<ValidationResult> checkItemDrops(const DocumentMap& documents,
                                             const ReferenceIndex& index) {
    ExistenceCheck check{
        {"drop"}, "drop", "item_id", EntityKind::Item, "Drop table",
        {
            "Check that the item id is correct",
            "Make sure the item file is part of the data set",
            "Remove the drop entry if the item was retired"
        }
    };

    return checkExistence(documents, index, check,
        [](const ElementRef& ref, std::map<std::string, std::string>& details) {
            details["drop_table"] = ref.file;
        });
}

std::vector<ValidationResult> checkSkillLearns(const DocumentMap& documents,
                                               const ReferenceIndex& index) {
    ExistenceCheck check{
        {"learn", "class"}, "learn", "skill_id", EntityKind::Skill, "Learn entry",
        {
            "Check that the skill id is correct",
            "Make sure the skill file is part of the data set",
            "Remove the learn entry if the skill was retired"
        }
    };

    return checkExistence(documents, index, check,
        [](const ElementRef& ref, std::map<std::string, std::string>& details) {
            details["class"] = ref.element->attribute("class").toStdString();
            details["level"] = ref.element->attribute("level").toStdString();
        });
}

std::vector<ValidationResult> checkQuestRewards(const DocumentMap& documents,
                                                const ReferenceIndex& index) {
    ExistenceCheck check{
        {"quest"}, "reward", "item_id", EntityKind::Item, "Quest reward",
        {
            "Check that the reward item id is correct",
            "Make sure the item file is part of the data set"
        }
    };

    return checkExistence(documents, index, check,
        [](const ElementRef& ref, std::map<std::string, std::string>& details) {
            auto questId = ancestorId(ref.element, "quest");
            if (!questId.isEmpty()) {
                details["quest_id"] = questId.toStdString();
            }
        });
}

std::vector<ValidationResult> checkDuplicateIds(const DocumentMap& /*documents*/,
                                                const ReferenceIndex& index) {
    std::vector<ValidationResult> results;

    for (const auto& info : entityKinds()) {
        const auto kindName = entityKindToString(info.kind);

        for (const auto& [id, locations] : index.definitions(info.kind)) {
            if (locations.size() < 2) {
                continue;
            }

            const auto& first = locations.front();
            for (std::size_t i = 1; i < locations.size(); ++i) {
                const auto& duplicate = locations[i];

                ValidationResult result;
                result.severity = Severity::Error;
                result.type = result_type::DUPLICATE_IDENTIFIER;
                result.message = kindName + " id " + id.toStdString() + " is defined " +
                                 std::to_string(locations.size()) + " times";
                result.file = duplicate.file;
                result.elementPath = duplicate.element->path().toStdString();
                result.details["kind"] = kindName;
                result.details["id"] = id.toStdString();
                result.details["first_file"] = first.file;
                result.details["first_path"] = first.element->path().toStdString();
                result.suggestions = {
                    "Give this " + kindName + " a unique id",
                    "Or remove the duplicate definition"
                };

                results.push_back(std::move(result));
            }
        }
    }
    return results;
}

std::set<std::string> filesSharingIds(const std::string& changedKey,
                                      const DocumentMap& /*documents*/,
                                      const ReferenceIndex& index) {
    std::set<std::string> files;
    for (const auto& info : entityKinds()) {
        for (const auto& [id, locations] : index.definitions(info.kind)) {
            const bool definedHere = std::any_of(locations.begin(), locations.end(),
                [&changedKey](const ElementRef& location) { return location.file == changedKey; });
            if (!definedHere) {
                continue;
            }
            for (const auto& location : locations) {
                files.insert(location.file);
            }
        }
    }
    files.erase(changedKey);
    return files;
}

} // namespace xmlguard::rules
