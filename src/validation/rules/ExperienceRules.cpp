/**
 * XmlGuard - Experience Rules Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ExperienceRules.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

namespace xmlguard::rules {

std::map<int, long long> loadExperienceTable(const DocumentMap& documents) {
    std::map<int, long long> table;

    for (const auto& ref : collectElements(documents, {"exp", "level"}, "level")) {
        bool numOk = false;
        bool expOk = false;
        int level = ref.element->attribute("num").toInt(&numOk);
        long long exp = ref.element->attribute("exp").toLongLong(&expOk);

        if (!numOk || !expOk) {
            if (ref.element->hasAttribute("num") || ref.element->hasAttribute("exp")) {
                spdlog::debug("Skipping experience entry {} in {}: not numeric",
                              ref.element->path().toStdString(), ref.file);
            }
            continue;
        }
        table[level] = exp;
    }
    return table;
}

std::vector<ValidationResult> checkNpcExperience(const DocumentMap& documents,
                                                 const ReferenceIndex& /*index*/,
                                                 double tolerance) {
    std::vector<ValidationResult> results;

    const auto table = loadExperienceTable(documents);
    if (table.empty()) {
        return results;
    }

    for (const auto& ref : collectElements(documents, {"npc"}, "npc")) {
        const auto* npc = ref.element;
        if (!npc->hasAttribute("level") || !npc->hasAttribute("exp")) {
            continue;
        }

        bool levelOk = false;
        bool expOk = false;
        int level = npc->attribute("level").toInt(&levelOk);
        long long exp = npc->attribute("exp").toLongLong(&expOk);
        if (!levelOk || !expOk) {
            spdlog::debug("Skipping NPC {} in {}: level/exp not numeric",
                          npc->path().toStdString(), ref.file);
            continue;
        }

        auto it = table.find(level);
        if (it == table.end()) {
            continue;
        }

        // Compared as double; long long subtraction overflows at the extremes
        const long long expected = it->second;
        const double difference = std::fabs(static_cast<double>(exp) - static_cast<double>(expected));
        if (difference <= static_cast<double>(expected) * tolerance) {
            continue;
        }

        const auto npcId = npc->attribute("id").toStdString();

        ValidationResult result;
        result.severity = Severity::Warning;
        result.type = result_type::EXPERIENCE_MISMATCH;
        result.message = "NPC " + (npcId.empty() ? npc->path().toStdString() : npcId) +
                         " at level " + std::to_string(level) + " gives " +
                         std::to_string(exp) + " exp, the experience table expects " +
                         std::to_string(expected);
        result.file = ref.file;
        result.elementPath = npc->path().toStdString();
        result.details["npc_id"] = npcId;
        result.details["level"] = std::to_string(level);
        result.details["actual_exp"] = std::to_string(exp);
        result.details["expected_exp"] = std::to_string(expected);
        result.suggestions = {
            "Set the NPC's exp to " + std::to_string(expected),
            "Or check the experience table entry for level " + std::to_string(level)
        };

        results.push_back(std::move(result));
    }
    return results;
}

std::set<std::string> npcFilesForExperienceTable(const std::string& changedKey,
                                                 const DocumentMap& documents,
                                                 const ReferenceIndex& /*index*/) {
    std::set<std::string> files;
    if (!fileMatches(changedKey, {"exp", "level"})) {
        return files;
    }
    for (const auto& [key, doc] : documents) {
        if (doc && fileMatches(key, {"npc"})) {
            files.insert(key);
        }
    }
    return files;
}

} // namespace xmlguard::rules
