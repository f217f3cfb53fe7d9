/**
 * XmlGuard - Balance Rules Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "BalanceRules.hpp"

#include <map>
#include <string>

#include <QString>

#include <spdlog/spdlog.h>

namespace xmlguard::rules {

namespace {

/**
 * An entity kind and the numeric attributes compared within a level group
 */
struct BalanceSubject {
    std::string label;                    // "Item", "NPC", "Skill"
    std::vector<std::string> markers;
    QString tag;
    std::vector<QString> metrics;
};

struct Member {
    ElementRef ref;
    std::vector<double> values;           // Parallel to BalanceSubject::metrics
};

std::string formatNumber(double value) {
    return QString::number(value, 'f', 0).toStdString();
}

void checkSubject(const DocumentMap& documents,
                  const BalanceSubject& subject,
                  const BalanceThresholds& thresholds,
                  std::vector<ValidationResult>& results) {
    std::map<int, std::vector<Member>> byLevel;

    for (const auto& ref : collectElements(documents, subject.markers, subject.tag)) {
        if (!ref.element->hasAttribute("level")) {
            continue;
        }

        bool ok = false;
        int level = ref.element->attribute("level").toInt(&ok);
        if (!ok) {
            spdlog::debug("Skipping {} {} in {}: level not numeric",
                          subject.label, ref.element->path().toStdString(), ref.file);
            continue;
        }

        Member member{ref, {}};
        bool numeric = true;
        for (const auto& metric : subject.metrics) {
            auto text = ref.element->attribute(metric);
            double value = text.isEmpty() ? 0.0 : text.toDouble(&ok);
            if (!text.isEmpty() && !ok) {
                numeric = false;
                break;
            }
            member.values.push_back(value);
        }
        if (!numeric) {
            spdlog::debug("Skipping {} {} in {}: non-numeric stats",
                          subject.label, ref.element->path().toStdString(), ref.file);
            continue;
        }

        byLevel[level].push_back(std::move(member));
    }

    for (const auto& [level, members] : byLevel) {
        if (static_cast<int>(members.size()) < thresholds.minGroupSize) {
            continue;
        }

        std::vector<double> means(subject.metrics.size(), 0.0);
        for (const auto& member : members) {
            for (std::size_t m = 0; m < means.size(); ++m) {
                means[m] += member.values[m];
            }
        }
        for (auto& mean : means) {
            mean /= static_cast<double>(members.size());
        }

        for (const auto& member : members) {
            std::vector<std::string> reasons;
            for (std::size_t m = 0; m < means.size(); ++m) {
                const double value = member.values[m];
                const auto metric = subject.metrics[m].toStdString();

                if (value > means[m] * thresholds.high) {
                    reasons.push_back(metric + " " + formatNumber(value) +
                                      " is far above the level average " + formatNumber(means[m]));
                } else if (value > 0 && value < means[m] * thresholds.low) {
                    reasons.push_back(metric + " " + formatNumber(value) +
                                      " is far below the level average " + formatNumber(means[m]));
                }
            }

            if (reasons.empty()) {
                continue;
            }

            const auto* element = member.ref.element;
            auto id = element->attribute("id").toStdString();
            auto name = element->attribute("name").toStdString();

            std::string joined;
            for (const auto& reason : reasons) {
                joined += (joined.empty() ? "" : "; ") + reason;
            }

            ValidationResult result;
            result.severity = Severity::Warning;
            result.type = result_type::BALANCE;
            result.message = subject.label + " " + (name.empty() ? id : name) +
                             " may be unbalanced: " + joined;
            result.file = member.ref.file;
            result.elementPath = element->path().toStdString();
            result.details["id"] = id;
            result.details["name"] = name;
            result.details["level"] = std::to_string(level);

            result.suggestions.push_back("Move the values closer to the level average");
            for (std::size_t m = 0; m < means.size(); ++m) {
                const auto metric = subject.metrics[m].toStdString();
                result.details[metric] = formatNumber(member.values[m]);
                result.details["avg_" + metric] = formatNumber(means[m]);
                result.suggestions.push_back(
                    "Suggested " + metric + " range: " +
                    formatNumber(means[m] * thresholds.suggestedLow) + " - " +
                    formatNumber(means[m] * thresholds.suggestedHigh));
            }

            results.push_back(std::move(result));
        }
    }
}

} // anonymous namespace

std::vector<ValidationResult> checkBalance(const DocumentMap& documents,
                                           const ReferenceIndex& /*index*/,
                                           const BalanceThresholds& thresholds) {
    static const std::vector<BalanceSubject> subjects = {
        {"Item",  {"item"},  "item",  {"attack", "defense"}},
        {"NPC",   {"npc"},   "npc",   {"hp", "attack"}},
        {"Skill", {"skill"}, "skill", {"damage"}},
    };

    std::vector<ValidationResult> results;
    for (const auto& subject : subjects) {
        checkSubject(documents, subject, thresholds, results);
    }
    return results;
}

} // namespace xmlguard::rules
