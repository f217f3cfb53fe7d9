/**
 * XmlGuard - Validation Rule
 *
 * Rules are plain descriptors: a name, a description and a pure function
 * over the document snapshot and its reference index. The engine keeps
 * them in an ordered list, so adding or removing a rule is a data change.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "EntityCatalog.hpp"
#include "ReferenceIndex.hpp"
#include "ValidationResult.hpp"

namespace xmlguard {

using RuleFunction =
    std::function<std::vector<ValidationResult>(const DocumentMap&, const ReferenceIndex&)>;

// Documents whose findings depend on the named document without referencing it
using RelatedFilesFunction =
    std::function<std::set<std::string>(const std::string&, const DocumentMap&, const ReferenceIndex&)>;

/**
 * One consistency rule
 *
 * validate must not modify its inputs and must not depend on other rules.
 */
struct ValidationRule {
    std::string name;
    std::string description;

    // File name fragments the rule reads; empty means every document
    std::vector<std::string> fileMarkers;

    RuleFunction validate;

    // Optional; reference-based relations are already covered by the engine
    RelatedFilesFunction relatedFiles;

    /**
     * Whether a change to the given document can alter this rule's results
     */
    bool isRelevantTo(const std::string& fileKey) const {
        return fileMarkers.empty() || fileMatches(fileKey, fileMarkers);
    }
};

} // namespace xmlguard
