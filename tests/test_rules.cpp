/**
 * XmlGuard - Validation Rule Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "TestSupport.hpp"
#include "validation/ReferenceIndex.hpp"
#include "validation/rules/BalanceRules.hpp"
#include "validation/rules/ExperienceRules.hpp"
#include "validation/rules/OrphanRules.hpp"
#include "validation/rules/ReferenceRules.hpp"
#include "validation/rules/RuleRegistry.hpp"

using namespace xmlguard;

namespace {

DocumentMap makeDocuments(const std::vector<std::pair<std::string, std::string>>& files) {
    DocumentMap documents;
    for (const auto& [key, body] : files) {
        auto doc = DocumentStore::parseDocument(test::xmlContent(body), key);
        EXPECT_NE(doc, nullptr) << "failed to parse " << key;
        documents[key] = doc;
    }
    return documents;
}

} // anonymous namespace

TEST(ReferenceRulesTest, ReportsDropOfUnknownItem) {
    auto docs = makeDocuments({
        {"items.xml", R"(<items><item id="1" attack="10"/></items>)"},
        {"drops.xml", R"(<drops><drop item_id="1"/><drop item_id="2"/></drops>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto results = rules::checkItemDrops(docs, index);
    ASSERT_EQ(results.size(), 1u);

    const auto& result = results[0];
    EXPECT_EQ(result.severity, Severity::Error);
    EXPECT_EQ(result.type, result_type::DANGLING_REFERENCE);
    EXPECT_EQ(result.file, "drops.xml");
    EXPECT_EQ(result.elementPath, "/drops/drop[2]");
    EXPECT_EQ(result.details.at("item_id"), "2");
    EXPECT_EQ(result.details.at("drop_table"), "drops.xml");
    EXPECT_FALSE(result.suggestions.empty());
}

TEST(ReferenceRulesTest, ReportsLearnOfUnknownSkill) {
    auto docs = makeDocuments({
        {"skills.xml", R"(<skills><skill id="s1"/></skills>)"},
        {"class_warrior.xml",
         R"(<class><learn skill_id="s1" level="1"/><learn skill_id="s2" class="warrior" level="3"/></class>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto results = rules::checkSkillLearns(docs, index);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].details.at("skill_id"), "s2");
    EXPECT_EQ(results[0].details.at("class"), "warrior");
    EXPECT_EQ(results[0].details.at("level"), "3");
}

TEST(ReferenceRulesTest, ReportsRewardOfUnknownItemWithQuest) {
    auto docs = makeDocuments({
        {"items.xml", R"(<items><item id="1"/></items>)"},
        {"quests.xml",
         R"(<quests><quest id="q1"><reward item_id="1"/></quest><quest id="q2"><reward item_id="9"/></quest></quests>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto results = rules::checkQuestRewards(docs, index);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].details.at("item_id"), "9");
    EXPECT_EQ(results[0].details.at("quest_id"), "q2");
    EXPECT_EQ(results[0].elementPath, "/quests/quest[2]/reward[1]");
}

TEST(ReferenceRulesTest, ReportsEachDuplicateDefinition) {
    auto docs = makeDocuments({
        {"items_a.xml", R"(<items><item id="5"/><item id="6"/></items>)"},
        {"items_b.xml", R"(<items><item id="5"/></items>)"},
        {"npcs.xml", R"(<npcs><npc id="5"/></npcs>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto results = rules::checkDuplicateIds(docs, index);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].type, result_type::DUPLICATE_IDENTIFIER);
    EXPECT_EQ(results[0].file, "items_b.xml");
    EXPECT_EQ(results[0].details.at("kind"), "item");
    EXPECT_EQ(results[0].details.at("first_file"), "items_a.xml");
    EXPECT_EQ(results[0].details.at("first_path"), "/items/item[1]");
}

TEST(ReferenceRulesTest, FindsOtherDefinersOfSharedIds) {
    auto docs = makeDocuments({
        {"items.xml", R"(<items><item id="5"/><item id="6"/></items>)"},
        {"items2.xml", R"(<items><item id="5"/></items>)"},
        {"items3.xml", R"(<items><item id="7"/></items>)"},
    });
    auto index = ReferenceIndex::build(docs);

    EXPECT_EQ(rules::filesSharingIds("items.xml", docs, index), (std::set<std::string>{"items2.xml"}));
    EXPECT_TRUE(rules::filesSharingIds("items3.xml", docs, index).empty());
}

TEST(ExperienceRulesTest, ReportsNpcOutsideTolerance) {
    auto docs = makeDocuments({
        {"npcs.xml", R"(<npcs><npc id="wolf" level="5" exp="1000"/><npc id="bear" level="5" exp="540"/></npcs>)"},
        {"exp_table.xml", R"(<levels><level num="5" exp="500"/></levels>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto results = rules::checkNpcExperience(docs, index, 0.10);
    ASSERT_EQ(results.size(), 1u);

    const auto& result = results[0];
    EXPECT_EQ(result.severity, Severity::Warning);
    EXPECT_EQ(result.type, result_type::EXPERIENCE_MISMATCH);
    EXPECT_EQ(result.details.at("npc_id"), "wolf");
    EXPECT_EQ(result.details.at("expected_exp"), "500");
    EXPECT_EQ(result.details.at("actual_exp"), "1000");
}

TEST(ExperienceRulesTest, HandlesExtremeExperienceValues) {
    auto docs = makeDocuments({
        {"npcs.xml", R"(<npcs><npc id="min" level="5" exp="-9223372036854775808"/><npc id="max" level="5" exp="9223372036854775807"/></npcs>)"},
        {"exp_table.xml", R"(<levels><level num="5" exp="9223372036854775807"/></levels>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto results = rules::checkNpcExperience(docs, index, 0.10);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].details.at("npc_id"), "min");
    EXPECT_EQ(results[0].details.at("actual_exp"), "-9223372036854775808");
    EXPECT_EQ(results[0].details.at("expected_exp"), "9223372036854775807");
}

TEST(ExperienceRulesTest, ExperienceTableRelatesToNpcFiles) {
    auto docs = makeDocuments({
        {"npcs.xml", R"(<npcs><npc id="wolf" level="5" exp="500"/></npcs>)"},
        {"zone/npc_bosses.xml", R"(<npcs><npc id="troll" level="5" exp="500"/></npcs>)"},
        {"exp_table.xml", R"(<levels><level num="5" exp="500"/></levels>)"},
        {"items.xml", R"(<items><item id="1"/></items>)"},
    });
    auto index = ReferenceIndex::build(docs);

    EXPECT_EQ(rules::npcFilesForExperienceTable("exp_table.xml", docs, index),
              (std::set<std::string>{"npcs.xml", "zone/npc_bosses.xml"}));
    EXPECT_TRUE(rules::npcFilesForExperienceTable("items.xml", docs, index).empty());
}

TEST(ExperienceRulesTest, SkipsLevelsMissingFromTable) {
    auto docs = makeDocuments({
        {"npcs.xml", R"(<npcs><npc id="wolf" level="7" exp="1000"/><npc id="rat" level="x" exp="1"/></npcs>)"},
        {"level_exp.xml", R"(<levels><level num="5" exp="500"/><level num="bad"/></levels>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto table = rules::loadExperienceTable(docs);
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.at(5), 500);
    EXPECT_TRUE(rules::checkNpcExperience(docs, index, 0.10).empty());
}

TEST(OrphanRulesTest, ReportsUnreferencedItemsOnly) {
    auto docs = makeDocuments({
        {"items.xml", R"(<items><item id="1" name="Sword"/><item id="2"/><item id="3"/></items>)"},
        {"drops.xml", R"(<drops><drop item_id="1"/></drops>)"},
        {"shop_goods.xml", R"(<shop><goods item_id="2"/></shop>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto results = rules::findOrphanedItems(docs, index);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].severity, Severity::Info);
    EXPECT_EQ(results[0].type, result_type::ORPHANED_DATA);
    EXPECT_EQ(results[0].details.at("item_id"), "3");
}

TEST(BalanceRulesTest, FlagsOutlierWithinLevelGroup) {
    auto docs = makeDocuments({
        {"items.xml", R"(<items>
            <item id="a" level="10" attack="10"/>
            <item id="b" level="10" attack="10"/>
            <item id="c" level="10" attack="10"/>
            <item id="d" level="10" attack="40"/>
            <item id="e" level="20" attack="500"/>
        </items>)"},
    });
    auto index = ReferenceIndex::build(docs);

    auto results = rules::checkBalance(docs, index, rules::BalanceThresholds{});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].type, result_type::BALANCE);
    EXPECT_EQ(results[0].details.at("id"), "d");
    EXPECT_EQ(results[0].details.at("attack"), "40");
    EXPECT_EQ(results[0].details.at("level"), "10");
    EXPECT_TRUE(results[0].details.count("avg_attack"));
    EXPECT_GE(results[0].suggestions.size(), 2u);
}

TEST(BalanceRulesTest, IgnoresSmallGroupsAndZeroValues) {
    auto docs = makeDocuments({
        {"npcs.xml", R"(<npcs>
            <npc id="a" level="3" hp="100" attack="0"/>
            <npc id="b" level="3" hp="100" attack="20"/>
            <npc id="c" level="3" hp="100" attack="20"/>
            <npc id="x" level="4" hp="9000"/>
            <npc id="y" level="4" hp="10"/>
        </npcs>)"},
    });
    auto index = ReferenceIndex::build(docs);

    EXPECT_TRUE(rules::checkBalance(docs, index, rules::BalanceThresholds{}).empty());
}

TEST(ReferenceIndexTest, TracksFilesReferencingDefinitions) {
    auto docs = makeDocuments({
        {"items.xml", R"(<items><item id="1"/><item id="2"/></items>)"},
        {"drops.xml", R"(<drops><drop item_id="1"/></drops>)"},
        {"quests.xml", R"(<quests><quest id="q"><reward item_id="2"/></quest></quests>)"},
        {"npcs.xml", R"(<npcs><npc id="n"/></npcs>)"},
    });
    auto index = ReferenceIndex::build(docs);

    EXPECT_TRUE(index.contains(EntityKind::Item, "1"));
    EXPECT_TRUE(index.contains(EntityKind::Quest, "q"));
    EXPECT_FALSE(index.contains(EntityKind::Skill, "1"));
    EXPECT_EQ(index.references().size(), 2u);

    auto referencing = index.filesReferencing("items.xml");
    EXPECT_EQ(referencing, (std::set<std::string>{"drops.xml", "quests.xml"}));
    EXPECT_TRUE(index.filesReferencing("npcs.xml").empty());
}

TEST(RuleRegistryTest, RegistersBuiltInRulesInOrder) {
    auto registered = rules::defaultRules(ValidationConfig{});

    std::vector<std::string> names;
    for (const auto& rule : registered) {
        names.push_back(rule.name);
        EXPECT_TRUE(static_cast<bool>(rule.validate));
        EXPECT_FALSE(rule.description.empty());
    }

    EXPECT_EQ(names, (std::vector<std::string>{
        "item-drop-consistency", "npc-level-consistency", "skill-learn-consistency",
        "quest-reward-consistency", "orphaned-data", "balance-check", "reference-integrity"}));
}

TEST(RuleRegistryTest, LeavesOutDisabledRules) {
    ValidationConfig config;
    config.disabledRules = {"balance-check", "orphaned-data"};

    auto registered = rules::defaultRules(config);
    EXPECT_EQ(registered.size(), 5u);
    for (const auto& rule : registered) {
        EXPECT_NE(rule.name, "balance-check");
        EXPECT_NE(rule.name, "orphaned-data");
    }
}

TEST(RuleRegistryTest, MatchesRulesToFileNames) {
    auto registered = rules::defaultRules(ValidationConfig{});
    const auto& drops = registered[0];
    const auto& orphans = registered[4];

    EXPECT_TRUE(drops.isRelevantTo("zone/Drops_Boss.xml"));
    EXPECT_TRUE(drops.isRelevantTo("items.xml"));
    EXPECT_FALSE(drops.isRelevantTo("items/npcs.xml"));
    EXPECT_TRUE(orphans.isRelevantTo("anything.xml"));
}
