/**
 * @file test_gloss_tools.cpp
 * @brief Unit tests for offline dictionary preparation
 *
 * GlossCleaner turns raw descriptions into glosses; DuplicateGlossFinder
 * groups symbols sharing a gloss and metadata.
 */

#include <gtest/gtest.h>
#include <ingestion/gloss_cleaner.hpp>
#include <ingestion/duplicate_glosses.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Bliss;
using json = nlohmann::json;
using Strings = std::vector<std::string>;

// ============================================================================
// Description cleaning
// ============================================================================

TEST(GlossCleanerTest, PlainDescription) {
    auto c = GlossCleaner::clean_description("house");
    EXPECT_EQ(c.glosses, Strings({"house"}));
    EXPECT_FALSE(c.is_old);
}

TEST(GlossCleanerTest, EmptyDescription) {
    auto c = GlossCleaner::clean_description("");
    EXPECT_TRUE(c.glosses.empty());
    EXPECT_FALSE(c.is_old);
}

TEST(GlossCleanerTest, UnderscoresAndCommas) {
    auto c = GlossCleaner::clean_description("to_run,_to_race");
    EXPECT_EQ(c.glosses, Strings({"to run", "to race"}));

    auto gaps = GlossCleaner::clean_description("a,,b,");
    EXPECT_EQ(gaps.glosses, Strings({"a", "b"}));
}

TEST(GlossCleanerTest, ContextAppliesToEveryPart) {
    auto c = GlossCleaner::clean_description("autumn,_fall_(ckb)");
    EXPECT_EQ(c.glosses, Strings({"autumn (ckb)", "fall (ckb)"}));

    auto single = GlossCleaner::clean_description("building_(general)");
    EXPECT_EQ(single.glosses, Strings({"building (general)"}));
}

TEST(GlossCleanerTest, OldMarkerAndPlural) {
    auto c = GlossCleaner::clean_description("glove(s)_(OLD)");
    EXPECT_TRUE(c.is_old);
    EXPECT_EQ(c.glosses, Strings({"glove", "gloves"}));
}

TEST(GlossCleanerTest, VerbMarker) {
    auto c = GlossCleaner::clean_description("eat-(to)");
    EXPECT_EQ(c.glosses, Strings({"eat"}));
}

TEST(GlossCleanerTest, ExpandPlural) {
    EXPECT_EQ(GlossCleaner::expand_plural("cup(s)"), Strings({"cup", "cups"}));
    EXPECT_EQ(GlossCleaner::expand_plural("cups"), Strings({"cups"}));
    EXPECT_EQ(GlossCleaner::expand_plural("(s)"), Strings({"(s)"}));
}

TEST(GlossCleanerTest, SpecialGlosses) {
    ASSERT_NE(GlossCleaner::special_glosses("8485"), nullptr);
    EXPECT_EQ(*GlossCleaner::special_glosses("8485"), Strings({"?"}));
    EXPECT_EQ(*GlossCleaner::special_glosses("8490"), Strings({"degree"}));
    EXPECT_EQ(*GlossCleaner::special_glosses("8499"), Strings({"3"}));
    EXPECT_EQ(*GlossCleaner::special_glosses("8521"), Strings({"a"}));
    EXPECT_EQ(*GlossCleaner::special_glosses("8576"), Strings({"Z"}));
    EXPECT_EQ(GlossCleaner::special_glosses("14905"), nullptr);
}

// ============================================================================
// Record / dictionary cleaning
// ============================================================================

TEST(GlossCleanerTest, CleanRecord) {
    auto out = GlossCleaner::clean_record("14905", json::parse(R"({
        "pos": "YELLOW",
        "description": {"en": "building,_house", "sv": "byggnad"}
    })"));

    EXPECT_FALSE(out.contains("description"));
    EXPECT_EQ(out["glosses"]["en"], json::array({"building", "house"}));
    EXPECT_EQ(out["glosses"]["sv"], json::array({"byggnad"}));
    EXPECT_EQ(out["semantics"]["POS"], "noun");
    EXPECT_FALSE(out.contains("is_old"));
    EXPECT_EQ(out["pos"], "YELLOW");
}

TEST(GlossCleanerTest, CleanRecordSemantics) {
    auto verb = GlossCleaner::clean_record("12858", json::parse(R"j({"pos": "RED", "description": {"en": "eat-(to)"}})j"));
    EXPECT_EQ(verb["semantics"], json::parse(R"({"POS": "verb"})"));

    auto thing = GlossCleaner::clean_record("20000", json::parse(
        R"({"pos": "WHITE", "composition": [14905, 9009], "description": {"en": "thing"}})"));
    EXPECT_EQ(thing["semantics"], json::parse(R"({"TYPE_SHIFT": "concretization"})"));

    auto thing_str = GlossCleaner::clean_record("20001", json::parse(
        R"({"pos": "BLUE", "composition": ["14905", "/", "9009"]})"));
    EXPECT_EQ(thing_str["semantics"]["POS"], "noun");
    EXPECT_EQ(thing_str["semantics"]["TYPE_SHIFT"], "concretization");

    auto plain = GlossCleaner::clean_record("20002", json::parse(R"({"pos": "GREY", "description": {"en": "and"}})"));
    EXPECT_FALSE(plain.contains("semantics"));
}

TEST(GlossCleanerTest, CleanRecordOldAndSpecial) {
    auto old = GlossCleaner::clean_record("30000", json::parse(R"j({"description": {"en": "glove(s)_(OLD)"}})j"));
    EXPECT_EQ(old["is_old"], true);
    EXPECT_EQ(old["glosses"]["en"], json::array({"glove", "gloves"}));

    auto digit = GlossCleaner::clean_record("8499", json::parse(R"({"description": {"en": "three", "sv": "tre"}})"));
    EXPECT_EQ(digit["glosses"]["en"], json::array({"3"}));
    EXPECT_EQ(digit["glosses"]["sv"], json::array({"tre"}));
}

TEST(GlossCleanerTest, CleanDictionary) {
    auto out = GlossCleaner::clean_dictionary(json::parse(R"({
        "14905": {"pos": "YELLOW", "description": {"en": "building"}},
        "24920": {"pos": "BLUE", "description": {"en": "medicine"}}
    })"));
    EXPECT_EQ(out.size(), 2u);
    EXPECT_EQ(out["24920"]["glosses"]["en"][0], "medicine");

    EXPECT_THROW(GlossCleaner::clean_dictionary(json::array()), std::invalid_argument);
}

// ============================================================================
// Duplicate glosses
// ============================================================================

TEST(DuplicateGlossTest, FormatKey) {
    EXPECT_EQ(DuplicateGlossFinder::format_key("house", false, json::object()), "house");
    EXPECT_EQ(DuplicateGlossFinder::format_key("house", true, json::object()), "house (OLD)");
    EXPECT_EQ(DuplicateGlossFinder::format_key("run", true, json::parse(R"({"POS": "verb"})")),
              "run (OLD, POS: verb)");
}

TEST(DuplicateGlossTest, GroupsByGlossAndMetadata) {
    auto report = DuplicateGlossFinder::find(json::parse(R"({
        "1":  {"glosses": {"en": ["house"]}},
        "2":  {"glosses": {"en": ["house"]}},
        "10": {"glosses": {"en": ["house"]}, "is_old": true},
        "11": {"glosses": {"en": ["house"]}, "is_old": true},
        "3":  {"glosses": {"en": ["run"]}, "semantics": {"POS": "verb"}},
        "4":  {"glosses": {"en": ["run"], "sv": ["springa"]}, "semantics": {"POS": "verb"}},
        "5":  {"glosses": {"en": ["run"]}}
    })"));

    EXPECT_EQ(report.total_groups, 3u);
    ASSERT_EQ(report.groups_per_language.size(), 1u);
    EXPECT_EQ(report.groups_per_language.at("en"), 3u);
    EXPECT_FALSE(report.groups.contains("sv"));

    const auto& en = report.groups["en"];
    EXPECT_EQ(en.at("house"), json::array({"1", "2"}));
    EXPECT_EQ(en.at("house (OLD)"), json::array({"10", "11"}));
    EXPECT_EQ(en.at("run (POS: verb)"), json::array({"3", "4"}));
    EXPECT_FALSE(en.contains("run"));
}

TEST(DuplicateGlossTest, IdsSortedNumerically) {
    auto report = DuplicateGlossFinder::find(json::parse(R"({
        "10": {"glosses": {"en": ["tree"]}},
        "9":  {"glosses": {"en": ["tree"]}},
        "100": {"glosses": {"en": ["tree"]}}
    })"));
    EXPECT_EQ(report.groups["en"]["tree"], json::array({"9", "10", "100"}));
}

TEST(DuplicateGlossTest, NoDuplicates) {
    auto report = DuplicateGlossFinder::find(json::parse(R"({
        "1": {"glosses": {"en": ["a"]}},
        "2": {"glosses": {"en": ["b"]}},
        "3": "not a record"
    })"));
    EXPECT_EQ(report.total_groups, 0u);
    EXPECT_TRUE(report.groups.empty());

    EXPECT_THROW(DuplicateGlossFinder::find(json::array()), std::invalid_argument);
}
