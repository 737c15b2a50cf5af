/**
 * @file test_composition_analyzer.cpp
 * @brief Unit tests for semantic extraction, gloss lookup and composition analysis
 */

#include <gtest/gtest.h>
#include <composition/composition_analyzer.hpp>
#include "../bliss_fixtures.hpp"
#include <string>
#include <vector>

using namespace Bliss;

class CompositionAnalyzerTest : public ::testing::Test {
protected:
    Dictionary dict = BlissTest::make_dictionary();
    SemanticTables tables = BlissTest::make_tables();
    RoleClassifier classifier{dict, tables};
    SemanticExtractor extractor{tables};
    CompositionAnalyzer analyzer{dict, classifier, extractor};
};

using Strings = std::vector<std::string>;

// ============================================================================
// SemanticExtractor
// ============================================================================

TEST_F(CompositionAnalyzerTest, ExtractSimpleIndicator) {
    auto fact = extractor.extract("9011", SymbolRole::Indicator);
    ASSERT_TRUE(fact.has_value());
    EXPECT_EQ(fact->symbol_id, "9011");

    auto j = fact->to_json();
    EXPECT_EQ(j["symbol_id"], "9011");
    EXPECT_EQ(j["indicator"]["NUMBER"], "plural");
}

TEST_F(CompositionAnalyzerTest, ExtractWrongRoleIsEmpty) {
    EXPECT_FALSE(extractor.extract("9011", SymbolRole::Modifier).has_value());
    EXPECT_FALSE(extractor.extract("14647", SymbolRole::Indicator).has_value());
    EXPECT_FALSE(extractor.extract("14905", SymbolRole::Modifier).has_value());
}

TEST_F(CompositionAnalyzerTest, AlternativesShapePreserved) {
    auto fact = extractor.extract("8993", SymbolRole::Indicator);
    ASSERT_TRUE(fact.has_value());
    ASSERT_TRUE(std::holds_alternative<AlternativeSemantics>(fact->descriptor));

    auto j = fact->to_json();
    EXPECT_EQ(j["type"], "indicator");
    ASSERT_EQ(j["alternatives"].size(), 2u);
    EXPECT_EQ(j["alternatives"][0]["value"], "verb");
    EXPECT_EQ(j["alternatives"][1]["type"], "TENSE");
    EXPECT_FALSE(j.contains("combined"));
}

TEST_F(CompositionAnalyzerTest, CombinedShapePreserved) {
    auto fact = extractor.extract("9009", SymbolRole::Indicator);
    ASSERT_TRUE(fact.has_value());
    ASSERT_TRUE(std::holds_alternative<CombinedSemantics>(fact->descriptor));

    auto j = fact->to_json();
    EXPECT_EQ(j["type"], "indicator");
    ASSERT_EQ(j["combined"].size(), 2u);
    EXPECT_EQ(j["combined"][0]["type"], "TYPE_SHIFT");
}

// ============================================================================
// Glosses
// ============================================================================

TEST_F(CompositionAnalyzerTest, GlossInfoLanguageFallback) {
    auto sv = analyzer.gloss_info("14905", "sv");
    EXPECT_EQ(sv.glosses, Strings({"byggnad", "hus"}));
    EXPECT_TRUE(sv.found);

    auto fallback = analyzer.gloss_info("17739", "sv");
    EXPECT_EQ(fallback.glosses, Strings({"small", "little"}));
}

TEST_F(CompositionAnalyzerTest, GlossInfoUnknown) {
    auto missing = analyzer.gloss_info("99999");
    EXPECT_FALSE(missing.found);
    EXPECT_EQ(missing.glosses, Strings({"(unknown)"}));
    EXPECT_EQ(missing.to_json()["error"], "not found");

    // Known symbol with no glosses at all
    Dictionary bare = Dictionary::from_json(nlohmann::json::parse(R"({"1": {"pos": "WHITE"}})"));
    RoleClassifier c(bare, tables);
    CompositionAnalyzer a(bare, c, extractor);
    auto info = a.gloss_info("1", "de");
    EXPECT_TRUE(info.found);
    EXPECT_EQ(info.glosses, Strings({"(unknown)"}));
}

TEST_F(CompositionAnalyzerTest, SymbolGlosses) {
    auto g = analyzer.symbol_glosses("14905");
    EXPECT_FALSE(g.error.has_value());
    EXPECT_EQ(g.glosses, Strings({"building", "house"}));
    EXPECT_EQ(g.explanation, "Roof on walls.");
    EXPECT_TRUE(g.is_character);

    auto composed = analyzer.symbol_glosses("12335", "sv");
    EXPECT_EQ(composed.glosses, Strings({"sjukhus"}));
    EXPECT_FALSE(composed.is_character);

    auto missing = analyzer.symbol_glosses("99999");
    ASSERT_TRUE(missing.error.has_value());
    EXPECT_EQ(*missing.error, "symbol 99999 not found");
    EXPECT_EQ(missing.to_json()["error"], "symbol 99999 not found");
}

TEST_F(CompositionAnalyzerTest, CompositionGlossesSkipMarkers) {
    auto j = analyzer.composition_glosses({"14905", "/", "99999"});
    EXPECT_EQ(j["composition"].size(), 3u);
    ASSERT_EQ(j["components"].size(), 2u);
    EXPECT_EQ(j["components"][0]["id"], "14905");
    EXPECT_EQ(j["components"][1]["error"], "symbol 99999 not found");
}

TEST_F(CompositionAnalyzerTest, SymbolInContext) {
    auto alone = analyzer.symbol_in_context("9011");
    EXPECT_EQ(alone["id"], "9011");
    EXPECT_EQ(alone["type"], "indicator");
    EXPECT_FALSE(alone.contains("context_classification"));

    auto j = analyzer.symbol_in_context("24920", {"14647", "/", "14905", "24920", "9011"}, "sv");
    EXPECT_EQ(j["glosses"][0], "medicin");
    EXPECT_EQ(j["type"], "character_or_word");
    ASSERT_TRUE(j.contains("context_classification"));
    EXPECT_EQ(j["context_classification"]["classifier"], "14905");
    EXPECT_EQ(j["context_classification"]["specifiers"][0], "24920");
    EXPECT_TRUE(j["context_classification"]["errors"].empty());

    EXPECT_EQ(analyzer.symbol_in_context("14647")["type"], "modifier");
}

TEST_F(CompositionAnalyzerTest, SymbolInContextUnknownSymbol) {
    auto j = analyzer.symbol_in_context("99999", {"9011"});
    EXPECT_EQ(j["error"], "symbol 99999 not found");
    EXPECT_EQ(j["type"], "unknown");
    EXPECT_EQ(j["context_classification"]["errors"][0],
              "first symbol is an indicator; no classifier found before it");
}

// ============================================================================
// analyze
// ============================================================================

TEST_F(CompositionAnalyzerTest, AnalyzeConcreteComposition) {
    const Strings tokens = {"14647", "14905", "24920", "9011"};
    auto a = analyzer.analyze(tokens);

    ASSERT_TRUE(a.ok());
    EXPECT_EQ(a.original_composition, tokens);
    ASSERT_TRUE(a.classifier_info.has_value());
    EXPECT_EQ(a.classifier_info->glosses, Strings({"building", "house"}));
    ASSERT_EQ(a.specifier_info.size(), 1u);
    EXPECT_EQ(a.specifier_info[0].glosses, Strings({"medicine", "medication"}));

    // Indicator semantics come before modifier semantics
    ASSERT_EQ(a.semantics.size(), 2u);
    EXPECT_EQ(a.semantics[0].symbol_id, "9011");
    EXPECT_EQ(a.semantics[0].role, SymbolRole::Indicator);
    EXPECT_EQ(a.semantics[1].symbol_id, "14647");
    EXPECT_EQ(a.semantics[1].role, SymbolRole::Modifier);

    auto j = a.to_json();
    EXPECT_EQ(j["classifier"], "14905");
    EXPECT_EQ(j["semantics"][0]["indicator"]["NUMBER"], "plural");
    EXPECT_EQ(j["semantics"][1]["modifier"]["QUANTIFIER"], "many");
    EXPECT_EQ(j["modifiers"], nlohmann::json::array({"14647"}));
}

TEST_F(CompositionAnalyzerTest, AnalyzeInRequestedLanguage) {
    auto a = analyzer.analyze({"14905", "25000", "9011"}, "sv");
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(a.classifier_info->glosses, Strings({"byggnad", "hus"}));
    ASSERT_EQ(a.specifier_info.size(), 1u);
    EXPECT_EQ(a.specifier_info[0].glosses, Strings({"Question"}));
}

TEST_F(CompositionAnalyzerTest, AnalyzeUnknownSpecifier) {
    auto a = analyzer.analyze({"14905", "99999"});
    ASSERT_TRUE(a.ok());
    ASSERT_EQ(a.specifier_info.size(), 1u);
    EXPECT_FALSE(a.specifier_info[0].found);
    EXPECT_EQ(a.specifier_info[0].glosses, Strings({"(unknown)"}));
}

TEST_F(CompositionAnalyzerTest, AnalyzeErrorCarriesDetails) {
    auto a = analyzer.analyze({"9011", "14905"});
    EXPECT_FALSE(a.ok());
    EXPECT_EQ(*a.error, "first symbol is an indicator; no classifier found before it");
    EXPECT_TRUE(a.semantics.empty());

    auto j = a.to_json();
    EXPECT_EQ(j["error"], *a.error);
    EXPECT_TRUE(j.contains("details"));

    auto empty = analyzer.analyze({"/"});
    EXPECT_EQ(*empty.error, "no valid symbol ids found");
}

// ============================================================================
// composition_structure
// ============================================================================

TEST_F(CompositionAnalyzerTest, Structure) {
    auto j = analyzer.composition_structure({"14647", "14905", "24920", "9011"});

    EXPECT_EQ(j["structure"]["classifier"], "14905");
    EXPECT_FALSE(j["structure"].contains("errors"));
    EXPECT_EQ(j["interpretation"]["indicator_count"], 1);
    EXPECT_EQ(j["interpretation"]["modifier_count"], 1);
    EXPECT_EQ(j["interpretation"]["classifier_glosses"]["gloss"][0], "building");
    EXPECT_EQ(j["interpretation"]["specifier_glosses"][0]["id"], "24920");
    EXPECT_TRUE(j["errors"].empty());
}

TEST_F(CompositionAnalyzerTest, StructureReportsErrors) {
    auto j = analyzer.composition_structure({"99999"});
    EXPECT_TRUE(j["interpretation"]["classifier_glosses"].is_null());
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0], "symbol 99999 not found in knowledge graph");
}
