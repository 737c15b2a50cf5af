/**
 * @file test_engine_facade.cpp
 * @brief End-to-end tests of BlissEngine over the example data files
 *
 * Loads data/example_dictionary.json and data/example_semantics.json the
 * way the CLI does, then walks the three use cases.
 */

#include <gtest/gtest.h>
#include <engine/bliss_engine.hpp>
#include <utils/logger.hpp>
#include "../bliss_fixtures.hpp"
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#ifndef BLISS_TEST_DATA_DIR
#define BLISS_TEST_DATA_DIR "data"
#endif

using namespace Bliss;

static const std::string kDataDir = BLISS_TEST_DATA_DIR;

class EngineFacadeTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        EngineConfig config;
        config.dictionary_path = kDataDir + "/example_dictionary.json";
        config.semantics_path = kDataDir + "/example_semantics.json";
        config.log_level = Logger::Level::Quiet;
        engine = BlissEngine::from_config(config).release();
    }

    static void TearDownTestSuite() {
        delete engine;
        engine = nullptr;
    }

    static BlissEngine* engine;
};

BlissEngine* EngineFacadeTest::engine = nullptr;

using Ids = std::vector<std::string>;

// ============================================================================
// Loading
// ============================================================================

TEST_F(EngineFacadeTest, LoadsExampleData) {
    ASSERT_NE(engine, nullptr);
    auto stats = engine->dictionary_stats();
    EXPECT_EQ(stats.symbols, 12u);
    EXPECT_EQ(stats.composed_words, 1u);

    auto info = engine->knowledge_graph_info();
    EXPECT_EQ(info["modifiers"], 2);
    EXPECT_EQ(info["indicators"], 4);
    EXPECT_EQ(info["characters"], 11);
}

TEST_F(EngineFacadeTest, FilesMatchInMemoryFixture) {
    BlissEngine in_memory(BlissTest::dictionary_json(), BlissTest::tables_json());
    EXPECT_EQ(in_memory.semantic_tables().to_json(), engine->semantic_tables().to_json());
    EXPECT_EQ(in_memory.dictionary().size(), engine->dictionary().size());
}

TEST(EngineLoadingTest, MissingFilesThrow) {
    EngineConfig config;
    config.dictionary_path = kDataDir + "/does_not_exist.json";
    config.semantics_path = kDataDir + "/example_semantics.json";
    config.log_level = Logger::Level::Quiet;
    EXPECT_THROW(BlissEngine::from_config(config), std::runtime_error);
}

TEST(EngineLoadingTest, ConfigFromEnvironment) {
    ::unsetenv("BLISS_DICT_PATH");
    ::unsetenv("BLISS_SEMANTICS_PATH");
    EXPECT_THROW(EngineConfig::load_from_env(), std::runtime_error);

    ::setenv("BLISS_DICT_PATH", "/tmp/dict.json", 1);
    EXPECT_THROW(EngineConfig::load_from_env(), std::runtime_error);

    ::setenv("BLISS_SEMANTICS_PATH", "/tmp/sem.json", 1);
    ::setenv("BLISS_LANGUAGE", "sv", 1);
    ::setenv("BLISS_LOG_LEVEL", "quiet", 1);
    auto config = EngineConfig::load_from_env();
    EXPECT_EQ(config.dictionary_path, "/tmp/dict.json");
    EXPECT_EQ(config.semantics_path, "/tmp/sem.json");
    EXPECT_EQ(config.language, "sv");
    EXPECT_EQ(config.log_level, Logger::Level::Quiet);

    ::unsetenv("BLISS_DICT_PATH");
    ::unsetenv("BLISS_SEMANTICS_PATH");
    ::unsetenv("BLISS_LANGUAGE");
    ::unsetenv("BLISS_LOG_LEVEL");
}

TEST(EngineLoadingTest, EnvironmentReadPerVariable) {
    ::unsetenv("BLISS_DICT_PATH");
    ::unsetenv("BLISS_SEMANTICS_PATH");
    ::setenv("BLISS_LANGUAGE", "sv", 1);

    // Only the dictionary path given explicitly: the language still comes from the environment.
    auto config = EngineConfig::read_env();
    EXPECT_EQ(config.language, "sv");
    EXPECT_TRUE(config.dictionary_path.empty());
    config.dictionary_path = kDataDir + "/example_dictionary.json";
    EXPECT_THROW(config.require_paths(), std::runtime_error);

    ::setenv("BLISS_SEMANTICS_PATH", (kDataDir + "/example_semantics.json").c_str(), 1);
    config = EngineConfig::read_env();
    config.dictionary_path = kDataDir + "/example_dictionary.json";
    EXPECT_NO_THROW(config.require_paths());
    EXPECT_EQ(config.semantics_path, kDataDir + "/example_semantics.json");

    config.log_level = Logger::Level::Quiet;
    auto engine = BlissEngine::from_config(config);
    EXPECT_EQ(engine->symbol_glosses("24920", config.language).glosses[0], "medicin");

    ::unsetenv("BLISS_SEMANTICS_PATH");
    ::unsetenv("BLISS_LANGUAGE");
}

TEST(EngineLoadingTest, MalformedJsonThrows) {
    EXPECT_THROW(BlissEngine e(nlohmann::json::array(), BlissTest::tables_json()), std::invalid_argument);
    EXPECT_THROW(BlissEngine e(BlissTest::dictionary_json(), nlohmann::json("x")), std::invalid_argument);
}

// ============================================================================
// Use case 1: glosses
// ============================================================================

TEST_F(EngineFacadeTest, SymbolGlosses) {
    auto g = engine->symbol_glosses("24920");
    EXPECT_EQ(g.glosses, Ids({"medicine", "medication"}));
    EXPECT_EQ(g.explanation, "Cross used for medicine.");

    auto j = engine->composition_glosses({"14905", "/", "24920"}, "sv");
    ASSERT_EQ(j["components"].size(), 2u);
    EXPECT_EQ(j["components"][1]["glosses"][0], "medicin");
}

// ============================================================================
// Use case 2: analysis
// ============================================================================

TEST_F(EngineFacadeTest, AnalyzeComposition) {
    auto a = engine->analyze_composition({"14647", "14905", "24920", "9011"});
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(*a.assignment.classifier, "14905");

    auto j = a.to_json();
    EXPECT_EQ(j["classifier_info"]["gloss"][0], "building");
    EXPECT_EQ(j["specifier_info"][0]["gloss"][0], "medicine");
    ASSERT_EQ(j["semantics"].size(), 2u);
    EXPECT_EQ(j["semantics"][0]["indicator"]["NUMBER"], "plural");
    EXPECT_EQ(j["semantics"][1]["modifier"]["QUANTIFIER"], "many");
}

TEST_F(EngineFacadeTest, StructureAndUtilities) {
    auto s = engine->composition_structure({"12858", "8993"});
    EXPECT_EQ(s["structure"]["classifier"], "12858");
    EXPECT_EQ(s["interpretation"]["indicator_count"], 1);

    auto fact = engine->extract_semantics("8993", SymbolRole::Indicator);
    ASSERT_TRUE(fact.has_value());
    EXPECT_EQ(fact->to_json()["alternatives"].size(), 2u);

    EXPECT_TRUE(engine->is_classifier("12858"));
    EXPECT_TRUE(engine->is_modifier("15474"));
    EXPECT_TRUE(engine->is_indicator("9009"));
    EXPECT_EQ(engine->symbol_info("9009")["type"], "indicator");

    auto ctx = engine->symbol_in_context("14905", {"14905", "9011"});
    EXPECT_EQ(ctx["type"], "character_or_word");
    EXPECT_EQ(ctx["context_classification"]["indicators"][0], "9011");
}

// ============================================================================
// Use case 3: composition
// ============================================================================

TEST_F(EngineFacadeTest, ComposeFromSpecFile) {
    std::ifstream in(kDataDir + "/example_spec.json");
    ASSERT_TRUE(in.good());
    auto spec = nlohmann::json::parse(in);

    auto r = engine->compose_from_spec(spec);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.composition, Ids({"14905", "24920", "9011", "14647"}));
    EXPECT_TRUE(r.warnings.empty());
}

TEST_F(EngineFacadeTest, ComposeThenAnalyze) {
    auto r = engine->compose_with_ids("14905", {"24920"}, {"14647"}, {"9011"});
    ASSERT_TRUE(r.ok());

    auto a = engine->analyze_composition(r.composition);
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(a.assignment.specifiers, Ids({"24920"}));
    EXPECT_EQ(a.assignment.modifiers, Ids({"14647"}));
    EXPECT_EQ(a.assignment.indicators, Ids({"9011"}));
}

TEST_F(EngineFacadeTest, ComposeErrorsAsJson) {
    auto missing = engine->compose_from_spec(nlohmann::json::parse(R"({"specifiers": ["house"]})"));
    EXPECT_EQ(missing.to_json()["error"], "missing required field: classifier");

    auto unknown = engine->compose_with_ids("99999");
    EXPECT_EQ(unknown.to_json()["error_kind"], "not_found");
}
