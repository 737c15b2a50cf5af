/**
 * @file role_classifier.hpp
 * @brief Assigns classifier / specifier / indicator / modifier roles to a composition
 *
 * Classification is an ordered rule table. Rules are tried top-down and the
 * first rule whose guard holds decides the whole assignment:
 *
 * 1. indicator-anchored: an indicator follows its governing head symbol
 * 2. part-of-speech:     the first head-bearing (coloured) symbol is the classifier
 * 3. all-satellite:      a grey/white first symbol is promoted to classifier
 *
 * Rendering markers ("/", ";", ...) are dropped before any rule runs.
 */

#pragma once

#include <lexicon/dictionary.hpp>
#include <lexicon/semantic_tables.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace Bliss {

/**
 * @brief Result of classifying one composition.
 *
 * Lists keep first-appearance order. Roles are assigned per position, not
 * per id: a repeated id gets one role for each occurrence, so
 * ["14905", "14905", "9011"] yields classifier 14905 and specifier 14905.
 * Errors are diagnostics: buckets filled before an error was detected stay
 * populated.
 */
struct RoleAssignment {
    std::optional<SymbolId> classifier;
    std::vector<SymbolId> specifiers;
    std::vector<SymbolId> indicators;
    std::vector<SymbolId> modifiers;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
    nlohmann::json to_json() const;
};

class RoleClassifier {
public:
    RoleClassifier(const Dictionary& dictionary, const SemanticTables& tables);

    /**
     * @brief Classify a token sequence. Never throws on bad input.
     */
    RoleAssignment classify(const std::vector<std::string>& tokens) const;

    bool is_classifier(const SymbolId& id) const;
    bool is_modifier(const SymbolId& id) const { return modifier_ids_.count(id) != 0; }
    bool is_indicator(const SymbolId& id) const { return indicator_ids_.count(id) != 0; }
    bool is_specifier(const SymbolId& id) const { return dictionary_.contains(id); }

    /**
     * @brief Record details plus role type ("modifier", "indicator",
     * "character_or_word") and table semantics; {"error": ..} for unknown ids.
     */
    nlohmann::json symbol_info(const SymbolId& id) const;

    /// Numeric tokens only, in order.
    static std::vector<SymbolId> filter_symbol_ids(const std::vector<std::string>& tokens);

private:
    using Ids = std::vector<SymbolId>;

    struct Rule {
        const char* name;
        bool (RoleClassifier::*applies)(const Ids&) const;
        void (RoleClassifier::*assign)(const Ids&, RoleAssignment&) const;
    };

    static const Rule kRules[];

    bool has_indicator(const Ids& ids) const;
    void assign_around_indicator(const Ids& ids, RoleAssignment& out) const;

    bool has_head_symbol(const Ids& ids) const;
    void assign_by_pos(const Ids& ids, RoleAssignment& out) const;

    bool always(const Ids&) const { return true; }
    void assign_all_satellite(const Ids& ids, RoleAssignment& out) const;

    void distribute_by_pos(const Ids& ids, RoleAssignment& out) const;

    PosCategory pos_of(const SymbolId& id) const;

    const Dictionary& dictionary_;
    const SemanticTables& tables_;
    std::unordered_set<SymbolId> modifier_ids_;
    std::unordered_set<SymbolId> indicator_ids_;
};

} // namespace Bliss
