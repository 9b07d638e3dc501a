/**
 * Family Rules
 *
 * Dispatch table mapping a (species, gene family) pair onto the record that
 * drives symbol standardization for it: the symbol grammar, the expected
 * prefix, the validity rules and the ordered list of correction steps.
 *
 * The validity oracle and the precision compiler are defined here because
 * both only depend on a rules record, a catalog and a parsed symbol.
 */

#ifndef IMMUNORM_FAMILY_RULES_HPP
#define IMMUNORM_FAMILY_RULES_HPP

#include "immunorm.hpp"
#include "reference_catalog.hpp"
#include "symbol_parser.hpp"
#include <string>
#include <vector>
#include <set>
#include <functional>

namespace immunorm {

struct FamilyRules;

/**
 * Symbol grammars; selects parser and oracle behavior
 */
enum class SymbolGrammar {
    RECEPTOR,   // TR: single numeric allele field
    IG,         // IG: receptor grammar plus orphon a/b suffixes and subgroups
    HLA,        // colon-separated fields, G/P groups, expression qualifiers
    MOUSE_MH    // gene-level catalog, dash-insensitive synonyms
};

/**
 * Call-local state handed to each correction step
 */
struct CascadeEnv {
    const FamilyRules& rules;
    const FamilyCatalog& catalog;
    bool allow_subgroup;
    bool may_retry;     // one-shot recursion guard for the suffix toggle step

    /**
     * Cascade acceptance test: gene name known (or an allowed subgroup),
     * or for HLA the full allele designation valid.
     */
    bool accepts(const ParsedSymbol& symbol) const;

    CascadeEnv without_retry() const {
        return CascadeEnv{rules, catalog, allow_subgroup, false};
    }
};

using CorrectionFn = std::function<ParsedSymbol(const ParsedSymbol&, const CascadeEnv&)>;

/**
 * One named correction strategy.
 *
 * Normalizing steps (speculative = false) are kept in the best attempted
 * fix even if the cascade fails; speculative steps only count if the
 * cascade ends in an accepted symbol.
 */
struct CorrectionStep {
    std::string name;
    CorrectionFn apply;
    bool speculative;
};

struct FamilyRules {
    std::string species;
    GeneFamily family;
    SymbolGrammar grammar;
    std::string prefix;                     // "TR", "IG", "HLA-"
    bool has_subgroups = false;
    bool tracks_functionality = true;
    std::set<std::string> literal_genes;    // valid without a catalog entry
    std::vector<CorrectionStep> cascade;
};

/**
 * All rules records, in species lookup order
 */
const std::vector<FamilyRules>& family_rules_table();

/**
 * @return nullptr if the pair has no rules
 */
const FamilyRules* find_family_rules(const std::string& species, GeneFamily family);

/**
 * Clean and parse with the grammar of the rules record
 */
ParsedSymbol parse_symbol(const FamilyRules& rules, const std::string& raw);

bool is_known_gene(const FamilyRules& rules, const FamilyCatalog& catalog,
                   const std::string& gene);

bool is_subgroup(const FamilyRules& rules, const FamilyCatalog& catalog,
                 const std::string& name);

/**
 * Validity oracle.
 * @return empty string if valid, otherwise the reason:
 *   "unrecognized gene name", "is subgroup",
 *   "nonexistent allele for recognized gene", "nonfunctional allele",
 *   "gene has no functional alleles", "too many allele designators",
 *   "non-numerical allele designators", "non-2-digit allele designators"
 */
std::string reason_invalid(const FamilyRules& rules,
                           const FamilyCatalog& catalog,
                           const ParsedSymbol& symbol,
                           bool enforce_functional,
                           bool allow_subgroup);

/**
 * Render a symbol at the requested precision. Never fails; a precision the
 * family or symbol lacks renders as the gene name.
 */
std::string compile_symbol(const FamilyRules& rules,
                           const ParsedSymbol& symbol,
                           Precision precision);

} // namespace immunorm

#endif // IMMUNORM_FAMILY_RULES_HPP
