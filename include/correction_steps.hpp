/**
 * Correction Steps
 *
 * The strategies of the heuristic resolution cascade. Every step is a pure
 * function ParsedSymbol -> ParsedSymbol; a step that does not apply returns
 * its input unchanged. run_cascade() folds a rules record's step list over
 * a symbol and stops at the first accepted result.
 */

#ifndef IMMUNORM_CORRECTION_STEPS_HPP
#define IMMUNORM_CORRECTION_STEPS_HPP

#include "family_rules.hpp"
#include <string>
#include <vector>

namespace immunorm {

struct CascadeOutcome {
    bool accepted = false;
    ParsedSymbol symbol;            // accepted symbol, or the best attempted fix
    size_t steps_applied = 0;
};

/**
 * Apply the cascade of env.rules to `symbol`
 */
CascadeOutcome run_cascade(const ParsedSymbol& symbol, const CascadeEnv& env);

// ============================================================================
// Steps shared by several families
// ============================================================================

/**
 * Replace a deprecated gene name with its current name
 */
ParsedSymbol substitute_synonym(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * Prepend the family prefix ("TR", "IG") if absent
 */
ParsedSymbol insert_family_prefix(const ParsedSymbol& symbol, const CascadeEnv& env);

// ============================================================================
// TR
// ============================================================================

/**
 * TCR -> TR, S and . -> -, missing slashes before DV / OR designations,
 * and leading zeros of numbers
 */
ParsedSymbol repair_tr_affixes(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * TRAV14 -> TRAV14/DV4, TRAV14/4 -> TRAV14/DV4
 */
ParsedSymbol resolve_dv_from_av(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * TRDV4 -> TRAV14/DV4, TR29/DV5 -> TRAV29/DV5
 */
ParsedSymbol resolve_av_from_dv(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * Try every combination of adding / removing "-1" on each locus number,
 * re-running the cascade once on each variant
 */
ParsedSymbol toggle_dash1_suffixes(const ParsedSymbol& symbol, const CascadeEnv& env);

// ============================================================================
// IG
// ============================================================================

/**
 * . -> -, missing slashes before OR designations, leading zeros of numbers
 */
ParsedSymbol repair_ig_affixes(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * Try every combination of keeping / removing "-1" on each locus number
 */
ParsedSymbol drop_dash1_suffixes(const ParsedSymbol& symbol, const CascadeEnv& env);

// ============================================================================
// MH
// ============================================================================

/**
 * Add the HLA- prefix, CW -> C
 */
ParsedSymbol repair_hla_affixes(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * HLA-B5701 -> HLA-B, ["5701"]
 */
ParsedSymbol split_forgotten_asterisk(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * ["5701"] -> ["57", "01"]
 */
ParsedSymbol split_forgotten_colon(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * Try 2- and 3-digit widths on the first two allele fields
 */
ParsedSymbol search_leading_zero_widths(const ParsedSymbol& symbol, const CascadeEnv& env);

/**
 * Mouse MH synonym lookup with dashes ignored (H-2Eb1 -> MH2-EB1)
 */
ParsedSymbol substitute_dashless_synonym(const ParsedSymbol& symbol, const CascadeEnv& env);

// ============================================================================
// String helpers
// ============================================================================

/**
 * Replace "-TOKEN" / "TOKEN" with "/TOKEN" unless already preceded by '/'
 * (or by "TR" when skip_after_tr is set): TRAV14DV4 -> TRAV14/DV4
 */
std::string slash_before_token(const std::string& gene, const std::string& token,
                               bool skip_after_tr);

/**
 * Remove runs of zeros that are not preceded by a digit: TRBV01 -> TRBV1
 */
std::string strip_unanchored_zeros(const std::string& gene);

/**
 * Variants of `gene` with "-1" toggled on each number. With allow_adding,
 * bare numbers gain a "-1" as well as numbers losing theirs; otherwise only
 * removal is tried. The unchanged gene is not included.
 */
std::vector<std::string> dash1_variants(const std::string& gene, bool allow_adding);

} // namespace immunorm

#endif // IMMUNORM_CORRECTION_STEPS_HPP
