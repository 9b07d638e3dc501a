/**
 * Symbol Standardizer
 *
 * Entry point for gene / allele symbol standardization. A symbol is parsed
 * with the grammar of its (species, family) rules record, resolved through
 * the correction cascade, checked by the validity oracle, and returned as a
 * StandardizationResult.
 */

#ifndef IMMUNORM_SYMBOL_STANDARDIZER_HPP
#define IMMUNORM_SYMBOL_STANDARDIZER_HPP

#include "immunorm.hpp"
#include "reference_catalog.hpp"
#include "results.hpp"
#include <string>
#include <map>

namespace immunorm {

/**
 * Tunables of standardize_symbol()
 */
struct SymbolOptions {
    bool enforce_functional = false;    // reject non-functional genes / alleles (TR, IG)
    bool allow_subgroup = false;        // accept symbols that only resolve to a subgroup
    bool log_failures = true;           // WARNING per failed symbol

    /**
     * Keys: enforce_functional, allow_subgroup, log_failures
     * @throws std::invalid_argument for unknown keys or bad values
     */
    static SymbolOptions from_config(const std::map<std::string, std::string>& config);
};

/**
 * Standardize one symbol against the catalogs of `context`.
 *
 * @param species species key ("homosapiens", "Mus musculus", ...), or "any"
 *        for TR / IG to try every supported species in order
 * @return result; failures carry the reason and the best attempted fix.
 *         An unsupported species is a failure whose attempted fix is the
 *         input unchanged.
 */
StandardizationResult standardize_symbol(const ReferenceContext& context,
                                         const std::string& symbol,
                                         GeneFamily family,
                                         const std::string& species = "homosapiens",
                                         const SymbolOptions& options = SymbolOptions());

/**
 * Same, against default_context()
 */
StandardizationResult standardize_symbol(const std::string& symbol,
                                         GeneFamily family,
                                         const std::string& species = "homosapiens",
                                         const SymbolOptions& options = SymbolOptions());

} // namespace immunorm

#endif // IMMUNORM_SYMBOL_STANDARDIZER_HPP
