/**
 * Catalog Query
 *
 * Read-only enumeration and lookup over the loaded reference catalogs:
 * listing genes / alleles / subgroups with functionality filters, fetching
 * the amino acid regions of an allele, and classifying MH genes by chain
 * and class.
 */

#ifndef IMMUNORM_CATALOG_QUERY_HPP
#define IMMUNORM_CATALOG_QUERY_HPP

#include "immunorm.hpp"
#include "reference_catalog.hpp"
#include <string>
#include <set>
#include <optional>

namespace immunorm {

/**
 * Enumerate catalog contents at a precision.
 *
 * Supported precisions: TR / IG allele, gene, subgroup; HLA allele, protein,
 * gene (allele is served at protein level); mouse MH gene. The functionality
 * filter is ignored for MH.
 *
 * @param contains_pattern ECMAScript regex searched within each result;
 *        empty matches everything
 * @throws std::invalid_argument for an unsupported species, precision or
 *         malformed pattern
 */
std::set<std::string> query(const ReferenceContext& context,
                            const std::string& species,
                            GeneFamily family,
                            Precision precision,
                            FunctionalityFilter functionality = FunctionalityFilter::ANY,
                            const std::string& contains_pattern = "");

std::set<std::string> query(const std::string& species,
                            GeneFamily family,
                            Precision precision,
                            FunctionalityFilter functionality = FunctionalityFilter::ANY,
                            const std::string& contains_pattern = "");

/**
 * Region name -> amino acid sequence of a catalog allele (or gene)
 * @throws std::invalid_argument for an unsupported species
 * @throws std::out_of_range if the symbol has no sequence information
 */
const RegionMap& get_amino_acid_sequence(const ReferenceContext& context,
                                         const std::string& species,
                                         GeneFamily family,
                                         const std::string& symbol);

const RegionMap& get_amino_acid_sequence(const std::string& species,
                                         GeneFamily family,
                                         const std::string& symbol);

/**
 * "alpha" or "beta" for HLA genes and B2M, nullopt otherwise
 */
std::optional<std::string> get_mh_chain(const std::string& symbol);

/**
 * 1 or 2 for HLA genes and B2M, nullopt otherwise
 */
std::optional<int> get_mh_class(const std::string& symbol);

} // namespace immunorm

#endif // IMMUNORM_CATALOG_QUERY_HPP
