/**
 * Catalog Query Implementation
 */

#include "catalog_query.hpp"
#include "family_rules.hpp"
#include "symbol_parser.hpp"
#include <regex>
#include <stdexcept>

namespace immunorm {

namespace {

const FamilyCatalog& require_catalog(const ReferenceContext& context,
                                     const std::string& species,
                                     GeneFamily family) {
    const FamilyCatalog* catalog = context.find(species, family);
    if (!catalog || !find_family_rules(species, family)) {
        throw std::invalid_argument("Unsupported species for " + family_to_string(family) +
                                    ": " + species);
    }
    return *catalog;
}

bool gene_passes(const CatalogNode& gene, FunctionalityFilter filter) {
    if (filter == FunctionalityFilter::ANY) return true;
    bool passes = false;
    gene.for_each_leaf([&](const std::vector<std::string>&, const CatalogNode& leaf) {
        if (filter_accepts(filter, leaf.functionality())) passes = true;
    });
    return passes;
}

std::set<std::string> query_receptor(const FamilyCatalog& catalog,
                                     GeneFamily family,
                                     Precision precision,
                                     FunctionalityFilter filter) {
    std::set<std::string> results;
    for (const auto& [gene, node] : catalog.genes.genes()) {
        switch (precision) {
            case Precision::GENE:
                if (gene_passes(node, filter)) results.insert(gene);
                break;
            case Precision::SUBGROUP: {
                size_t dash = gene.find('-');
                if (dash != std::string::npos && gene_passes(node, filter)) {
                    results.insert(gene.substr(0, dash));
                }
                break;
            }
            case Precision::ALLELE:
                node.for_each_leaf([&](const std::vector<std::string>& path,
                                       const CatalogNode& leaf) {
                    if (!path.empty() && filter_accepts(filter, leaf.functionality())) {
                        results.insert(join_symbol(gene, path, ':'));
                    }
                });
                break;
            case Precision::PROTEIN:
                throw std::invalid_argument("Precision protein is not supported for " +
                                            family_to_string(family));
        }
    }
    return results;
}

// Group designations (G / P) are not proteins and are left out
std::set<std::string> query_hla(const FamilyCatalog& catalog, Precision precision) {
    if (precision == Precision::SUBGROUP) {
        throw std::invalid_argument("Precision subgroup is not supported for MH");
    }
    if (precision == Precision::ALLELE) {
        log(LogLevel::WARNING, "HLA alleles are only known up to the protein level "
                               "(two allele designations)");
    }

    std::set<std::string> results;
    for (const auto& [gene, node] : catalog.genes.genes()) {
        if (precision == Precision::GENE) {
            results.insert(gene);
            continue;
        }
        for (const auto& [first, first_node] : node.children) {
            for (const auto& [second, second_node] : first_node->children) {
                if (!is_all_digits(second)) continue;
                results.insert(join_symbol(gene, {first, second}, ':'));
            }
        }
    }
    return results;
}

} // namespace

std::set<std::string> query(const ReferenceContext& context,
                            const std::string& species,
                            GeneFamily family,
                            Precision precision,
                            FunctionalityFilter functionality,
                            const std::string& contains_pattern) {
    const std::string species_key = clean_species(species);
    const FamilyCatalog& catalog = require_catalog(context, species_key, family);
    const FamilyRules& rules = *find_family_rules(species_key, family);

    std::set<std::string> results;
    if (family == GeneFamily::MH) {
        if (functionality != FunctionalityFilter::ANY) {
            log(LogLevel::WARNING, "Functionality filters are ignored for MH queries");
        }
        if (rules.grammar == SymbolGrammar::HLA) {
            results = query_hla(catalog, precision);
        } else if (precision == Precision::GENE) {
            for (const auto& [gene, node] : catalog.genes.genes()) results.insert(gene);
        } else {
            throw std::invalid_argument("Only gene precision is supported for " +
                                        species_key + " MH");
        }
    } else {
        results = query_receptor(catalog, family, precision, functionality);
    }

    if (contains_pattern.empty()) return results;

    std::regex pattern;
    try {
        pattern = std::regex(contains_pattern);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid query pattern '" + contains_pattern + "': " + e.what());
    }

    std::set<std::string> filtered;
    for (const auto& result : results) {
        if (std::regex_search(result, pattern)) filtered.insert(result);
    }
    return filtered;
}

std::set<std::string> query(const std::string& species,
                            GeneFamily family,
                            Precision precision,
                            FunctionalityFilter functionality,
                            const std::string& contains_pattern) {
    return query(default_context(), species, family, precision, functionality, contains_pattern);
}

const RegionMap& get_amino_acid_sequence(const ReferenceContext& context,
                                         const std::string& species,
                                         GeneFamily family,
                                         const std::string& symbol) {
    const FamilyCatalog& catalog = require_catalog(context, clean_species(species), family);
    const RegionMap* regions = catalog.sequences.find(clean_symbol(symbol));
    if (!regions) {
        throw std::out_of_range("No amino acid sequence known for " + symbol);
    }
    return *regions;
}

const RegionMap& get_amino_acid_sequence(const std::string& species,
                                         GeneFamily family,
                                         const std::string& symbol) {
    return get_amino_acid_sequence(default_context(), species, family, symbol);
}

// ============================================================================
// MH classification
// ============================================================================

std::optional<std::string> get_mh_chain(const std::string& symbol) {
    static const std::regex alpha(R"(^HLA-([ABCEFG]|D[PQR]A))");
    static const std::regex beta(R"(^(HLA-D[PQR]B|B2M))");

    const std::string gene = parse_hla_symbol(clean_symbol(symbol)).gene;
    if (std::regex_search(gene, alpha)) return std::string("alpha");
    if (std::regex_search(gene, beta)) return std::string("beta");

    log(LogLevel::WARNING, "Unrecognized MH gene " + symbol + ", chain unknown");
    return std::nullopt;
}

std::optional<int> get_mh_class(const std::string& symbol) {
    static const std::regex class_one(R"(^(HLA-[ABCEFG]|B2M))");
    static const std::regex class_two(R"(^HLA-D[PQR][AB])");

    const std::string gene = parse_hla_symbol(clean_symbol(symbol)).gene;
    if (std::regex_search(gene, class_one)) return 1;
    if (std::regex_search(gene, class_two)) return 2;

    log(LogLevel::WARNING, "Unrecognized MH gene " + symbol + ", class unknown");
    return std::nullopt;
}

} // namespace immunorm
