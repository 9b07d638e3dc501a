/**
 * immunorm - Immune Receptor Nomenclature Normalizer
 *
 * A C++ library that maps free-form immune receptor gene and allele
 * symbols (TR, IG, HLA / mouse MH) onto the IMGT reference nomenclature,
 * and verifies, trims or reconstructs CDR3 junction sequences by aligning
 * them against reference V and J regions.
 *
 * Required data files (per species and gene family):
 * - <species>_<family>.tsv           gene / allele / functionality tree
 * - <species>_<family>_synonyms.tsv  deprecated symbol -> current gene
 * - <species>_<family>_aa.tsv        allele -> region -> amino acid sequence
 */

#ifndef IMMUNORM_HPP
#define IMMUNORM_HPP

#include <string>
#include <vector>
#include <optional>

namespace immunorm {

/**
 * Gene families with their own nomenclature grammar
 */
enum class GeneFamily {
    TR,     // T cell receptor
    IG,     // Immunoglobulin
    MH      // Major histocompatibility (HLA for Homo sapiens)
};

/**
 * Specificity at which a resolved symbol can be rendered
 */
enum class Precision {
    SUBGROUP,
    GENE,
    PROTEIN,
    ALLELE
};

/**
 * IMGT functionality labels carried by catalog leaves
 */
enum class Functionality {
    FUNCTIONAL,     // F
    ORF,            // open reading frame
    PSEUDOGENE,     // P
    NONE            // MH group tags and unlabelled leaves
};

/**
 * Filters accepted by catalog queries
 */
enum class FunctionalityFilter {
    ANY,
    FUNCTIONAL,
    NON_FUNCTIONAL,
    PSEUDOGENE,
    ORF
};

/**
 * Get string representation of gene family ("TR", "IG", "MH")
 */
std::string family_to_string(GeneFamily family);

/**
 * Parse a gene family name (case-insensitive)
 * @throws std::invalid_argument for unknown families
 */
GeneFamily parse_family(const std::string& name);

std::string precision_to_string(Precision precision);

/**
 * Parse precision name: subgroup, gene, protein, allele
 * @throws std::invalid_argument for unknown names
 */
Precision parse_precision(const std::string& name);

/**
 * Map a catalog leaf label ("F", "ORF", "P") onto a functionality value.
 * Labels are accepted with IMGT's bracket decorations, e.g. "(F)" or "[P]".
 */
Functionality parse_functionality(const std::string& label);

std::string functionality_to_string(Functionality functionality);

/**
 * Parse a query filter: any, F, NF, P, ORF
 * @throws std::invalid_argument for unknown filters
 */
FunctionalityFilter parse_functionality_filter(const std::string& name);

bool filter_accepts(FunctionalityFilter filter, Functionality functionality);

/**
 * Normalize a species key: strip whitespace and lowercase
 * ("Homo Sapiens" -> "homosapiens")
 */
std::string clean_species(const std::string& species);

/**
 * Species keys known to the dispatch table, in lookup order
 */
const std::vector<std::string>& supported_species();

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
LogLevel get_log_level();
void log(LogLevel level, const std::string& message);

} // namespace immunorm

#endif // IMMUNORM_HPP
