/**
 * Reference Catalog
 *
 * Immutable lookup structures consumed by every resolution call:
 * - ReferenceCatalog: gene -> allele field -> ... -> functionality label
 * - SynonymTable: deprecated / alias symbol -> current gene name
 * - AaSequenceCatalog: allele symbol -> region name -> amino acid sequence
 *
 * One FamilyCatalog bundles the three tables for a (species, gene family)
 * pair. A ReferenceContext owns all loaded FamilyCatalogs and is shared
 * read-only between callers once built.
 */

#ifndef IMMUNORM_REFERENCE_CATALOG_HPP
#define IMMUNORM_REFERENCE_CATALOG_HPP

#include "immunorm.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <functional>
#include <unordered_map>
#include <utility>

namespace immunorm {

// ============================================================================
// Gene / allele tree
// ============================================================================

/**
 * One level of the allele designation tree. Inner nodes are keyed by
 * designation field ("01", "02", "01P"); leaves carry a functionality label
 * or an MH group tag.
 */
struct CatalogNode {
    std::string label;
    std::map<std::string, std::unique_ptr<CatalogNode>> children;

    bool is_leaf() const { return children.empty(); }
    Functionality functionality() const { return parse_functionality(label); }

    const CatalogNode* find_child(const std::string& key) const;
    CatalogNode& get_or_add_child(const std::string& key);

    /**
     * True if any leaf below (or this node, if a leaf) is labelled Functional
     */
    bool has_functional_leaf() const;

    /**
     * Visit every leaf with the designation path leading to it
     */
    void for_each_leaf(const std::function<void(const std::vector<std::string>&,
                                                const CatalogNode&)>& visit) const;
};

class ReferenceCatalog {
public:
    /**
     * Register a gene with no allele information
     */
    void add_gene(const std::string& gene);

    /**
     * Register an allele path ending in a leaf label
     */
    void add_allele(const std::string& gene,
                    const std::vector<std::string>& fields,
                    const std::string& label);

    bool contains(const std::string& gene) const;
    const CatalogNode* find_gene(const std::string& gene) const;

    /**
     * Walk the tree one designation field at a time.
     * @return nullptr if the gene or any field along the path is unknown
     */
    const CatalogNode* walk(const std::string& gene,
                            const std::vector<std::string>& fields) const;

    /**
     * Validity oracle on the raw tree. With enforce_functional a gene needs
     * at least one Functional allele, and an allele path must end at (or
     * contain only) Functional leaves.
     */
    bool is_valid(const std::string& gene,
                  const std::vector<std::string>& fields,
                  bool enforce_functional) const;

    const std::map<std::string, CatalogNode>& genes() const { return genes_; }
    size_t size() const { return genes_.size(); }

private:
    std::map<std::string, CatalogNode> genes_;
};

// ============================================================================
// Synonyms and sequences
// ============================================================================

class SynonymTable {
public:
    /**
     * @return false (entry ignored) if alias equals gene
     */
    bool add(const std::string& alias, const std::string& gene);

    /**
     * @return the current gene name for an alias, or nullptr
     */
    const std::string* find(const std::string& alias) const;

    size_t size() const { return entries_.size(); }
    const std::unordered_map<std::string, std::string>& entries() const { return entries_; }

private:
    std::unordered_map<std::string, std::string> entries_;
};

/**
 * Region name -> amino acid string ("V-REGION", "FR3-IMGT", "J-REGION",
 * "J-MOTIF", "J-PHE", ...)
 */
using RegionMap = std::map<std::string, std::string>;

class AaSequenceCatalog {
public:
    void add(const std::string& symbol, const std::string& region, const std::string& sequence);

    const RegionMap* find(const std::string& symbol) const;

    const std::map<std::string, RegionMap>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, RegionMap> entries_;
};

/**
 * All reference data for one (species, gene family) pair
 */
struct FamilyCatalog {
    ReferenceCatalog genes;
    SynonymTable synonyms;
    AaSequenceCatalog sequences;
    std::set<std::string> subgroups;

    /**
     * Rebuild `subgroups` from gene names: the text before the first '-'
     * of every gene that has one ("IGLV8-61" -> "IGLV8").
     */
    void derive_subgroups();
};

// ============================================================================
// Loading
// ============================================================================

/**
 * Load `gene<TAB>field1:field2...<TAB>label` rows into a catalog
 * @return number of rows loaded
 * @throws std::runtime_error if the file cannot be opened
 */
size_t load_gene_catalog(const std::string& path, ReferenceCatalog& catalog);

/**
 * Load `alias<TAB>gene` rows. Rows whose alias equals its target or is
 * itself a valid gene are skipped. With dashless_aliases, dashes are
 * removed from each alias before it is stored.
 */
size_t load_synonyms(const std::string& path, const ReferenceCatalog& catalog,
                     SynonymTable& synonyms, bool dashless_aliases = false);

/**
 * Load `allele<TAB>region<TAB>sequence` rows
 */
size_t load_aa_sequences(const std::string& path, AaSequenceCatalog& sequences);

/**
 * File name of a catalog table, e.g. catalog_file_name("homosapiens", TR, "_aa")
 * -> "homosapiens_tr_aa.tsv"
 */
std::string catalog_file_name(const std::string& species, GeneFamily family,
                              const std::string& suffix = "");

// ============================================================================
// Context
// ============================================================================

class ReferenceContext {
public:
    ReferenceContext() = default;

    ReferenceContext(ReferenceContext&&) = default;
    ReferenceContext& operator=(ReferenceContext&&) = default;
    ReferenceContext(const ReferenceContext&) = delete;
    ReferenceContext& operator=(const ReferenceContext&) = delete;

    /**
     * Load every <species>_<family> table set found in data_dir.
     * Tables that are absent are skipped; the synonym and sequence tables
     * are optional even when the gene table is present.
     */
    static ReferenceContext load(const std::string& data_dir);

    void add(const std::string& species, GeneFamily family, FamilyCatalog catalog);

    /**
     * @return nullptr if no catalog is loaded for the pair
     */
    const FamilyCatalog* find(const std::string& species, GeneFamily family) const;

    bool empty() const { return catalogs_.empty(); }
    size_t size() const { return catalogs_.size(); }

private:
    std::map<std::pair<std::string, GeneFamily>, FamilyCatalog> catalogs_;
};

/**
 * Data directory of the default context: $IMMUNORM_DATA_DIR if set,
 * otherwise the directory configured at build time.
 */
std::string default_data_dir();

/**
 * Process-wide context, loaded from default_data_dir() on first use.
 * Safe under concurrent first use.
 */
const ReferenceContext& default_context();

} // namespace immunorm

#endif // IMMUNORM_REFERENCE_CATALOG_HPP
