/**
 * Reference Catalog Implementation
 */

#include "reference_catalog.hpp"
#include "file_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

#ifndef IMMUNORM_DEFAULT_DATA_DIR
#define IMMUNORM_DEFAULT_DATA_DIR "data"
#endif

namespace immunorm {

// ============================================================================
// CatalogNode
// ============================================================================

const CatalogNode* CatalogNode::find_child(const std::string& key) const {
    auto it = children.find(key);
    if (it == children.end()) return nullptr;
    return it->second.get();
}

CatalogNode& CatalogNode::get_or_add_child(const std::string& key) {
    auto& slot = children[key];
    if (!slot) slot = std::make_unique<CatalogNode>();
    return *slot;
}

bool CatalogNode::has_functional_leaf() const {
    if (is_leaf()) return functionality() == Functionality::FUNCTIONAL;
    for (const auto& [key, child] : children) {
        if (child->has_functional_leaf()) return true;
    }
    return false;
}

static void visit_leaves(const CatalogNode& node,
                         std::vector<std::string>& path,
                         const std::function<void(const std::vector<std::string>&,
                                                  const CatalogNode&)>& visit) {
    if (node.is_leaf()) {
        visit(path, node);
        return;
    }
    for (const auto& [key, child] : node.children) {
        path.push_back(key);
        visit_leaves(*child, path, visit);
        path.pop_back();
    }
}

void CatalogNode::for_each_leaf(const std::function<void(const std::vector<std::string>&,
                                                         const CatalogNode&)>& visit) const {
    std::vector<std::string> path;
    visit_leaves(*this, path, visit);
}

// ============================================================================
// ReferenceCatalog
// ============================================================================

void ReferenceCatalog::add_gene(const std::string& gene) {
    genes_[gene];
}

void ReferenceCatalog::add_allele(const std::string& gene,
                                  const std::vector<std::string>& fields,
                                  const std::string& label) {
    CatalogNode* node = &genes_[gene];
    for (const auto& field : fields) {
        node = &node->get_or_add_child(field);
    }
    node->label = label;
}

bool ReferenceCatalog::contains(const std::string& gene) const {
    return genes_.count(gene) > 0;
}

const CatalogNode* ReferenceCatalog::find_gene(const std::string& gene) const {
    auto it = genes_.find(gene);
    if (it == genes_.end()) return nullptr;
    return &it->second;
}

const CatalogNode* ReferenceCatalog::walk(const std::string& gene,
                                          const std::vector<std::string>& fields) const {
    const CatalogNode* node = find_gene(gene);
    for (const auto& field : fields) {
        if (!node) return nullptr;
        node = node->find_child(field);
    }
    return node;
}

bool ReferenceCatalog::is_valid(const std::string& gene,
                                const std::vector<std::string>& fields,
                                bool enforce_functional) const {
    const CatalogNode* node = walk(gene, fields);
    if (!node) return false;
    if (!enforce_functional) return true;
    return node->has_functional_leaf();
}

// ============================================================================
// SynonymTable / AaSequenceCatalog
// ============================================================================

bool SynonymTable::add(const std::string& alias, const std::string& gene) {
    if (alias == gene) return false;
    entries_[alias] = gene;
    return true;
}

const std::string* SynonymTable::find(const std::string& alias) const {
    auto it = entries_.find(alias);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

void AaSequenceCatalog::add(const std::string& symbol,
                            const std::string& region,
                            const std::string& sequence) {
    entries_[symbol][region] = sequence;
}

const RegionMap* AaSequenceCatalog::find(const std::string& symbol) const {
    auto it = entries_.find(symbol);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

void FamilyCatalog::derive_subgroups() {
    subgroups.clear();
    for (const auto& [gene, node] : genes.genes()) {
        size_t dash = gene.find('-');
        if (dash != std::string::npos) {
            subgroups.insert(gene.substr(0, dash));
        }
    }
}

// ============================================================================
// Loading
// ============================================================================

static bool is_skippable(const std::string& line) {
    return line.empty() || line[0] == '#';
}

static void report_malformed(const std::string& path, size_t malformed) {
    if (malformed > 0) {
        log(LogLevel::WARNING, "Skipped " + std::to_string(malformed) +
                               " malformed rows in " + path);
    }
}

size_t load_gene_catalog(const std::string& path, ReferenceCatalog& catalog) {
    LineReader reader(path);
    std::string line;
    size_t count = 0;
    size_t malformed = 0;

    while (reader.next(line)) {
        if (is_skippable(line)) continue;

        auto fields = split_line(line, '\t');
        std::string gene = trim(fields[0]);
        if (gene.empty() || fields.size() > 3) {
            malformed++;
            continue;
        }

        std::string designation = fields.size() > 1 ? trim(fields[1]) : "";
        std::string label = fields.size() > 2 ? trim(fields[2]) : "";

        if (designation.empty()) {
            catalog.add_gene(gene);
        } else {
            catalog.add_allele(gene, split_line(designation, ':'), label);
        }
        count++;
    }

    report_malformed(path, malformed);
    log(LogLevel::DEBUG, "Loaded " + std::to_string(count) + " catalog rows (" +
                         std::to_string(catalog.size()) + " genes) from " + path);
    return count;
}

size_t load_synonyms(const std::string& path, const ReferenceCatalog& catalog,
                     SynonymTable& synonyms, bool dashless_aliases) {
    LineReader reader(path);
    std::string line;
    size_t count = 0;
    size_t malformed = 0;

    while (reader.next(line)) {
        if (is_skippable(line)) continue;

        auto fields = split_line(line, '\t');
        if (fields.size() != 2 || trim(fields[0]).empty() || trim(fields[1]).empty()) {
            malformed++;
            continue;
        }

        std::string alias = trim(fields[0]);
        std::string gene = trim(fields[1]);
        if (dashless_aliases) {
            alias.erase(std::remove(alias.begin(), alias.end(), '-'), alias.end());
        }

        if (catalog.contains(alias)) {
            log(LogLevel::WARNING, "Synonym " + alias + " in " + path +
                                   " is itself a valid gene, ignoring");
            continue;
        }
        if (!synonyms.add(alias, gene)) {
            log(LogLevel::WARNING, "Synonym " + alias + " in " + path +
                                   " maps onto itself, ignoring");
            continue;
        }
        count++;
    }

    report_malformed(path, malformed);
    log(LogLevel::DEBUG, "Loaded " + std::to_string(count) + " synonyms from " + path);
    return count;
}

size_t load_aa_sequences(const std::string& path, AaSequenceCatalog& sequences) {
    LineReader reader(path);
    std::string line;
    size_t count = 0;
    size_t malformed = 0;

    while (reader.next(line)) {
        if (is_skippable(line)) continue;

        auto fields = split_line(line, '\t');
        if (fields.size() != 3) {
            malformed++;
            continue;
        }

        std::string symbol = trim(fields[0]);
        std::string region = trim(fields[1]);
        std::string sequence = trim(fields[2]);
        if (symbol.empty() || region.empty() || sequence.empty()) {
            malformed++;
            continue;
        }

        sequences.add(symbol, region, sequence);
        count++;
    }

    report_malformed(path, malformed);
    log(LogLevel::DEBUG, "Loaded " + std::to_string(count) + " sequence regions from " + path);
    return count;
}

std::string catalog_file_name(const std::string& species, GeneFamily family,
                              const std::string& suffix) {
    std::string fam = family_to_string(family);
    for (auto& c : fam) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return species + "_" + fam + suffix + ".tsv";
}

// Resolve a table name to its plain or gzipped file, "" if neither exists
static std::string locate_table(const std::string& data_dir, const std::string& name) {
    std::string path = join_path(data_dir, name);
    if (file_exists(path)) return path;
    if (file_exists(path + ".gz")) return path + ".gz";
    return "";
}

// ============================================================================
// ReferenceContext
// ============================================================================

void ReferenceContext::add(const std::string& species, GeneFamily family, FamilyCatalog catalog) {
    catalogs_[std::make_pair(species, family)] = std::move(catalog);
}

const FamilyCatalog* ReferenceContext::find(const std::string& species, GeneFamily family) const {
    auto it = catalogs_.find(std::make_pair(species, family));
    if (it == catalogs_.end()) return nullptr;
    return &it->second;
}

ReferenceContext ReferenceContext::load(const std::string& data_dir) {
    ReferenceContext context;

    for (const auto& species : supported_species()) {
        for (GeneFamily family : {GeneFamily::TR, GeneFamily::IG, GeneFamily::MH}) {
            std::string gene_path = locate_table(data_dir, catalog_file_name(species, family));
            if (gene_path.empty()) continue;

            FamilyCatalog catalog;
            load_gene_catalog(gene_path, catalog.genes);

            std::string synonym_path =
                locate_table(data_dir, catalog_file_name(species, family, "_synonyms"));
            if (!synonym_path.empty()) {
                // Mouse MH aliases are looked up with their dashes removed
                bool dashless = species == "musmusculus" && family == GeneFamily::MH;
                load_synonyms(synonym_path, catalog.genes, catalog.synonyms, dashless);
            }

            std::string aa_path = locate_table(data_dir, catalog_file_name(species, family, "_aa"));
            if (!aa_path.empty()) {
                load_aa_sequences(aa_path, catalog.sequences);
            }

            if (family != GeneFamily::MH) {
                catalog.derive_subgroups();
            }

            log(LogLevel::INFO, "Loaded " + species + " " + family_to_string(family) +
                                " catalog: " + std::to_string(catalog.genes.size()) + " genes, " +
                                std::to_string(catalog.synonyms.size()) + " synonyms, " +
                                std::to_string(catalog.sequences.size()) + " sequences");
            context.add(species, family, std::move(catalog));
        }
    }

    if (context.empty()) {
        log(LogLevel::WARNING, "No reference catalogs found in " + data_dir);
    }
    return context;
}

std::string default_data_dir() {
    const char* env = std::getenv("IMMUNORM_DATA_DIR");
    if (env && env[0] != '\0') return env;
    return IMMUNORM_DEFAULT_DATA_DIR;
}

const ReferenceContext& default_context() {
    static std::once_flag once;
    static std::unique_ptr<ReferenceContext> context;
    std::call_once(once, []() {
        context = std::make_unique<ReferenceContext>(ReferenceContext::load(default_data_dir()));
    });
    return *context;
}

} // namespace immunorm
