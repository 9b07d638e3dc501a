/**
 * Family Rules Implementation
 */

#include "family_rules.hpp"
#include "correction_steps.hpp"
#include <algorithm>

namespace immunorm {

// ============================================================================
// Dispatch table
// ============================================================================

namespace {

std::vector<CorrectionStep> tr_cascade() {
    return {
        {"synonym", substitute_synonym, false},
        {"common errors", repair_tr_affixes, false},
        {"family prefix", insert_family_prefix, true},
        {"DV from AV", resolve_dv_from_av, true},
        {"AV from DV", resolve_av_from_dv, true},
        {"-1 toggle", toggle_dash1_suffixes, true},
    };
}

std::vector<CorrectionStep> ig_cascade() {
    return {
        {"synonym", substitute_synonym, false},
        {"common errors", repair_ig_affixes, false},
        {"family prefix", insert_family_prefix, true},
        {"-1 removal", drop_dash1_suffixes, true},
    };
}

std::vector<CorrectionStep> hla_cascade() {
    return {
        {"synonym", substitute_synonym, false},
        {"HLA prefix", repair_hla_affixes, false},
        {"forgotten asterisk", split_forgotten_asterisk, false},
        {"forgotten colon", split_forgotten_colon, false},
        {"leading zeros", search_leading_zero_widths, true},
    };
}

std::vector<CorrectionStep> mouse_mh_cascade() {
    return {
        {"dashless synonym", substitute_dashless_synonym, false},
    };
}

FamilyRules make_receptor_rules(const std::string& species, GeneFamily family) {
    FamilyRules rules;
    rules.species = species;
    rules.family = family;
    rules.has_subgroups = true;
    if (family == GeneFamily::TR) {
        rules.grammar = SymbolGrammar::RECEPTOR;
        rules.prefix = "TR";
        rules.cascade = tr_cascade();
    } else {
        rules.grammar = SymbolGrammar::IG;
        rules.prefix = "IG";
        rules.cascade = ig_cascade();
    }
    return rules;
}

std::vector<FamilyRules> build_rules_table() {
    std::vector<FamilyRules> table;

    table.push_back(make_receptor_rules("homosapiens", GeneFamily::TR));
    table.push_back(make_receptor_rules("homosapiens", GeneFamily::IG));

    FamilyRules hla;
    hla.species = "homosapiens";
    hla.family = GeneFamily::MH;
    hla.grammar = SymbolGrammar::HLA;
    hla.prefix = "HLA-";
    hla.tracks_functionality = false;
    hla.literal_genes = {"B2M"};
    hla.cascade = hla_cascade();
    table.push_back(std::move(hla));

    table.push_back(make_receptor_rules("musmusculus", GeneFamily::TR));
    table.push_back(make_receptor_rules("musmusculus", GeneFamily::IG));

    FamilyRules mouse_mh;
    mouse_mh.species = "musmusculus";
    mouse_mh.family = GeneFamily::MH;
    mouse_mh.grammar = SymbolGrammar::MOUSE_MH;
    mouse_mh.tracks_functionality = false;
    mouse_mh.cascade = mouse_mh_cascade();
    table.push_back(std::move(mouse_mh));

    return table;
}

bool ends_with_group_tag(const std::vector<std::string>& fields) {
    if (fields.empty() || fields.back().empty()) return false;
    char last = fields.back().back();
    return last == 'G' || last == 'P';
}

} // namespace

const std::vector<FamilyRules>& family_rules_table() {
    static const std::vector<FamilyRules> table = build_rules_table();
    return table;
}

const FamilyRules* find_family_rules(const std::string& species, GeneFamily family) {
    for (const auto& rules : family_rules_table()) {
        if (rules.species == species && rules.family == family) return &rules;
    }
    return nullptr;
}

ParsedSymbol parse_symbol(const FamilyRules& rules, const std::string& raw) {
    std::string cleaned = clean_symbol(raw);
    switch (rules.grammar) {
        case SymbolGrammar::IG: return parse_ig_symbol(cleaned);
        case SymbolGrammar::HLA: return parse_hla_symbol(cleaned);
        case SymbolGrammar::RECEPTOR:
        case SymbolGrammar::MOUSE_MH:
            break;
    }
    return parse_receptor_symbol(cleaned);
}

bool is_known_gene(const FamilyRules& rules, const FamilyCatalog& catalog,
                   const std::string& gene) {
    return rules.literal_genes.count(gene) > 0 || catalog.genes.contains(gene);
}

bool is_subgroup(const FamilyRules& rules, const FamilyCatalog& catalog,
                 const std::string& name) {
    return rules.has_subgroups && catalog.subgroups.count(name) > 0;
}

// ============================================================================
// Validity oracle
// ============================================================================

static std::string reason_invalid_receptor(const FamilyRules& rules,
                                           const FamilyCatalog& catalog,
                                           const ParsedSymbol& symbol,
                                           bool enforce_functional,
                                           bool allow_subgroup) {
    const CatalogNode* gene_node = catalog.genes.find_gene(symbol.gene);
    if (!gene_node) {
        if (is_subgroup(rules, catalog, symbol.gene)) {
            return allow_subgroup ? "" : "is subgroup";
        }
        return "unrecognized gene name";
    }

    if (symbol.has_allele()) {
        const CatalogNode* allele = catalog.genes.walk(symbol.gene, symbol.fields);
        if (!allele) return "nonexistent allele for recognized gene";
        if (enforce_functional && rules.tracks_functionality && !allele->has_functional_leaf()) {
            return "nonfunctional allele";
        }
        return "";
    }

    if (enforce_functional && rules.tracks_functionality && !gene_node->has_functional_leaf()) {
        return "gene has no functional alleles";
    }
    return "";
}

// Designations are verified against the catalog up to the protein level, or
// in full for G / P groups; fields past the protein level only need to look
// like designation fields.
static std::string reason_invalid_hla(const FamilyRules& rules,
                                      const FamilyCatalog& catalog,
                                      const ParsedSymbol& symbol) {
    if (rules.literal_genes.count(symbol.gene) && !symbol.has_allele()) return "";

    if (!catalog.genes.contains(symbol.gene)) return "unrecognized gene name";

    const bool group = ends_with_group_tag(symbol.fields);
    const size_t verified = group ? symbol.fields.size()
                                  : std::min<size_t>(2, symbol.fields.size());
    std::vector<std::string> prefix(symbol.fields.begin(), symbol.fields.begin() + verified);
    if (!catalog.genes.walk(symbol.gene, prefix)) {
        return "nonexistent allele for recognized gene";
    }

    if (!group && symbol.fields.size() > 2) {
        if (symbol.fields.size() - 2 > 2) return "too many allele designators";
        for (size_t i = 2; i < symbol.fields.size(); ++i) {
            if (!is_all_digits(symbol.fields[i])) return "non-numerical allele designators";
            if (symbol.fields[i].size() < 2) return "non-2-digit allele designators";
        }
    }
    return "";
}

std::string reason_invalid(const FamilyRules& rules,
                           const FamilyCatalog& catalog,
                           const ParsedSymbol& symbol,
                           bool enforce_functional,
                           bool allow_subgroup) {
    switch (rules.grammar) {
        case SymbolGrammar::HLA:
            return reason_invalid_hla(rules, catalog, symbol);
        case SymbolGrammar::MOUSE_MH:
            return catalog.genes.contains(symbol.gene) ? "" : "unrecognized gene name";
        case SymbolGrammar::RECEPTOR:
        case SymbolGrammar::IG:
            break;
    }
    return reason_invalid_receptor(rules, catalog, symbol, enforce_functional, allow_subgroup);
}

bool CascadeEnv::accepts(const ParsedSymbol& symbol) const {
    if (rules.grammar == SymbolGrammar::HLA) {
        return reason_invalid(rules, catalog, symbol, false, allow_subgroup).empty();
    }
    if (is_known_gene(rules, catalog, symbol.gene)) return true;
    return allow_subgroup && is_subgroup(rules, catalog, symbol.gene);
}

// ============================================================================
// Precision compiler
// ============================================================================

std::string compile_symbol(const FamilyRules& rules,
                           const ParsedSymbol& symbol,
                           Precision precision) {
    switch (precision) {
        case Precision::ALLELE:
            return join_symbol(symbol.gene, symbol.fields, ':');

        case Precision::PROTEIN:
            if (rules.grammar == SymbolGrammar::HLA && symbol.has_allele()) {
                std::vector<std::string> protein(
                    symbol.fields.begin(),
                    symbol.fields.begin() + std::min<size_t>(2, symbol.fields.size()));
                return join_symbol(symbol.gene, protein, ':');
            }
            return symbol.gene;

        case Precision::SUBGROUP:
            if (rules.has_subgroups) {
                size_t dash = symbol.gene.find('-');
                if (dash != std::string::npos) return symbol.gene.substr(0, dash);
            }
            return symbol.gene;

        case Precision::GENE:
            break;
    }
    return symbol.gene;
}

} // namespace immunorm
