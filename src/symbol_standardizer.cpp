/**
 * Symbol Standardizer Implementation
 */

#include "symbol_standardizer.hpp"
#include "family_rules.hpp"
#include "correction_steps.hpp"
#include "file_parsers.hpp"
#include <stdexcept>

namespace immunorm {

SymbolOptions SymbolOptions::from_config(const std::map<std::string, std::string>& config) {
    SymbolOptions options;
    for (const auto& [key, value] : config) {
        if (key == "enforce_functional") {
            options.enforce_functional = parse_bool_option(key, value);
        } else if (key == "allow_subgroup") {
            options.allow_subgroup = parse_bool_option(key, value);
        } else if (key == "log_failures") {
            options.log_failures = parse_bool_option(key, value);
        } else {
            throw std::invalid_argument("Unknown symbol option: " + key);
        }
    }
    return options;
}

namespace {

StandardizationResult build_result(const std::string& original,
                                   const std::string& reason,
                                   const FamilyRules& rules,
                                   const FamilyCatalog& catalog,
                                   const ParsedSymbol& resolved) {
    const bool protein_level = rules.grammar == SymbolGrammar::HLA;

    if (is_known_gene(rules, catalog, resolved.gene)) {
        std::optional<std::string> subgroup;
        if (rules.has_subgroups) {
            std::string root = compile_symbol(rules, resolved, Precision::SUBGROUP);
            if (catalog.subgroups.count(root)) subgroup = root;
        }
        return StandardizationResult(original, reason, resolved.gene, resolved.fields,
                                     subgroup, protein_level);
    }

    if (is_subgroup(rules, catalog, resolved.gene)) {
        return StandardizationResult(original, reason, std::nullopt, {}, resolved.gene,
                                     protein_level);
    }

    return StandardizationResult(original, reason, resolved.gene, resolved.fields,
                                 std::nullopt, protein_level);
}

StandardizationResult standardize_for_species(const ReferenceContext& context,
                                              const std::string& symbol,
                                              GeneFamily family,
                                              const std::string& species,
                                              const SymbolOptions& options) {
    const FamilyRules* rules = find_family_rules(species, family);
    const FamilyCatalog* catalog = context.find(species, family);
    if (!rules || !catalog) {
        return StandardizationResult(symbol, "unsupported species: " + species, symbol);
    }

    CascadeEnv env{*rules, *catalog, options.allow_subgroup, true};
    CascadeOutcome outcome = run_cascade(parse_symbol(*rules, symbol), env);

    std::string reason = reason_invalid(*rules, *catalog, outcome.symbol,
                                        options.enforce_functional, options.allow_subgroup);
    return build_result(symbol, reason, *rules, *catalog, outcome.symbol);
}

} // namespace

StandardizationResult standardize_symbol(const ReferenceContext& context,
                                         const std::string& symbol,
                                         GeneFamily family,
                                         const std::string& species,
                                         const SymbolOptions& options) {
    const std::string species_key = clean_species(species);

    StandardizationResult result = [&]() {
        if (species_key != "any" || family == GeneFamily::MH) {
            return standardize_for_species(context, symbol, family, species_key, options);
        }

        // First species that resolves wins; otherwise report the first attempt
        std::optional<StandardizationResult> first_attempt;
        for (const auto& candidate : supported_species()) {
            StandardizationResult attempt =
                standardize_for_species(context, symbol, family, candidate, options);
            if (attempt.success()) return attempt;
            if (!first_attempt) first_attempt = attempt;
        }
        return *first_attempt;
    }();

    if (result.failed() && options.log_failures) {
        log(LogLevel::WARNING, "Failed to standardize " + symbol + " for species " + species +
                               " and gene family " + family_to_string(family) + ": " +
                               *result.error() + ". Attempted fix: " +
                               result.attempted_fix().value_or("") + ".");
    }
    return result;
}

StandardizationResult standardize_symbol(const std::string& symbol,
                                         GeneFamily family,
                                         const std::string& species,
                                         const SymbolOptions& options) {
    return standardize_symbol(default_context(), symbol, family, species, options);
}

} // namespace immunorm
