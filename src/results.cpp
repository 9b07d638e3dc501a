/**
 * Result Model Implementation
 */

#include "results.hpp"
#include "symbol_parser.hpp"
#include <algorithm>
#include <utility>

namespace immunorm {

// ============================================================================
// StandardizationResult
// ============================================================================

StandardizationResult::StandardizationResult(std::string original_input,
                                             std::string error,
                                             std::optional<std::string> gene,
                                             std::vector<std::string> fields,
                                             std::optional<std::string> subgroup,
                                             bool has_protein_level)
    : original_input_(std::move(original_input)),
      gene_(std::move(gene)),
      fields_(std::move(fields)),
      subgroup_(std::move(subgroup)),
      has_protein_level_(has_protein_level) {
    if (!error.empty()) error_ = std::move(error);

    if (gene_) {
        highest_ = join_symbol(*gene_, fields_, ':');
    } else if (subgroup_) {
        highest_ = subgroup_;
    }
}

std::optional<std::string> StandardizationResult::attempted_fix() const {
    if (failed()) return highest_;
    return std::nullopt;
}

std::optional<std::string> StandardizationResult::highest_precision() const {
    if (success()) return highest_;
    return std::nullopt;
}

std::optional<std::string> StandardizationResult::allele() const {
    if (success() && gene_ && !fields_.empty()) {
        return join_symbol(*gene_, fields_, ':');
    }
    return std::nullopt;
}

std::optional<std::string> StandardizationResult::protein() const {
    if (success() && has_protein_level_ && gene_ && !fields_.empty()) {
        std::vector<std::string> protein_fields(
            fields_.begin(), fields_.begin() + std::min<size_t>(2, fields_.size()));
        return join_symbol(*gene_, protein_fields, ':');
    }
    return std::nullopt;
}

std::optional<std::string> StandardizationResult::gene() const {
    if (success()) return gene_;
    return std::nullopt;
}

std::optional<std::string> StandardizationResult::subgroup() const {
    if (success()) return subgroup_;
    return std::nullopt;
}

std::optional<std::string> StandardizationResult::at(Precision precision) const {
    switch (precision) {
        case Precision::SUBGROUP: return subgroup();
        case Precision::GENE: return gene();
        case Precision::PROTEIN: return protein();
        case Precision::ALLELE: return allele();
    }
    return std::nullopt;
}

// ============================================================================
// JunctionResult
// ============================================================================

JunctionResult::JunctionResult(std::string original_input,
                               std::string error,
                               std::optional<std::string> corrected_junction)
    : original_input_(std::move(original_input)),
      corrected_(std::move(corrected_junction)) {
    if (!error.empty()) error_ = std::move(error);
}

std::optional<std::string> JunctionResult::attempted_fix() const {
    if (failed()) return corrected_;
    return std::nullopt;
}

std::optional<std::string> JunctionResult::junction() const {
    if (success()) return corrected_;
    return std::nullopt;
}

std::optional<std::string> JunctionResult::cdr3() const {
    if (success() && corrected_ && corrected_->size() > 2) {
        return corrected_->substr(1, corrected_->size() - 2);
    }
    return std::nullopt;
}

} // namespace immunorm
