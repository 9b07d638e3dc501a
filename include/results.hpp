/**
 * Result Model
 *
 * Read-only outcomes of symbol and junction standardization. A result is a
 * success exactly when it carries no error reason. Precision accessors
 * return a value only on success and only if that precision was reached;
 * attempted_fix() returns the furthest the resolver got, only on failure.
 */

#ifndef IMMUNORM_RESULTS_HPP
#define IMMUNORM_RESULTS_HPP

#include "immunorm.hpp"
#include <string>
#include <vector>
#include <optional>

namespace immunorm {

class StandardizationResult {
public:
    /**
     * @param error empty for a successful standardization
     * @param gene resolved gene name (absent if only a subgroup was resolved)
     * @param fields allele designation fields
     * @param subgroup subgroup name for families that have subgroups
     * @param has_protein_level whether the first two fields name a protein (HLA)
     */
    StandardizationResult(std::string original_input,
                          std::string error,
                          std::optional<std::string> gene = std::nullopt,
                          std::vector<std::string> fields = {},
                          std::optional<std::string> subgroup = std::nullopt,
                          bool has_protein_level = false);

    const std::string& original_input() const { return original_input_; }
    const std::optional<std::string>& error() const { return error_; }

    bool success() const { return !error_.has_value(); }
    bool failed() const { return error_.has_value(); }

    std::optional<std::string> attempted_fix() const;
    std::optional<std::string> highest_precision() const;

    std::optional<std::string> allele() const;
    std::optional<std::string> protein() const;
    std::optional<std::string> gene() const;
    std::optional<std::string> subgroup() const;

    /**
     * Accessor selected by precision
     */
    std::optional<std::string> at(Precision precision) const;

private:
    std::string original_input_;
    std::optional<std::string> error_;
    std::optional<std::string> gene_;
    std::vector<std::string> fields_;
    std::optional<std::string> subgroup_;
    bool has_protein_level_;
    std::optional<std::string> highest_;
};

class JunctionResult {
public:
    JunctionResult(std::string original_input,
                   std::string error,
                   std::optional<std::string> corrected_junction = std::nullopt);

    const std::string& original_input() const { return original_input_; }
    const std::optional<std::string>& error() const { return error_; }

    bool success() const { return !error_.has_value(); }
    bool failed() const { return error_.has_value(); }

    std::optional<std::string> attempted_fix() const;

    /**
     * The corrected junction, conserved C and F/W included
     */
    std::optional<std::string> junction() const;

    /**
     * The junction without its two conserved boundary residues
     */
    std::optional<std::string> cdr3() const;

private:
    std::string original_input_;
    std::optional<std::string> error_;
    std::optional<std::string> corrected_;
};

} // namespace immunorm

#endif // IMMUNORM_RESULTS_HPP
