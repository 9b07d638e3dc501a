/**
 * Symbol Parser
 *
 * Splits a cleaned gene symbol into a gene name and its allele designation
 * fields, using the grammar of the gene family:
 *
 *   receptor (TR/IG):  TRAV14/DV4*01        -> "TRAV14/DV4", ["01"]
 *   HLA:               HLA-A*02:01:01:01N   -> "HLA-A", ["02","01","01","01"]
 *   mouse MH:          MH2-EB1*02           -> "MH2-EB1", ["02"]
 *
 * Parsing never fails: input the grammar does not match becomes the gene
 * name with no allele designation.
 */

#ifndef IMMUNORM_SYMBOL_PARSER_HPP
#define IMMUNORM_SYMBOL_PARSER_HPP

#include <string>
#include <vector>

namespace immunorm {

/**
 * Candidate gene name plus ordered allele designation fields
 */
struct ParsedSymbol {
    std::string gene;
    std::vector<std::string> fields;

    bool has_allele() const { return !fields.empty(); }

    bool operator==(const ParsedSymbol& other) const {
        return gene == other.gene && fields == other.fields;
    }
    bool operator!=(const ParsedSymbol& other) const { return !(*this == other); }
};

/**
 * Remove all whitespace, uppercase, and strip markup pollutants
 * (&nbsp; is dropped; &ndash; and unicode dashes become '-').
 */
std::string clean_symbol(const std::string& raw);

/**
 * Zero-pad a purely numeric field to `width` digits after dropping
 * surplus leading zeros ("1" -> "01", "001" -> "01", "123" -> "123").
 * Non-numeric fields are returned unchanged.
 */
std::string pad_numeric_field(const std::string& field, size_t width = 2);

bool is_all_digits(const std::string& s);

/**
 * TR / mouse MH grammar: ^([A-Z0-9-.()/]+)(\*(\d+))?
 */
ParsedSymbol parse_receptor_symbol(const std::string& cleaned);

/**
 * IG grammar. Identical to the receptor grammar except that the lowercase
 * a/b suffix of OR15 orphons (IGHD1/OR15-1a) is kept lowercase.
 */
ParsedSymbol parse_ig_symbol(const std::string& cleaned);

/**
 * HLA grammar. Periods between digits are read as colons, trailing
 * expression qualifiers (L S C A Q N) are dropped, and G / P group
 * suffixes are kept on the last field. "B2M" parses as a bare gene.
 */
ParsedSymbol parse_hla_symbol(const std::string& cleaned);

/**
 * Render gene*field1<delim>field2..., or the bare gene when no fields
 */
std::string join_symbol(const std::string& gene,
                        const std::vector<std::string>& fields,
                        char delim);

} // namespace immunorm

#endif // IMMUNORM_SYMBOL_PARSER_HPP
