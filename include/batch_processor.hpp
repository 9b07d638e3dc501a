/**
 * Batch Processor
 *
 * Standardizes one column of a tab-separated table (plain or gzip, with a
 * header line) and writes the table back out with two columns appended:
 * <column>_standardized and <column>_error.
 */

#ifndef IMMUNORM_BATCH_PROCESSOR_HPP
#define IMMUNORM_BATCH_PROCESSOR_HPP

#include "immunorm.hpp"
#include "reference_catalog.hpp"
#include "output_writer.hpp"
#include "symbol_standardizer.hpp"
#include "junction_aligner.hpp"
#include "symbol_parser.hpp"
#include <string>
#include <functional>

namespace immunorm {

struct BatchOptions {
    std::string input_path;
    std::string column;                     // empty: first column
    std::string output_path = "-";
    OutputFormat format = OutputFormat::TSV;
    Precision precision = Precision::ALLELE;    // symbol rendering, capped at what was resolved
};

/**
 * Standardized value and error of one cell
 */
struct BatchCell {
    std::string standardized;
    std::string error;
    bool success = false;
};

using CellStandardizer = std::function<BatchCell(const std::string& value)>;

/**
 * Cell standardizer for gene / allele symbols
 */
CellStandardizer make_symbol_standardizer(const ReferenceContext& context,
                                          GeneFamily family,
                                          const std::string& species,
                                          const SymbolOptions& options,
                                          Precision precision = Precision::ALLELE);

/**
 * Cell standardizer for junction sequences
 */
CellStandardizer make_junction_standardizer(const ReferenceContext& context,
                                            const JunctionOptions& options);

/**
 * Run the batch.
 * @throws std::runtime_error if the input cannot be read or has no header
 * @throws std::invalid_argument if the column is not in the header
 */
RunStats process_batch(const BatchOptions& options, const CellStandardizer& standardize);

} // namespace immunorm

#endif // IMMUNORM_BATCH_PROCESSOR_HPP
