/**
 * Batch Processor Implementation
 */

#include "batch_processor.hpp"
#include "file_parsers.hpp"
#include <stdexcept>

namespace immunorm {

CellStandardizer make_symbol_standardizer(const ReferenceContext& context,
                                          GeneFamily family,
                                          const std::string& species,
                                          const SymbolOptions& options,
                                          Precision precision) {
    return [&context, family, species, options, precision](const std::string& value) {
        StandardizationResult result = standardize_symbol(context, value, family, species, options);

        BatchCell cell;
        cell.success = result.success();
        if (result.success()) {
            cell.standardized = result.at(precision).value_or(
                result.gene().value_or(result.highest_precision().value_or("")));
        } else {
            cell.error = *result.error();
        }
        return cell;
    };
}

CellStandardizer make_junction_standardizer(const ReferenceContext& context,
                                            const JunctionOptions& options) {
    return [&context, options](const std::string& value) {
        JunctionResult result = standardize_junction(context, value, options);

        BatchCell cell;
        cell.success = result.success();
        if (result.success()) {
            cell.standardized = result.junction().value_or("");
        } else {
            cell.error = *result.error();
        }
        return cell;
    };
}

RunStats process_batch(const BatchOptions& options, const CellStandardizer& standardize) {
    LineReader reader(options.input_path);

    std::string line;
    if (!reader.next(line)) {
        throw std::runtime_error("Input table has no header: " + options.input_path);
    }
    std::vector<std::string> header = split_line(line, '\t');

    size_t column = 0;
    if (!options.column.empty()) {
        column = header.size();
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == options.column) {
                column = i;
                break;
            }
        }
        if (column == header.size()) {
            throw std::invalid_argument("Column '" + options.column + "' not found in " +
                                        options.input_path);
        }
    }

    const std::string name = header[column];
    std::vector<std::string> out_header = header;
    out_header.push_back(name + "_standardized");
    out_header.push_back(name + "_error");

    auto writer = create_output_writer(options.output_path, options.format);
    writer->write_header(out_header);

    size_t line_num = 1;
    while (reader.next(line)) {
        line_num++;
        if (trim(line).empty()) continue;

        std::vector<std::string> fields = split_line(line, '\t');
        if (fields.size() > header.size()) {
            log(LogLevel::WARNING, "Line " + std::to_string(line_num) + " of " +
                                   options.input_path + " has more fields than the header, " +
                                   "dropping the extra fields");
        }
        fields.resize(header.size());

        BatchCell cell = standardize(fields[column]);
        fields.push_back(cell.standardized);
        fields.push_back(cell.error);
        writer->write_row(fields, cell.success);
    }

    writer->write_footer();
    writer->close();

    const RunStats& stats = writer->get_stats();
    log(LogLevel::INFO, "Processed " + std::to_string(stats.total) + " rows from " +
                        options.input_path + ": " + std::to_string(stats.standardized) +
                        " standardized, " + std::to_string(stats.failed) + " failed");
    return stats;
}

} // namespace immunorm
