/**
 * immunorm - Main Entry Point
 *
 * Command line front end for symbol standardization, junction
 * standardization, catalog queries and batch processing of TSV tables.
 */

#include "immunorm.hpp"
#include "reference_catalog.hpp"
#include "symbol_standardizer.hpp"
#include "junction_aligner.hpp"
#include "catalog_query.hpp"
#include "batch_processor.hpp"
#include "output_writer.hpp"
#include "file_parsers.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <map>

void print_usage(const char* program_name) {
    std::cout << "immunorm - Immune Receptor Nomenclature Normalizer\n"
              << "==================================================\n\n"
              << "Usage: " << program_name << " <command> [OPTIONS] [INPUT...]\n\n"
              << "Commands:\n"
              << "  symbol SYMBOL...        Standardize TR / IG / MH gene or allele symbols\n"
              << "  junction SEQUENCE...    Standardize CDR3 junction amino acid sequences\n"
              << "  query                   List catalog genes / alleles / subgroups\n"
              << "  aa SYMBOL               Print the amino acid regions of an allele\n"
              << "  batch                   Standardize one column of a TSV table\n\n"
              << "Symbol Options:\n"
              << "  --family TR|IG|MH       Gene family (required for symbol, query, aa)\n"
              << "  --species NAME          Species (default: homosapiens; 'any' for TR/IG)\n"
              << "  --enforce-functional    Reject non-functional genes and alleles\n"
              << "  --allow-subgroup        Accept symbols resolving only to a subgroup\n"
              << "  --precision P           subgroup, gene, protein or allele (default: allele)\n\n"
              << "Junction Options:\n"
              << "  --locus L               TRA TRB TRG TRD TR IGH IGK IGL IG\n"
              << "                          (omit for conserved-motif checks only)\n"
              << "  --j SYMBOL              Known J gene / allele\n"
              << "  --v SYMBOL              Known V gene / allele\n"
              << "  --options K=V;K=V       Alignment options, e.g.\n"
              << "                          allow_c_correction=true;max_j_mismatches=2\n\n"
              << "Query Options:\n"
              << "  --functionality F       any, F, NF, P or ORF (default: any)\n"
              << "  --contains REGEX        Keep results matching the pattern\n\n"
              << "Batch Options:\n"
              << "  -i, --input FILE        Input TSV (plain or gzip) with a header line\n"
              << "  --column NAME           Column to standardize (default: first)\n"
              << "  -o, --output FILE       Output file (default: stdout; .gz compresses)\n"
              << "  --format tsv|json       Output format (default: tsv)\n\n"
              << "Other Options:\n"
              << "  --data-dir DIR          Reference catalog directory\n"
              << "                          (default: $IMMUNORM_DATA_DIR or the install location)\n"
              << "  --config FILE           key=value option file for the command\n"
              << "  --stats                 Print run statistics to stderr\n"
              << "  --debug                 Enable debug logging\n"
              << "  --quiet                 Log errors only\n"
              << "  -h, --help              Show this help message\n\n"
              << "Examples:\n"
              << "  " << program_name << " symbol --family TR TCRAV32S1 aj1\n"
              << "  " << program_name << " symbol --family MH HLA-B*5701\n"
              << "  " << program_name << " junction --locus TRB ASSLGQGSYEQY\n"
              << "  " << program_name << " query --family TR --precision gene --functionality F\n"
              << "  " << program_name << " batch --family TR -i cells.tsv --column v_call -o out.tsv\n"
              << std::endl;
}

void print_regions(const immunorm::RegionMap& regions) {
    for (const auto& [region, sequence] : regions) {
        std::cout << region << "\t" << sequence << "\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::string family_name;
    std::string species = "homosapiens";
    std::string precision_name = "allele";
    std::string functionality_name = "any";
    std::string contains;
    std::string locus;
    std::string j_symbol;
    std::string v_symbol;
    std::string option_string;
    std::string data_dir;
    std::string config_path;
    std::string input_path;
    std::string column;
    std::string output_path = "-";
    std::string format_name = "tsv";
    bool enforce_functional = false;
    bool allow_subgroup = false;
    bool show_stats = false;
    bool debug = false;
    bool quiet = false;
    std::vector<std::string> inputs;

    // Parse command line arguments
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--family" && i + 1 < argc) {
            family_name = argv[++i];
        } else if (arg == "--species" && i + 1 < argc) {
            species = argv[++i];
        } else if (arg == "--precision" && i + 1 < argc) {
            precision_name = argv[++i];
        } else if (arg == "--functionality" && i + 1 < argc) {
            functionality_name = argv[++i];
        } else if (arg == "--contains" && i + 1 < argc) {
            contains = argv[++i];
        } else if (arg == "--locus" && i + 1 < argc) {
            locus = argv[++i];
        } else if (arg == "--j" && i + 1 < argc) {
            j_symbol = argv[++i];
        } else if (arg == "--v" && i + 1 < argc) {
            v_symbol = argv[++i];
        } else if (arg == "--options" && i + 1 < argc) {
            option_string = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input_path = argv[++i];
        } else if (arg == "--column" && i + 1 < argc) {
            column = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format_name = argv[++i];
        } else if (arg == "--enforce-functional") {
            enforce_functional = true;
        } else if (arg == "--allow-subgroup") {
            allow_subgroup = true;
        } else if (arg == "--stats") {
            show_stats = true;
        } else if (arg == "--debug") {
            debug = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown or incomplete option: " << arg << "\n" << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            inputs.push_back(arg);
        }
    }

    // Set log level
    if (debug) {
        immunorm::set_log_level(immunorm::LogLevel::DEBUG);
    } else if (quiet) {
        immunorm::set_log_level(immunorm::LogLevel::ERROR);
    }

    try {
        std::map<std::string, std::string> config;
        if (!config_path.empty()) {
            config = immunorm::load_config_file(config_path);
        }
        for (const auto& [key, value] : immunorm::parse_option_string(option_string)) {
            config[key] = value;
        }

        const immunorm::ReferenceContext context = immunorm::ReferenceContext::load(
            data_dir.empty() ? immunorm::default_data_dir() : data_dir);

        const immunorm::OutputFormat format = immunorm::parse_output_format(format_name);
        const immunorm::Precision precision = immunorm::parse_precision(precision_name);

        if (command == "symbol" || command == "query" || command == "aa" ||
            (command == "batch" && locus.empty())) {
            if (family_name.empty()) {
                std::cerr << "Error: --family is required for " << command << ".\n" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        if (command == "symbol") {
            const immunorm::GeneFamily family = immunorm::parse_family(family_name);
            immunorm::SymbolOptions options = immunorm::SymbolOptions::from_config(config);
            if (enforce_functional) options.enforce_functional = true;
            if (allow_subgroup) options.allow_subgroup = true;

            auto writer = immunorm::create_output_writer("-", format);
            writer->write_header({"input", "standardized", "error"});
            for (const auto& symbol : inputs) {
                auto result = immunorm::standardize_symbol(context, symbol, family, species, options);
                if (result.success()) {
                    writer->write_row({symbol,
                                       result.at(precision).value_or(result.gene().value_or(
                                           result.highest_precision().value_or(""))),
                                       ""}, true);
                } else {
                    writer->write_row({symbol, result.attempted_fix().value_or(""),
                                       *result.error()}, false);
                }
            }
            writer->write_footer();
            if (show_stats) std::cerr << writer->get_stats().to_string();

        } else if (command == "junction") {
            immunorm::JunctionOptions options = immunorm::JunctionOptions::from_config(config);
            if (!locus.empty()) options.locus = locus;
            if (!j_symbol.empty()) options.j_symbol = j_symbol;
            if (!v_symbol.empty()) options.v_symbol = v_symbol;
            if (species != "homosapiens") options.species = species;

            auto writer = immunorm::create_output_writer("-", format);
            writer->write_header({"input", "junction", "cdr3", "error"});
            for (const auto& sequence : inputs) {
                auto result = immunorm::standardize_junction(context, sequence, options);
                if (result.success()) {
                    writer->write_row({sequence, result.junction().value_or(""),
                                       result.cdr3().value_or(""), ""}, true);
                } else {
                    writer->write_row({sequence, result.attempted_fix().value_or(""), "",
                                       *result.error()}, false);
                }
            }
            writer->write_footer();
            if (show_stats) std::cerr << writer->get_stats().to_string();

        } else if (command == "query") {
            auto results = immunorm::query(context, species, immunorm::parse_family(family_name),
                                           precision,
                                           immunorm::parse_functionality_filter(functionality_name),
                                           contains);
            for (const auto& result : results) {
                std::cout << result << "\n";
            }

        } else if (command == "aa") {
            if (inputs.size() != 1) {
                std::cerr << "Error: aa takes exactly one symbol.\n" << std::endl;
                return 1;
            }
            print_regions(immunorm::get_amino_acid_sequence(
                context, species, immunorm::parse_family(family_name), inputs[0]));

        } else if (command == "batch") {
            if (input_path.empty()) {
                std::cerr << "Error: --input is required for batch.\n" << std::endl;
                print_usage(argv[0]);
                return 1;
            }

            immunorm::BatchOptions batch;
            batch.input_path = input_path;
            batch.column = column;
            batch.output_path = output_path;
            batch.format = format;
            batch.precision = precision;

            immunorm::CellStandardizer standardize;
            if (!locus.empty()) {
                immunorm::JunctionOptions options = immunorm::JunctionOptions::from_config(config);
                options.locus = locus;
                if (!j_symbol.empty()) options.j_symbol = j_symbol;
                if (!v_symbol.empty()) options.v_symbol = v_symbol;
                if (species != "homosapiens") options.species = species;
                options.log_failures = false;
                standardize = immunorm::make_junction_standardizer(context, options);
            } else {
                immunorm::SymbolOptions options = immunorm::SymbolOptions::from_config(config);
                if (enforce_functional) options.enforce_functional = true;
                if (allow_subgroup) options.allow_subgroup = true;
                options.log_failures = false;
                standardize = immunorm::make_symbol_standardizer(
                    context, immunorm::parse_family(family_name), species, options, precision);
            }

            auto stats = immunorm::process_batch(batch, standardize);
            if (show_stats) std::cerr << stats.to_string();

        } else {
            std::cerr << "Error: Unknown command: " << command << "\n" << std::endl;
            print_usage(argv[0]);
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
