/**
 * Output Writer - Multiple Output Format Support
 *
 * Writes standardization records (one row per input) as TSV (default) or
 * JSON, to stdout or to a file. Paths ending in .gz are gzip-compressed.
 */

#ifndef IMMUNORM_OUTPUT_WRITER_HPP
#define IMMUNORM_OUTPUT_WRITER_HPP

#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <zlib.h>

namespace immunorm {

/**
 * Output format types
 */
enum class OutputFormat {
    TSV,    // Tab-separated values (default)
    JSON    // Array of objects keyed by column name
};

/**
 * Parse output format from string
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "json") return OutputFormat::JSON;
    if (lower == "tsv" || lower.empty()) return OutputFormat::TSV;
    throw std::invalid_argument("Unknown output format: " + format);
}

/**
 * Statistics collector for a standardization run
 */
struct RunStats {
    int total = 0;
    int standardized = 0;
    int failed = 0;

    void add(bool success) {
        total++;
        if (success) {
            standardized++;
        } else {
            failed++;
        }
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "=== Standardization Statistics ===\n";
        oss << "Total inputs: " << total << "\n";
        oss << "Standardized: " << standardized << "\n";
        oss << "Failed: " << failed << "\n";
        return oss.str();
    }
};

// Helper to check if path ends with .gz
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

inline std::string escape_json(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }
    return result;
}

/**
 * Abstract base class for output writers. Owns the destination: stdout
 * for an empty path, "-" or "STDOUT", gzip for .gz paths, a plain file
 * otherwise.
 */
class OutputWriter {
public:
    explicit OutputWriter(const std::string& output_path)
        : output_path_(output_path), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) return;

        if (ends_with_gz(output_path_)) {
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        }
    }

    virtual ~OutputWriter() {
        close();
    }

    OutputWriter(const OutputWriter&) = delete;
    OutputWriter& operator=(const OutputWriter&) = delete;

    virtual void write_header(const std::vector<std::string>& columns) = 0;

    /**
     * @param success counted in the run statistics
     */
    virtual void write_row(const std::vector<std::string>& values, bool success) = 0;

    virtual void write_footer() = 0;

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
        }
    }

    const RunStats& get_stats() const { return stats_; }

    void set_skip_header(bool v) { skip_header_ = v; }

protected:
    RunStats stats_;
    bool skip_header_ = false;

    void write_string(const std::string& s) {
        if (use_stdout_) {
            std::cout << s;
        } else if (gz_file_) {
            if (gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size())) <= 0 &&
                !s.empty()) {
                throw std::runtime_error("Failed to write to " + output_path_);
            }
        } else {
            output_ << s;
        }
    }

private:
    std::string output_path_;
    std::ofstream output_;
    gzFile gz_file_;
    bool use_stdout_;
};

/**
 * TSV output writer (default format)
 */
class TSVWriter : public OutputWriter {
public:
    explicit TSVWriter(const std::string& output_path)
        : OutputWriter(output_path) {}

    void write_header(const std::vector<std::string>& columns) override {
        if (skip_header_) return;
        write_string(join(columns) + "\n");
    }

    void write_row(const std::vector<std::string>& values, bool success) override {
        stats_.add(success);
        write_string(join(values) + "\n");
    }

    void write_footer() override {
        // TSV has no footer
    }

private:
    static std::string join(const std::vector<std::string>& fields) {
        std::string line;
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) line += '\t';
            line += fields[i];
        }
        return line;
    }
};

/**
 * JSON output writer: one object per row, keyed by the header columns
 */
class JSONWriter : public OutputWriter {
public:
    explicit JSONWriter(const std::string& output_path)
        : OutputWriter(output_path) {}

    void write_header(const std::vector<std::string>& columns) override {
        columns_ = columns;
        write_string("[");
    }

    void write_row(const std::vector<std::string>& values, bool success) override {
        stats_.add(success);

        std::ostringstream json;
        json << (first_row_ ? "\n" : ",\n") << "  {";
        for (size_t i = 0; i < values.size(); ++i) {
            std::string key = i < columns_.size() ? columns_[i] : "column_" + std::to_string(i + 1);
            if (i > 0) json << ", ";
            json << "\"" << escape_json(key) << "\": \"" << escape_json(values[i]) << "\"";
        }
        json << "}";
        first_row_ = false;

        write_string(json.str());
    }

    void write_footer() override {
        write_string(first_row_ ? "]\n" : "\n]\n");
    }

private:
    std::vector<std::string> columns_;
    bool first_row_ = true;
};

/**
 * Factory function to create appropriate writer
 */
inline std::unique_ptr<OutputWriter> create_output_writer(
    const std::string& output_path,
    OutputFormat format) {

    if (format == OutputFormat::JSON) {
        return std::make_unique<JSONWriter>(output_path);
    }
    return std::make_unique<TSVWriter>(output_path);
}

} // namespace immunorm

#endif // IMMUNORM_OUTPUT_WRITER_HPP
