/**
 * File Format Parsers
 *
 * Utilities for reading the delimited-text files immunorm consumes:
 * - LineReader: line iterator over plain, gzip or bgzip files
 * - split_line / trim helpers
 * - key=value option strings and config files
 */

#ifndef IMMUNORM_FILE_PARSERS_HPP
#define IMMUNORM_FILE_PARSERS_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>

namespace immunorm {

/**
 * Split a line on a single-character delimiter. Empty fields are kept.
 */
std::vector<std::string> split_line(const std::string& line, char delim);

/**
 * Strip leading and trailing whitespace
 */
std::string trim(const std::string& s);

bool file_exists(const std::string& path);

/**
 * Join a directory and a file name with a single '/'
 */
std::string join_path(const std::string& dir, const std::string& name);

// ============================================================================
// Line Reader
// ============================================================================

/**
 * Sequential line reader for plain or compressed text files.
 *
 * Reads through htslib when built with HAVE_HTSLIB (bgzip and remote URLs),
 * otherwise through zlib, which reads gzip and uncompressed files alike.
 * Trailing '\n' and '\r' are removed from each line.
 */
class LineReader {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit LineReader(const std::string& path);
    ~LineReader();

    // Prevent copying
    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * Read the next line into `line`
     * @return false at end of file
     */
    bool next(std::string& line);

    const std::string& path() const { return path_; }
    size_t line_number() const { return line_number_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string path_;
    size_t line_number_ = 0;
};

// ============================================================================
// Options
// ============================================================================

/**
 * Parse an option string (format: key1=value1;key2=value2).
 * Whitespace around keys and values is ignored.
 * @throws std::invalid_argument for a pair without '='
 */
std::map<std::string, std::string> parse_option_string(const std::string& options);

/**
 * Load a config file of key=value lines. Blank lines and lines starting
 * with '#' are skipped.
 * @throws std::runtime_error if the file cannot be read
 * @throws std::invalid_argument for a line without '='
 */
std::map<std::string, std::string> load_config_file(const std::string& path);

/**
 * Parse a boolean option value: true/false, yes/no, 1/0 (case-insensitive)
 * @throws std::invalid_argument otherwise
 */
bool parse_bool_option(const std::string& key, const std::string& value);

double parse_double_option(const std::string& key, const std::string& value);

int parse_int_option(const std::string& key, const std::string& value);

} // namespace immunorm

#endif // IMMUNORM_FILE_PARSERS_HPP
