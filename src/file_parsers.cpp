/**
 * File Format Parsers Implementation
 */

#include "file_parsers.hpp"
#include "immunorm.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <sys/stat.h>

#ifdef HAVE_HTSLIB
#include <htslib/hts.h>
#include <htslib/kstring.h>
#endif

#include <zlib.h>

namespace immunorm {

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<std::string> split_line(const std::string& line, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos = line.find(delim);
    while (pos != std::string::npos) {
        result.emplace_back(line, start, pos - start);
        start = pos + 1;
        pos = line.find(delim, start);
    }
    result.emplace_back(line, start);
    return result;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

// ============================================================================
// LineReader Implementation
// ============================================================================

#ifdef HAVE_HTSLIB

struct LineReader::Impl {
    htsFile* fp = nullptr;
    kstring_t str = {0, 0, nullptr};

    ~Impl() {
        free(str.s);
        if (fp) hts_close(fp);
    }
};

LineReader::LineReader(const std::string& path)
    : pimpl_(std::make_unique<Impl>()), path_(path) {
    pimpl_->fp = hts_open(path.c_str(), "r");
    if (!pimpl_->fp) {
        throw std::runtime_error("Cannot open file: " + path);
    }
}

bool LineReader::next(std::string& line) {
    int ret = hts_getline(pimpl_->fp, KS_SEP_LINE, &pimpl_->str);
    if (ret < -1) {
        throw std::runtime_error("Read error in " + path_ + " after line " +
                                 std::to_string(line_number_));
    }
    if (ret < 0) return false;

    line.assign(pimpl_->str.s, pimpl_->str.l);
    while (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    ++line_number_;
    return true;
}

#else

struct LineReader::Impl {
    gzFile gz = nullptr;
    char buffer[65536];

    ~Impl() {
        if (gz) gzclose(gz);
    }
};

LineReader::LineReader(const std::string& path)
    : pimpl_(std::make_unique<Impl>()), path_(path) {
    pimpl_->gz = gzopen(path.c_str(), "rb");
    if (!pimpl_->gz) {
        throw std::runtime_error("Cannot open file: " + path);
    }
}

bool LineReader::next(std::string& line) {
    line.clear();
    bool got_data = false;

    // Lines longer than the buffer arrive in several gzgets() chunks
    while (gzgets(pimpl_->gz, pimpl_->buffer, sizeof(pimpl_->buffer)) != nullptr) {
        got_data = true;
        line += pimpl_->buffer;
        if (!line.empty() && line.back() == '\n') break;
    }

    if (!got_data) {
        int errnum = Z_OK;
        gzerror(pimpl_->gz, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error("Read error in " + path_ + " after line " +
                                     std::to_string(line_number_));
        }
        return false;
    }

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    ++line_number_;
    return true;
}

#endif  // HAVE_HTSLIB

LineReader::~LineReader() = default;

// ============================================================================
// Options
// ============================================================================

static void add_option_pair(std::map<std::string, std::string>& options,
                            const std::string& pair,
                            const std::string& context) {
    size_t eq = pair.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("Expected key=value in " + context + ": " + pair);
    }
    std::string key = trim(pair.substr(0, eq));
    std::string value = trim(pair.substr(eq + 1));
    if (key.empty()) {
        throw std::invalid_argument("Empty option name in " + context + ": " + pair);
    }
    options[key] = value;
}

std::map<std::string, std::string> parse_option_string(const std::string& options) {
    std::map<std::string, std::string> result;
    for (const auto& pair : split_line(options, ';')) {
        if (trim(pair).empty()) continue;
        add_option_pair(result, pair, "option string");
    }
    return result;
}

std::map<std::string, std::string> load_config_file(const std::string& path) {
    std::map<std::string, std::string> result;
    LineReader reader(path);
    std::string line;
    while (reader.next(line)) {
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;
        add_option_pair(result, stripped, path + ":" + std::to_string(reader.line_number()));
    }
    log(LogLevel::DEBUG, "Loaded " + std::to_string(result.size()) + " options from " + path);
    return result;
}

bool parse_bool_option(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    throw std::invalid_argument("Option " + key + " expects a boolean, got: " + value);
}

double parse_double_option(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Option " + key + " expects a number, got: " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Option " + key + " expects a number, got: " + value);
    }
    return parsed;
}

int parse_int_option(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Option " + key + " expects an integer, got: " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Option " + key + " expects an integer, got: " + value);
    }
    return parsed;
}

} // namespace immunorm
