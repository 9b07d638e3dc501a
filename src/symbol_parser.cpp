/**
 * Symbol Parser Implementation
 */

#include "symbol_parser.hpp"
#include "file_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace immunorm {

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string clean_symbol(const std::string& raw) {
    std::string result;
    result.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isspace(c)) continue;
        result += static_cast<char>(std::toupper(c));
    }

    replace_all(result, "\xC2\xA0", "");        // no-break space
    replace_all(result, "&NBSP;", "");
    replace_all(result, "&NDASH;", "-");
    replace_all(result, "\xE2\x80\x93", "-");   // en dash
    replace_all(result, "\xE2\x80\x94", "-");   // em dash
    replace_all(result, "\xE2\x88\x92", "-");   // minus sign
    return result;
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

std::string pad_numeric_field(const std::string& field, size_t width) {
    if (!is_all_digits(field)) return field;

    size_t first = field.find_first_not_of('0');
    std::string digits = first == std::string::npos ? "0" : field.substr(first);
    if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
    }
    return digits;
}

std::string join_symbol(const std::string& gene,
                        const std::vector<std::string>& fields,
                        char delim) {
    if (fields.empty()) return gene;
    std::string result = gene + "*";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) result += delim;
        result += fields[i];
    }
    return result;
}

// ============================================================================
// Receptor grammar (TR, IG, mouse MH)
// ============================================================================

static ParsedSymbol parse_single_field(const std::string& cleaned, const std::regex& pattern) {
    ParsedSymbol parsed;
    std::smatch m;
    if (std::regex_search(cleaned, m, pattern)) {
        parsed.gene = m[1].str();
        if (m[3].matched) {
            parsed.fields.push_back(pad_numeric_field(m[3].str()));
        }
    } else {
        parsed.gene = cleaned;
    }
    return parsed;
}

ParsedSymbol parse_receptor_symbol(const std::string& cleaned) {
    static const std::regex pattern(R"(^([A-Z0-9\-\.\(\)/]+)(\*(\d+))?)");
    return parse_single_field(cleaned, pattern);
}

ParsedSymbol parse_ig_symbol(const std::string& cleaned) {
    static const std::regex pattern(R"(^([A-Z0-9\-\.\(\)/ab]+)(\*(\d+))?)");

    // IGHD1/OR15-1A -> IGHD1/OR15-1a
    std::string symbol = cleaned;
    size_t pos = symbol.find("OR15-");
    while (pos != std::string::npos) {
        size_t digit = pos + 5;
        if (digit + 1 < symbol.size() &&
            std::isdigit(static_cast<unsigned char>(symbol[digit])) &&
            (symbol[digit + 1] == 'A' || symbol[digit + 1] == 'B')) {
            symbol[digit + 1] = static_cast<char>(std::tolower(symbol[digit + 1]));
            break;
        }
        pos = symbol.find("OR15-", pos + 1);
    }

    return parse_single_field(symbol, pattern);
}

// ============================================================================
// HLA grammar
// ============================================================================

static std::vector<std::string> listify_designation(const std::string& designation) {
    std::vector<std::string> fields;
    for (const auto& field : split_line(designation, ':')) {
        fields.push_back(pad_numeric_field(field));
    }
    return fields;
}

ParsedSymbol parse_hla_symbol(const std::string& cleaned) {
    static const std::regex class_two_pattern(
        R"(^((HLA-)?(D[PQ][AB]|DRB|TAP)\d)(\*?([\d:]+G?P?)[LSCAQN]?)?)");
    static const std::regex general_pattern(
        R"(^([A-Z0-9\-\.:/]+)(\*([\d:]+G?P?)[LSCAQN]?)?)");

    ParsedSymbol parsed;
    if (cleaned == "B2M") {
        parsed.gene = cleaned;
        return parsed;
    }

    // B35.3 -> B35:3
    std::string symbol = cleaned;
    for (size_t i = 1; i + 1 < symbol.size(); ++i) {
        if (symbol[i] == '.' &&
            std::isdigit(static_cast<unsigned char>(symbol[i - 1])) &&
            std::isdigit(static_cast<unsigned char>(symbol[i + 1]))) {
            symbol[i] = ':';
        }
    }

    std::smatch m;
    if (std::regex_search(symbol, m, class_two_pattern)) {
        parsed.gene = m[1].str();
        if (m[5].matched) parsed.fields = listify_designation(m[5].str());
        return parsed;
    }

    if (std::regex_search(symbol, m, general_pattern)) {
        parsed.gene = m[1].str();
        if (m[3].matched) parsed.fields = listify_designation(m[3].str());
        return parsed;
    }

    parsed.gene = symbol;
    return parsed;
}

} // namespace immunorm
