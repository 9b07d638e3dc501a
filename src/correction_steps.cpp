/**
 * Correction Steps Implementation
 */

#include "correction_steps.hpp"
#include "file_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace immunorm {

// More "-1" candidates than this would make the toggle search explode
// combinatorially; such symbols skip the step.
static const size_t kMaxDash1Candidates = 8;

// ============================================================================
// Cascade fold
// ============================================================================

CascadeOutcome run_cascade(const ParsedSymbol& symbol, const CascadeEnv& env) {
    CascadeOutcome outcome;
    if (env.accepts(symbol)) {
        outcome.accepted = true;
        outcome.symbol = symbol;
        return outcome;
    }

    ParsedSymbol working = symbol;
    ParsedSymbol committed = symbol;

    for (const auto& step : env.rules.cascade) {
        working = step.apply(working, env);
        outcome.steps_applied++;
        if (!step.speculative) committed = working;

        if (env.accepts(working)) {
            log(LogLevel::DEBUG, "Resolved " + working.gene + " at step '" + step.name + "'");
            outcome.accepted = true;
            outcome.symbol = working;
            return outcome;
        }
    }

    outcome.symbol = committed;
    return outcome;
}

// ============================================================================
// String helpers
// ============================================================================

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string replace_char(std::string s, char from, char to) {
    for (auto& c : s) {
        if (c == from) c = to;
    }
    return s;
}

static std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string slash_before_token(const std::string& gene, const std::string& token,
                               bool skip_after_tr) {
    std::string result;
    size_t i = 0;
    while (i < gene.size()) {
        size_t match_len = 0;
        if (gene[i] == '-' && gene.compare(i + 1, token.size(), token) == 0) {
            match_len = token.size() + 1;
        } else if (gene.compare(i, token.size(), token) == 0) {
            match_len = token.size();
        }

        bool blocked = (i >= 1 && gene[i - 1] == '/') ||
                       (skip_after_tr && i >= 2 && gene.compare(i - 2, 2, "TR") == 0);

        if (match_len > 0 && !blocked) {
            result += "/" + token;
            i += match_len;
        } else {
            result += gene[i];
            ++i;
        }
    }
    return result;
}

std::string strip_unanchored_zeros(const std::string& gene) {
    std::string result;
    size_t i = 0;
    while (i < gene.size()) {
        bool after_digit = i > 0 && std::isdigit(static_cast<unsigned char>(gene[i - 1]));
        if (gene[i] == '0' && !after_digit) {
            while (i < gene.size() && gene[i] == '0') ++i;
            continue;
        }
        result += gene[i];
        ++i;
    }
    return result;
}

namespace {

struct NumberSpan {
    std::string base;   // digits before an optional "-1"
    size_t start;
    size_t end;
};

bool is_digit_at(const std::string& s, size_t i) {
    return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]));
}

// Locus numbers: \d+(-\d+)?
std::vector<NumberSpan> find_dash1_candidates(const std::string& gene, bool allow_adding) {
    std::vector<NumberSpan> candidates;
    size_t i = 0;
    while (i < gene.size()) {
        if (!is_digit_at(gene, i)) {
            ++i;
            continue;
        }
        size_t digits_end = i;
        while (is_digit_at(gene, digits_end)) ++digits_end;

        size_t end = digits_end;
        if (end < gene.size() && gene[end] == '-' && is_digit_at(gene, end + 1)) {
            end += 1;
            while (is_digit_at(gene, end)) ++end;
        }

        std::string suffix = gene.substr(digits_end, end - digits_end);
        bool bare = suffix.empty();
        bool dash1 = suffix == "-1";
        if (dash1 || (allow_adding && bare)) {
            candidates.push_back({gene.substr(i, digits_end - i), i, end});
        }
        i = end;
    }
    return candidates;
}

} // namespace

std::vector<std::string> dash1_variants(const std::string& gene, bool allow_adding) {
    std::vector<std::string> variants;
    auto candidates = find_dash1_candidates(gene, allow_adding);
    if (candidates.empty()) return variants;
    if (candidates.size() > kMaxDash1Candidates) {
        log(LogLevel::DEBUG, "Too many locus numbers in " + gene + " to toggle -1 suffixes");
        return variants;
    }

    const size_t n = candidates.size();
    for (size_t mask = 0; mask < (static_cast<size_t>(1) << n); ++mask) {
        std::string variant;
        size_t cursor = 0;
        for (size_t c = 0; c < n; ++c) {
            bool with_dash1 = ((mask >> (n - 1 - c)) & 1) == 0;
            variant += gene.substr(cursor, candidates[c].start - cursor);
            variant += candidates[c].base;
            if (with_dash1) variant += "-1";
            cursor = candidates[c].end;
        }
        variant += gene.substr(cursor);

        if (variant != gene) variants.push_back(variant);
    }
    return variants;
}

// ============================================================================
// Shared steps
// ============================================================================

ParsedSymbol substitute_synonym(const ParsedSymbol& symbol, const CascadeEnv& env) {
    const std::string* current = env.catalog.synonyms.find(symbol.gene);
    if (!current) return symbol;
    return ParsedSymbol{*current, symbol.fields};
}

ParsedSymbol insert_family_prefix(const ParsedSymbol& symbol, const CascadeEnv& env) {
    if (starts_with(symbol.gene, env.rules.prefix)) return symbol;
    return ParsedSymbol{env.rules.prefix + symbol.gene, symbol.fields};
}

// ============================================================================
// TR
// ============================================================================

ParsedSymbol repair_tr_affixes(const ParsedSymbol& symbol, const CascadeEnv&) {
    std::string gene = replace_all(symbol.gene, "TCR", "TR");
    gene = replace_char(gene, 'S', '-');
    gene = replace_char(gene, '.', '-');
    gene = slash_before_token(gene, "DV", true);
    gene = slash_before_token(gene, "OR", false);
    gene = strip_unanchored_zeros(gene);
    return ParsedSymbol{gene, symbol.fields};
}

ParsedSymbol resolve_dv_from_av(const ParsedSymbol& symbol, const CascadeEnv& env) {
    const std::string& gene = symbol.gene;
    if (!starts_with(gene, "TRAV") || gene.find("DV") != std::string::npos) {
        return symbol;
    }

    size_t slash = gene.rfind('/');
    if (slash != std::string::npos) {
        return ParsedSymbol{gene.substr(0, slash + 1) + "DV" + gene.substr(slash + 1),
                            symbol.fields};
    }

    for (const auto& [valid_gene, node] : env.catalog.genes.genes()) {
        if (starts_with(valid_gene, gene + "/DV")) {
            return ParsedSymbol{valid_gene, symbol.fields};
        }
    }
    return symbol;
}

// TRAV\d+(-\d)?/<dv_segment>
static bool is_trav_compound_of(const std::string& candidate, const std::string& dv_segment) {
    if (!starts_with(candidate, "TRAV")) return false;
    size_t i = 4;
    size_t digits_start = i;
    while (is_digit_at(candidate, i)) ++i;
    if (i == digits_start) return false;
    if (i + 1 < candidate.size() && candidate[i] == '-' && is_digit_at(candidate, i + 1)) {
        i += 2;
    }
    return candidate.compare(i, std::string::npos, "/" + dv_segment) == 0;
}

ParsedSymbol resolve_av_from_dv(const ParsedSymbol& symbol, const CascadeEnv& env) {
    static const std::regex bare_compound(R"(^TR([\d-]+)/(DV[\d-]+)$)");

    const std::string& gene = symbol.gene;
    if (gene.find("DV") == std::string::npos) return symbol;

    if (starts_with(gene, "TRDV")) {
        std::string dv_segment = gene.substr(2);
        for (const auto& [valid_gene, node] : env.catalog.genes.genes()) {
            if (is_trav_compound_of(valid_gene, dv_segment)) {
                return ParsedSymbol{valid_gene, symbol.fields};
            }
        }
        return symbol;
    }

    std::smatch m;
    if (std::regex_match(gene, m, bare_compound)) {
        return ParsedSymbol{"TRAV" + m[1].str() + "/" + m[2].str(), symbol.fields};
    }
    return symbol;
}

ParsedSymbol toggle_dash1_suffixes(const ParsedSymbol& symbol, const CascadeEnv& env) {
    if (!env.may_retry) return symbol;

    const CascadeEnv retry_env = env.without_retry();
    for (const auto& variant : dash1_variants(symbol.gene, true)) {
        CascadeOutcome outcome = run_cascade(ParsedSymbol{variant, symbol.fields}, retry_env);
        if (outcome.accepted) return outcome.symbol;
    }
    return symbol;
}

// ============================================================================
// IG
// ============================================================================

ParsedSymbol repair_ig_affixes(const ParsedSymbol& symbol, const CascadeEnv&) {
    std::string gene = replace_char(symbol.gene, '.', '-');
    gene = slash_before_token(gene, "OR", false);
    gene = strip_unanchored_zeros(gene);
    return ParsedSymbol{gene, symbol.fields};
}

ParsedSymbol drop_dash1_suffixes(const ParsedSymbol& symbol, const CascadeEnv& env) {
    for (const auto& variant : dash1_variants(symbol.gene, false)) {
        if (env.catalog.genes.contains(variant)) {
            return ParsedSymbol{variant, symbol.fields};
        }
    }
    return symbol;
}

// ============================================================================
// MH
// ============================================================================

ParsedSymbol repair_hla_affixes(const ParsedSymbol& symbol, const CascadeEnv&) {
    std::string gene = symbol.gene;
    if (!starts_with(gene, "HLA-")) gene = "HLA-" + gene;
    gene = replace_all(gene, "CW", "C");
    return ParsedSymbol{gene, symbol.fields};
}

ParsedSymbol split_forgotten_asterisk(const ParsedSymbol& symbol, const CascadeEnv&) {
    static const std::regex glued_designation(R"(^(HLA-[A-Z]+)([\d:]+G?P?)$)");

    if (symbol.has_allele()) return symbol;

    std::smatch m;
    if (!std::regex_match(symbol.gene, m, glued_designation)) return symbol;
    return ParsedSymbol{m[1].str(), split_line(m[2].str(), ':')};
}

ParsedSymbol split_forgotten_colon(const ParsedSymbol& symbol, const CascadeEnv&) {
    if (!symbol.has_allele() || symbol.fields[0].size() != 4) return symbol;

    ParsedSymbol split{symbol.gene, {symbol.fields[0].substr(0, 2), symbol.fields[0].substr(2)}};
    split.fields.insert(split.fields.end(), symbol.fields.begin() + 1, symbol.fields.end());
    return split;
}

ParsedSymbol search_leading_zero_widths(const ParsedSymbol& symbol, const CascadeEnv& env) {
    const size_t searched = std::min<size_t>(2, symbol.fields.size());
    if (searched == 0) return symbol;

    std::vector<std::vector<std::string>> options(searched);
    for (size_t i = 0; i < searched; ++i) {
        const std::string& field = symbol.fields[i];
        if (is_all_digits(field)) {
            options[i] = {pad_numeric_field(field, 2), pad_numeric_field(field, 3)};
        } else {
            options[i] = {field};
        }
    }

    // Cartesian product, first field varying slowest
    std::vector<size_t> pick(searched, 0);
    while (true) {
        ParsedSymbol candidate = symbol;
        for (size_t i = 0; i < searched; ++i) {
            candidate.fields[i] = options[i][pick[i]];
        }
        if (env.accepts(candidate)) return candidate;

        size_t pos = searched;
        while (pos > 0) {
            --pos;
            if (++pick[pos] < options[pos].size()) break;
            pick[pos] = 0;
            if (pos == 0) return symbol;
        }
    }
}

ParsedSymbol substitute_dashless_synonym(const ParsedSymbol& symbol, const CascadeEnv& env) {
    std::string key;
    for (char c : symbol.gene) {
        if (c != '-') key += c;
    }
    const std::string* current = env.catalog.synonyms.find(key);
    if (!current) return symbol;
    return ParsedSymbol{*current, symbol.fields};
}

} // namespace immunorm
