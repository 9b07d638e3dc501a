/**
 * Junction Aligner Implementation
 */

#include "junction_aligner.hpp"
#include "family_rules.hpp"
#include "file_parsers.hpp"
#include "symbol_parser.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <set>
#include <stdexcept>

namespace immunorm {

namespace {

const std::string kAminoAcids = "ACDEFGHIKLMNPQRSTVWY";
const std::string kFwCorrectable = "ILVYSCGR";
const std::string kCCorrectable = "WSRGYF";
const size_t kMinJunctionLength = 4;

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string clean_sequence(const std::string& raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        cleaned += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return cleaned;
}

std::string gene_of(const std::string& key) {
    return key.substr(0, key.find('*'));
}

bool is_functional_entry(const FamilyCatalog& catalog, const std::string& key) {
    size_t star = key.find('*');
    if (star == std::string::npos) {
        const CatalogNode* gene = catalog.genes.find_gene(key);
        return gene && gene->has_functional_leaf();
    }
    const CatalogNode* allele = catalog.genes.walk(key.substr(0, star), {key.substr(star + 1)});
    return allele && allele->has_functional_leaf();
}

// Index of the conserved C closing FR3. IG V genes without a usable FR3
// fall back to the last YC / FC of the V-REGION.
std::optional<size_t> find_v_anchor(const RegionMap& regions, bool ig_fallback) {
    auto v_region = regions.find("V-REGION");
    if (v_region == regions.end() || v_region->second.empty()) return std::nullopt;
    const std::string& region = v_region->second;

    auto fr3 = regions.find("FR3-IMGT");
    if (fr3 != regions.end() && !fr3->second.empty() && fr3->second.back() == 'C') {
        size_t pos = region.find(fr3->second);
        if (pos != std::string::npos) return pos + fr3->second.size() - 1;
    }

    if (!ig_fallback) return std::nullopt;

    size_t best = std::string::npos;
    for (const char* motif : {"YC", "FC"}) {
        size_t pos = region.rfind(motif);
        if (pos != std::string::npos && (best == std::string::npos || pos > best)) best = pos;
    }
    if (best == std::string::npos) return std::nullopt;
    return best + 1;
}

std::optional<ReferenceRegion> make_reference(const std::string& key,
                                              const RegionMap& regions,
                                              char segment,
                                              bool ig_fallback) {
    if (segment == 'J') {
        auto region = regions.find("J-REGION");
        auto motif = regions.find("J-MOTIF");
        if (region == regions.end() || motif == regions.end() || motif->second.empty()) {
            return std::nullopt;
        }
        size_t idx = region->second.find(motif->second);
        if (idx == std::string::npos) return std::nullopt;
        return ReferenceRegion{key, region->second, idx};
    }

    auto anchor = find_v_anchor(regions, ig_fallback);
    if (!anchor) return std::nullopt;
    return ReferenceRegion{key, regions.at("V-REGION"), *anchor};
}

bool key_in_locus(const std::string& key, const std::vector<std::string>& loci, char segment) {
    if (key.size() <= 3 || key[3] != segment) return false;
    for (const auto& locus : loci) {
        if (starts_with(key, locus)) return true;
    }
    return false;
}

double best_score(const std::vector<AlignmentCandidate>& candidates) {
    double best = -1;
    for (const auto& candidate : candidates) best = std::max(best, candidate.score);
    return best;
}

std::string join_reasons(const std::vector<std::string>& reasons) {
    std::string joined;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) joined += "; ";
        joined += reasons[i];
    }
    return joined + ".";
}

// Corrections as edits of the query: the J side keeps a prefix and appends,
// the V side drops a prefix and prepends.
struct JEdit {
    size_t keep;
    std::string append;
};

struct VEdit {
    size_t drop;
    std::string prepend;
};

template <typename Edit>
std::optional<Edit> pick_unique(const std::map<std::string, Edit>& pool,
                                const std::string& side,
                                std::vector<std::string>& reasons) {
    if (pool.size() == 1) return pool.begin()->second;
    reasons.push_back(side + (pool.empty() ? " side reconstruction unsuccessful"
                                           : " side reconstruction ambiguous"));
    return std::nullopt;
}

std::optional<JEdit> correct_j_side(const std::string& seq,
                                    const std::vector<AlignmentCandidate>& candidates,
                                    const JunctionOptions& options,
                                    std::vector<std::string>& reasons) {
    if (candidates.empty()) {
        reasons.push_back("J alignment unsuccessful");
        reasons.push_back("J side reconstruction unsuccessful");
        return std::nullopt;
    }

    const int n = static_cast<int>(seq.size());
    std::map<std::string, JEdit> all_edits;
    std::map<std::string, JEdit> single_residue;

    for (const auto& candidate : candidates) {
        int implied = candidate.offset + static_cast<int>(candidate.anchor_index) + 1;
        if (implied == n) return JEdit{seq.size(), ""};

        if (implied > n) {
            int gap = implied - n;
            if (gap > 1 && !options.allow_j_reconstruction) continue;
            JEdit edit{seq.size(), candidate.region.substr(n - candidate.offset, gap)};
            all_edits[seq + edit.append] = edit;
            if (gap == 1) single_residue[seq + edit.append] = edit;
        } else {
            JEdit edit{static_cast<size_t>(implied), ""};
            all_edits[seq.substr(0, edit.keep)] = edit;
        }
    }

    if (!single_residue.empty()) return pick_unique(single_residue, "J", reasons);

    if (!options.j_symbol && all_edits.size() > 1) {
        std::map<std::string, JEdit> canonical;
        for (const auto& [corrected, edit] : all_edits) {
            if (corrected.back() == 'F' || corrected.back() == 'W') canonical[corrected] = edit;
        }
        if (!canonical.empty()) return pick_unique(canonical, "J", reasons);
    }
    return pick_unique(all_edits, "J", reasons);
}

std::optional<VEdit> correct_v_side(const std::string& seq,
                                    const std::vector<AlignmentCandidate>& candidates,
                                    const JunctionOptions& options,
                                    std::vector<std::string>& reasons) {
    if (candidates.empty()) {
        reasons.push_back("V alignment unsuccessful");
        reasons.push_back("V side reconstruction unsuccessful");
        return std::nullopt;
    }

    std::map<std::string, VEdit> all_edits;
    std::map<std::string, VEdit> single_residue;

    for (const auto& candidate : candidates) {
        const int c = static_cast<int>(candidate.anchor_index);
        const int p = candidate.offset;
        if (p == c) return VEdit{0, ""};

        VEdit edit{0, ""};
        int gap = 0;
        if (p < c) {
            edit.drop = static_cast<size_t>(c - p);
        } else {
            gap = p - c;
            if (gap > 1 && !options.allow_v_reconstruction) continue;
            edit.prepend = candidate.region.substr(c, gap);
        }

        std::string corrected = edit.prepend + seq.substr(edit.drop);
        if (corrected.empty() || corrected[0] != 'C') continue;

        all_edits[corrected] = edit;
        if (gap == 1) single_residue[corrected] = edit;
    }

    if (!single_residue.empty()) return pick_unique(single_residue, "V", reasons);
    return pick_unique(all_edits, "V", reasons);
}

JunctionResult finish(const std::string& original,
                      const std::vector<std::string>& reasons,
                      const std::string& corrected,
                      const JunctionOptions& options) {
    if (reasons.empty()) return JunctionResult(original, "", corrected);

    std::string error = join_reasons(reasons);
    if (options.log_failures) {
        log(LogLevel::WARNING, "Failed to standardize junction " + original + ": " + error +
                               " Attempted fix: " + corrected + ".");
    }
    return JunctionResult(original, error, corrected);
}

bool is_canonical_junction(const std::string& seq) {
    static const std::regex canonical("^C[A-Z]*[FW]$");
    return std::regex_match(seq, canonical);
}

JunctionResult standardize_by_motif(const std::string& original,
                                    const std::string& seq,
                                    const JunctionOptions& options) {
    std::vector<std::string> reasons;
    std::string corrected = seq;

    if (!is_canonical_junction(seq)) {
        if (options.strict) {
            reasons.push_back("not a valid junction sequence");
        } else {
            corrected = "C" + seq + "F";
        }
    }
    if (corrected.size() < kMinJunctionLength) reasons.push_back("junction too short");

    return finish(original, reasons, corrected, options);
}

} // namespace

// ============================================================================
// Options
// ============================================================================

JunctionOptions JunctionOptions::from_config(const std::map<std::string, std::string>& config) {
    JunctionOptions options;
    for (const auto& [key, value] : config) {
        if (key == "locus") options.locus = value;
        else if (key == "j_symbol") options.j_symbol = value;
        else if (key == "v_symbol") options.v_symbol = value;
        else if (key == "species") options.species = value;
        else if (key == "allow_c_correction") options.allow_c_correction = parse_bool_option(key, value);
        else if (key == "allow_fw_correction") options.allow_fw_correction = parse_bool_option(key, value);
        else if (key == "enforce_functional_v") options.enforce_functional_v = parse_bool_option(key, value);
        else if (key == "enforce_functional_j") options.enforce_functional_j = parse_bool_option(key, value);
        else if (key == "allow_v_reconstruction") options.allow_v_reconstruction = parse_bool_option(key, value);
        else if (key == "allow_j_reconstruction") options.allow_j_reconstruction = parse_bool_option(key, value);
        else if (key == "mismatch_penalty") options.mismatch_penalty = parse_double_option(key, value);
        else if (key == "max_j_mismatches") options.max_j_mismatches = parse_int_option(key, value);
        else if (key == "max_v_mismatches") options.max_v_mismatches = parse_int_option(key, value);
        else if (key == "min_j_score") options.min_j_score = parse_int_option(key, value);
        else if (key == "min_v_score") options.min_v_score = parse_int_option(key, value);
        else if (key == "log_failures") options.log_failures = parse_bool_option(key, value);
        else if (key == "strict") options.strict = parse_bool_option(key, value);
        else throw std::invalid_argument("Unknown junction option: " + key);
    }
    return options;
}

// ============================================================================
// Reference selection
// ============================================================================

bool is_valid_amino_acid_sequence(const std::string& seq) {
    if (seq.empty()) return false;
    return seq.find_first_not_of(kAminoAcids) == std::string::npos;
}

bool is_valid_locus(const std::string& locus) {
    static const std::set<std::string> loci = {
        "TRA", "TRB", "TRG", "TRD", "TR", "IGH", "IGK", "IGL", "IG"
    };
    return loci.count(locus) > 0;
}

GeneFamily locus_family(const std::string& locus) {
    if (!is_valid_locus(locus)) {
        throw std::invalid_argument("Invalid locus: " + locus +
                                    " (expected TRA, TRB, TRG, TRD, TR, IGH, IGK, IGL or IG)");
    }
    return starts_with(locus, "TR") ? GeneFamily::TR : GeneFamily::IG;
}

bool is_valid_extension(const std::string& symbol, const std::string& key) {
    if (!starts_with(key, symbol)) return false;
    if (key.size() == symbol.size() || symbol.empty()) return true;
    return !(is_digit(symbol.back()) && is_digit(key[symbol.size()]));
}

std::vector<ReferenceRegion> select_references(const FamilyCatalog& catalog,
                                               const std::string& locus,
                                               char segment,
                                               const std::string& symbol,
                                               bool enforce_functional) {
    std::vector<std::string> loci = {locus};
    if (segment == 'V' && (locus == "TRA" || locus == "TRD")) loci = {"TRA", "TRD"};

    if (!symbol.empty() && !key_in_locus(symbol, loci, segment)) {
        throw std::invalid_argument(std::string(1, segment) + " symbol " + symbol +
                                    " does not belong to locus " + locus);
    }

    const bool ig_fallback = starts_with(locus, "IG");

    // gene -> (key, regions) in catalog order
    std::map<std::string, std::vector<std::pair<std::string, const RegionMap*>>> by_gene;
    for (const auto& [key, regions] : catalog.sequences.entries()) {
        bool wanted = symbol.empty() ? key_in_locus(key, loci, segment)
                                     : is_valid_extension(symbol, key);
        if (!wanted) continue;
        if (enforce_functional && !is_functional_entry(catalog, key)) continue;
        if (!make_reference(key, regions, segment, ig_fallback)) continue;
        by_gene[gene_of(key)].emplace_back(key, &regions);
    }

    std::vector<ReferenceRegion> references;
    for (const auto& [gene, entries] : by_gene) {
        bool identical = entries.size() > 1;
        for (size_t i = 1; i < entries.size() && identical; ++i) {
            identical = *entries[i].second == *entries[0].second;
        }

        if (identical) {
            auto reference = make_reference(gene, *entries[0].second, segment, ig_fallback);
            references.push_back(*reference);
            continue;
        }
        for (const auto& [key, regions] : entries) {
            references.push_back(*make_reference(key, *regions, segment, ig_fallback));
        }
    }
    return references;
}

// ============================================================================
// J side
// ============================================================================

bool valid_j_anchor(const std::string& seq, const std::string& region,
                    size_t anchor_index, int offset) {
    if (anchor_index >= region.size()) return false;

    const int n = static_cast<int>(seq.size());
    const int anchor = offset + static_cast<int>(anchor_index);
    if (anchor < 0) return false;
    if (anchor >= n) return true;

    std::string seq_tail = seq.substr(anchor);
    return seq_tail == region.substr(anchor_index, seq_tail.size());
}

double score_j_alignment(const std::string& seq, const std::string& region, int offset,
                         double penalty, int max_mismatches) {
    const int n = static_cast<int>(seq.size());
    const int m = static_cast<int>(region.size());
    const int s_start = std::max(offset, 0);
    const int j_start = std::max(-offset, 0);
    const int length = std::min(n - s_start, m - j_start);
    if (length <= 0) return -1;

    std::vector<bool> matches(length);
    for (int i = 0; i < length; ++i) {
        matches[i] = seq[s_start + i] == region[j_start + i];
    }

    auto first_match = std::find(matches.begin(), matches.end(), true);
    if (first_match == matches.end()) return -1;
    matches.erase(matches.begin(), first_match);

    while (max_mismatches >= 0 &&
           std::count(matches.begin(), matches.end(), false) > max_mismatches) {
        auto first_mismatch = std::find(matches.begin(), matches.end(), false);
        matches.erase(matches.begin(), first_mismatch + 1);

        first_match = std::find(matches.begin(), matches.end(), true);
        if (first_match == matches.end()) return -1;
        matches.erase(matches.begin(), first_match);
    }

    double score = 0;
    for (bool match : matches) score += match ? 1.0 : penalty;
    return score < 0 ? -1 : score;
}

std::optional<AlignmentCandidate> best_j_alignment(const std::string& seq,
                                                   const ReferenceRegion& reference,
                                                   const JunctionOptions& options) {
    const int n = static_cast<int>(seq.size());
    const int m = static_cast<int>(reference.region.size());

    std::optional<AlignmentCandidate> best;
    for (int offset = n - m; offset < n; ++offset) {
        if (!valid_j_anchor(seq, reference.region, reference.anchor_index, offset)) continue;

        double score = score_j_alignment(seq, reference.region, offset,
                                         options.mismatch_penalty, options.max_j_mismatches);
        if (score > (best ? best->score : -1)) {
            best = AlignmentCandidate{reference.symbol, reference.region, offset,
                                      reference.anchor_index, score};
        }
    }
    return best;
}

std::vector<AlignmentCandidate> align_to_j(const std::string& seq,
                                           const std::vector<ReferenceRegion>& references,
                                           const JunctionOptions& options) {
    std::vector<AlignmentCandidate> best;
    double best_score = options.min_j_score;

    for (const auto& reference : references) {
        auto candidate = best_j_alignment(seq, reference, options);
        if (!candidate) continue;

        if (candidate->score > best_score) {
            best_score = candidate->score;
            best.clear();
            best.push_back(*candidate);
        } else if (candidate->score == best_score) {
            best.push_back(*candidate);
        }
    }
    return best;
}

// ============================================================================
// V side
// ============================================================================

bool valid_v_anchor(const std::string& seq, const std::string& region,
                    size_t anchor_index, int offset) {
    const int length = static_cast<int>(region.size());
    const int c = static_cast<int>(anchor_index);
    if (offset < 0 || offset >= length || c >= length) return false;
    if (offset > c) return true;

    const size_t span = static_cast<size_t>(c - offset) + 1;
    if (span > seq.size()) return false;
    return seq.compare(0, span, region, offset, span) == 0;
}

double score_v_alignment(const std::string& seq, const std::string& region, int offset,
                         double penalty, int max_mismatches) {
    const int length = static_cast<int>(region.size());
    if (offset < 0 || offset >= length) return -1;

    const size_t aligned = std::min(region.size() - offset, seq.size());
    std::vector<bool> matches(aligned);
    for (size_t i = 0; i < aligned; ++i) {
        matches[i] = seq[i] == region[offset + i];
    }

    auto last_match = std::find(matches.rbegin(), matches.rend(), true);
    if (last_match == matches.rend()) return -1;
    matches.erase(last_match.base(), matches.end());

    while (max_mismatches >= 0 &&
           std::count(matches.begin(), matches.end(), false) > max_mismatches) {
        auto last_mismatch = std::find(matches.rbegin(), matches.rend(), false);
        matches.erase(std::prev(last_mismatch.base()), matches.end());

        last_match = std::find(matches.rbegin(), matches.rend(), true);
        if (last_match == matches.rend()) return -1;
        matches.erase(last_match.base(), matches.end());
    }

    double score = 0;
    for (bool match : matches) score += match ? 1.0 : penalty;
    return score < 0 ? -1 : score;
}

std::optional<AlignmentCandidate> best_v_alignment(const std::string& seq,
                                                   const ReferenceRegion& reference,
                                                   const JunctionOptions& options) {
    const int length = static_cast<int>(reference.region.size());
    const int c = static_cast<int>(reference.anchor_index);
    const int lowest = std::max(0, c - static_cast<int>(seq.size()) + 1);

    std::optional<AlignmentCandidate> best;
    for (int offset = length - 1; offset >= lowest; --offset) {
        if (!valid_v_anchor(seq, reference.region, reference.anchor_index, offset)) continue;

        double score = score_v_alignment(seq, reference.region, offset,
                                         options.mismatch_penalty, options.max_v_mismatches);
        if (score > (best ? best->score : -1)) {
            best = AlignmentCandidate{reference.symbol, reference.region, offset,
                                      reference.anchor_index, score};
        }
    }
    return best;
}

std::vector<AlignmentCandidate> align_to_v(const std::string& seq,
                                           const std::vector<ReferenceRegion>& references,
                                           const JunctionOptions& options) {
    std::vector<AlignmentCandidate> best;
    double best_score = options.min_v_score;

    for (const auto& reference : references) {
        auto candidate = best_v_alignment(seq, reference, options);
        if (!candidate) continue;

        if (candidate->score > best_score) {
            best_score = candidate->score;
            best.clear();
            best.push_back(*candidate);
        } else if (candidate->score == best_score) {
            best.push_back(*candidate);
        }
    }
    return best;
}

// ============================================================================
// Entry points
// ============================================================================

JunctionResult standardize_junction(const ReferenceContext& context,
                                    const std::string& seq,
                                    const JunctionOptions& options) {
    const std::string locus = clean_sequence(options.locus);
    std::optional<GeneFamily> family;
    if (!locus.empty()) family = locus_family(locus);

    const std::string cleaned = clean_sequence(seq);
    if (!is_valid_amino_acid_sequence(cleaned)) {
        std::string error = "not a valid amino acid sequence, found: " + seq + ".";
        if (options.log_failures) log(LogLevel::WARNING, "Failed to standardize junction: " + error);
        return JunctionResult(seq, error);
    }

    if (!family) return standardize_by_motif(seq, cleaned, options);

    const std::string species = clean_species(options.species);
    const FamilyCatalog* catalog = context.find(species, *family);
    if (!catalog || !find_family_rules(species, *family)) {
        return finish(seq, {"unsupported species: " + options.species}, cleaned, options);
    }

    const std::string j_symbol = options.j_symbol ? clean_symbol(*options.j_symbol) : "";
    const std::string v_symbol = options.v_symbol ? clean_symbol(*options.v_symbol) : "";

    auto j_references = select_references(*catalog, locus, 'J', j_symbol,
                                          options.enforce_functional_j);
    auto v_references = select_references(*catalog, locus, 'V', v_symbol,
                                          options.enforce_functional_v);

    std::vector<std::string> reasons;
    std::string working = cleaned;

    if (options.allow_fw_correction && !j_references.empty() &&
        kFwCorrectable.find(working.back()) != std::string::npos) {
        double best = best_score(align_to_j(working, j_references, options));
        std::string replacement;
        for (char residue : {'F', 'W'}) {
            std::string variant = working.substr(0, working.size() - 1) + residue;
            double score = best_score(align_to_j(variant, j_references, options));
            if (score > best) {
                best = score;
                replacement = variant;
            }
        }
        if (!replacement.empty()) {
            log(LogLevel::DEBUG, "Corrected terminal residue of " + working + " to " + replacement);
            working = replacement;
        }
    }

    if (options.allow_c_correction && !v_references.empty() &&
        kCCorrectable.find(working.front()) != std::string::npos) {
        std::string variant = "C" + working.substr(1);
        if (best_score(align_to_v(variant, v_references, options)) >
            best_score(align_to_v(working, v_references, options))) {
            log(LogLevel::DEBUG, "Corrected leading residue of " + working + " to C");
            working = variant;
        }
    }

    std::optional<JEdit> j_edit;
    if (j_references.empty()) {
        reasons.push_back("no sequence information known for " +
                          (j_symbol.empty() ? locus + "J" : j_symbol));
    } else {
        j_edit = correct_j_side(working, align_to_j(working, j_references, options),
                                options, reasons);
    }

    std::optional<VEdit> v_edit;
    if (v_references.empty()) {
        reasons.push_back("no sequence information known for " +
                          (v_symbol.empty() ? locus + "V" : v_symbol));
    } else {
        v_edit = correct_v_side(working, align_to_v(working, v_references, options),
                                options, reasons);
    }

    const size_t keep = j_edit ? j_edit->keep : working.size();
    const size_t drop = v_edit ? v_edit->drop : 0;
    std::string corrected = (v_edit ? v_edit->prepend : "") +
                            (keep > drop ? working.substr(drop, keep - drop) : "") +
                            (j_edit ? j_edit->append : "");

    if (corrected.size() < kMinJunctionLength) reasons.push_back("junction too short");
    if (options.strict && reasons.empty() && !is_canonical_junction(corrected)) {
        reasons.push_back("not a valid junction sequence");
    }

    return finish(seq, reasons, corrected, options);
}

JunctionResult standardize_junction(const std::string& seq, const JunctionOptions& options) {
    return standardize_junction(default_context(), seq, options);
}

} // namespace immunorm
