/**
 * Junction Aligner
 *
 * Verifies, trims or reconstructs CDR3 junction sequences by aligning them
 * against the reference J-REGION and V-REGION amino acid sequences of a
 * locus. The J side is anchored on the conserved F / W of the J motif, the
 * V side on the conserved C closing framework region 3.
 *
 * Alignment coordinates:
 *   J: `offset` is the position in the query at which region[0] lands
 *      (negative when the region starts before the query).
 *   V: `offset` is the position in the region at which query[0] lands.
 */

#ifndef IMMUNORM_JUNCTION_ALIGNER_HPP
#define IMMUNORM_JUNCTION_ALIGNER_HPP

#include "immunorm.hpp"
#include "reference_catalog.hpp"
#include "results.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace immunorm {

/**
 * Tunables of standardize_junction()
 */
struct JunctionOptions {
    std::string locus;                      // TRA TRB TRG TRD TR IGH IGK IGL IG, or empty for motif-only mode
    std::optional<std::string> j_symbol;
    std::optional<std::string> v_symbol;
    std::string species = "homosapiens";

    bool allow_c_correction = false;
    bool allow_fw_correction = false;
    bool enforce_functional_v = true;
    bool enforce_functional_j = false;
    bool allow_v_reconstruction = false;
    bool allow_j_reconstruction = false;

    double mismatch_penalty = -1.5;
    int max_j_mismatches = 1;               // -1 for unbounded
    int max_v_mismatches = -1;
    int min_j_score = 3;
    int min_v_score = 2;

    bool log_failures = true;
    bool strict = false;                    // reject results not shaped C...F / C...W

    /**
     * Keys are the member names above
     * @throws std::invalid_argument for unknown keys or bad values
     */
    static JunctionOptions from_config(const std::map<std::string, std::string>& config);
};

/**
 * A reference region eligible for alignment, with the index of its
 * conserved anchor residue
 */
struct ReferenceRegion {
    std::string symbol;         // allele, or gene when its alleles were collapsed
    std::string region;
    size_t anchor_index = 0;
};

/**
 * Best alignment of a query against one reference region
 */
struct AlignmentCandidate {
    std::string symbol;
    std::string region;
    int offset = 0;
    size_t anchor_index = 0;
    double score = -1;
};

/**
 * True if `seq` is a non-empty string over the 20 standard amino acids
 */
bool is_valid_amino_acid_sequence(const std::string& seq);

/**
 * Valid loci: TRA TRB TRG TRD TR IGH IGK IGL IG
 */
bool is_valid_locus(const std::string& locus);

/**
 * Family of a valid locus
 * @throws std::invalid_argument for an invalid locus
 */
GeneFamily locus_family(const std::string& locus);

/**
 * True if `key` names the same gene as `symbol` or a more specific one.
 * Numbers cannot be extended: TRAV1 does not extend to TRAV13.
 */
bool is_valid_extension(const std::string& symbol, const std::string& key);

/**
 * Collect the reference regions of segment 'V' or 'J' for a locus.
 *
 * With a symbol, only catalog entries extending it are used; without one,
 * every entry of the locus (TRA / TRD V genes are pooled). Entries lacking
 * the anchoring regions are skipped, and alleles of a gene with identical
 * sequence information collapse to the gene.
 *
 * @throws std::invalid_argument if the symbol does not belong to the locus
 */
std::vector<ReferenceRegion> select_references(const FamilyCatalog& catalog,
                                               const std::string& locus,
                                               char segment,
                                               const std::string& symbol,
                                               bool enforce_functional);

// ============================================================================
// J side
// ============================================================================

/**
 * The conserved anchor must lie at or beyond the end of the query, or the
 * query tail from the anchor must equal the region from its anchor.
 */
bool valid_j_anchor(const std::string& seq, const std::string& region,
                    size_t anchor_index, int offset);

/**
 * Matches score +1 and mismatches `penalty`. Mismatches before the first
 * match are free. While more than max_mismatches remain (unless negative),
 * the alignment is cut after its first mismatch. No match scores -1.
 */
double score_j_alignment(const std::string& seq, const std::string& region, int offset,
                         double penalty, int max_mismatches);

/**
 * Best anchored offset of one J reference; nullopt if no offset scores
 */
std::optional<AlignmentCandidate> best_j_alignment(const std::string& seq,
                                                   const ReferenceRegion& reference,
                                                   const JunctionOptions& options);

/**
 * Highest scoring J references at or above min_j_score, ties kept
 */
std::vector<AlignmentCandidate> align_to_j(const std::string& seq,
                                           const std::vector<ReferenceRegion>& references,
                                           const JunctionOptions& options);

// ============================================================================
// V side
// ============================================================================

/**
 * Query starting at or before the conserved C must reproduce the region up
 * to and including it; starting past it requires reconstruction.
 */
bool valid_v_anchor(const std::string& seq, const std::string& region,
                    size_t anchor_index, int offset);

/**
 * Region from `offset` against the query head. Mismatches after the last
 * match are free; with max_mismatches >= 0 the alignment is cut before its
 * last mismatch while too many remain.
 */
double score_v_alignment(const std::string& seq, const std::string& region, int offset,
                         double penalty, int max_mismatches);

std::optional<AlignmentCandidate> best_v_alignment(const std::string& seq,
                                                   const ReferenceRegion& reference,
                                                   const JunctionOptions& options);

std::vector<AlignmentCandidate> align_to_v(const std::string& seq,
                                           const std::vector<ReferenceRegion>& references,
                                           const JunctionOptions& options);

// ============================================================================
// Entry points
// ============================================================================

/**
 * Standardize one junction sequence against the catalogs of `context`.
 * @throws std::invalid_argument for an invalid locus, or a V / J symbol
 *         that does not belong to the locus
 */
JunctionResult standardize_junction(const ReferenceContext& context,
                                    const std::string& seq,
                                    const JunctionOptions& options);

/**
 * Same, against default_context()
 */
JunctionResult standardize_junction(const std::string& seq, const JunctionOptions& options);

} // namespace immunorm

#endif // IMMUNORM_JUNCTION_ALIGNER_HPP
