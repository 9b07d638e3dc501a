/**
 * Tests for junction_aligner.hpp: reference selection, J / V alignment
 * scoring and junction standardization against the test catalogs.
 */

#include <gtest/gtest.h>
#include "junction_aligner.hpp"
#include "file_parsers.hpp"

using namespace immunorm;

static const ReferenceContext& test_context() {
    static const ReferenceContext context = ReferenceContext::load(TEST_DATA_DIR);
    return context;
}

// ============================================================================
// Loci and references
// ============================================================================

TEST(Locus, ValidLoci) {
    EXPECT_TRUE(is_valid_locus("TRB"));
    EXPECT_TRUE(is_valid_locus("TR"));
    EXPECT_TRUE(is_valid_locus("IGK"));
    EXPECT_FALSE(is_valid_locus("TRX"));
    EXPECT_FALSE(is_valid_locus(""));
}

TEST(Locus, Family) {
    EXPECT_EQ(locus_family("TRD"), GeneFamily::TR);
    EXPECT_EQ(locus_family("IGL"), GeneFamily::IG);
    EXPECT_THROW(locus_family("XYZ"), std::invalid_argument);
}

TEST(AminoAcidSequence, Validity) {
    EXPECT_TRUE(is_valid_amino_acid_sequence("CASSLGQGSYEQYF"));
    EXPECT_FALSE(is_valid_amino_acid_sequence(""));
    EXPECT_FALSE(is_valid_amino_acid_sequence("CASSB"));
    EXPECT_FALSE(is_valid_amino_acid_sequence("123456"));
}

TEST(ValidExtension, NumbersAreNotExtended) {
    EXPECT_TRUE(is_valid_extension("TRAV1", "TRAV1"));
    EXPECT_TRUE(is_valid_extension("TRAV1", "TRAV1-1*01"));
    EXPECT_TRUE(is_valid_extension("TRBJ2-7", "TRBJ2-7*02"));
    EXPECT_FALSE(is_valid_extension("TRAV1", "TRAV13"));
    EXPECT_FALSE(is_valid_extension("TRAV1", "TRBV1"));
}

TEST(SelectReferences, IdenticalAllelesCollapseToGene) {
    const FamilyCatalog& catalog = *test_context().find("homosapiens", GeneFamily::TR);
    auto references = select_references(catalog, "TRA", 'V', "", false);
    ASSERT_EQ(references.size(), 1u);
    EXPECT_EQ(references[0].symbol, "TRAV10");
    EXPECT_EQ(references[0].region[references[0].anchor_index], 'C');
}

TEST(SelectReferences, JAnchorIsMotifStart) {
    const FamilyCatalog& catalog = *test_context().find("homosapiens", GeneFamily::TR);
    auto references = select_references(catalog, "TRB", 'J', "TRBJ2-7", false);
    ASSERT_EQ(references.size(), 1u);
    EXPECT_EQ(references[0].symbol, "TRBJ2-7*01");
    EXPECT_EQ(references[0].region.substr(references[0].anchor_index, 4), "FGPG");
}

TEST(SelectReferences, SymbolOfOtherLocusThrows) {
    const FamilyCatalog& catalog = *test_context().find("homosapiens", GeneFamily::TR);
    EXPECT_THROW(select_references(catalog, "TRB", 'J', "TRAJ38", false),
                 std::invalid_argument);
    EXPECT_THROW(select_references(catalog, "TRB", 'V', "TRBJ2-7", false),
                 std::invalid_argument);
}

// ============================================================================
// Alignment scoring
// ============================================================================

TEST(JAlignment, AnchorMustMatchQueryTail) {
    // region SYEQYFGPG... anchor F at 5
    const std::string region = "SYEQYFGPGTRLTVT";
    EXPECT_TRUE(valid_j_anchor("ASSLGQGSYEQYF", region, 5, 7));
    EXPECT_FALSE(valid_j_anchor("ASSLGQGSYEQYL", region, 5, 7));
    EXPECT_TRUE(valid_j_anchor("ASSLGQGSYEQY", region, 5, 7));
    EXPECT_FALSE(valid_j_anchor("SYEQYF", region, 5, -6));
}

TEST(JAlignment, ScoreCountsMatchesAfterFirstMatch) {
    EXPECT_DOUBLE_EQ(score_j_alignment("XXSYEQYF", "SYEQYFGPG", 2, -1.5, 1), 6.0);
    EXPECT_DOUBLE_EQ(score_j_alignment("XXXX", "SYEQ", 0, -1.5, 1), -1.0);
}

TEST(JAlignment, MismatchLimitCutsAlignment) {
    // matches: + + - + - +
    EXPECT_DOUBLE_EQ(score_j_alignment("SYKYKF", "SYGYTF", 0, -1.5, 1), 0.5);
    EXPECT_DOUBLE_EQ(score_j_alignment("SYKYKF", "SYGYTF", 0, -1.5, 2), 1.0);
    EXPECT_DOUBLE_EQ(score_j_alignment("SYKYKF", "SYGYTF", 0, -1.5, -1), 1.0);
    EXPECT_DOUBLE_EQ(score_j_alignment("SYKYKF", "SYGYTF", 0, -1.5, 0), 1.0);
}

TEST(JAlignment, MismatchPenalty) {
    EXPECT_DOUBLE_EQ(score_j_alignment("SYKYKF", "SYGYTF", 0, -0.5, 2), 3.0);
}

TEST(VAlignment, ScoreCountsMatchesBeforeLastMatch) {
    EXPECT_DOUBLE_EQ(score_v_alignment("CASSLG", "YFCASSE", 2, -1.5, -1), 4.0);
    EXPECT_DOUBLE_EQ(score_v_alignment("CASSLG", "YFCASSE", 7, -1.5, -1), -1.0);
}

TEST(VAlignment, MismatchLimitAndPenalty) {
    EXPECT_DOUBLE_EQ(score_v_alignment("CASKLSE", "CASSLSE", 0, -1.5, -1), 4.5);
    EXPECT_DOUBLE_EQ(score_v_alignment("CASKLSE", "CASSLSE", 0, -0.5, -1), 5.5);
    EXPECT_DOUBLE_EQ(score_v_alignment("CASKLSE", "CASSLSE", 0, -1.5, 0), 3.0);
}

TEST(SelectReferences, IgVAnchorFallsBackToYC) {
    // FR3 of IGHV6-1*01 in the test data does not end in C
    const FamilyCatalog& catalog = *test_context().find("homosapiens", GeneFamily::IG);
    auto references = select_references(catalog, "IGH", 'V', "", true);
    ASSERT_EQ(references.size(), 1u);
    EXPECT_EQ(references[0].symbol, "IGHV6-1*01");
    EXPECT_EQ(references[0].anchor_index, references[0].region.size() - 3);
    EXPECT_EQ(references[0].region.substr(references[0].anchor_index), "CAR");
}

TEST(SelectReferences, FunctionalFilter) {
    const FamilyCatalog& catalog = *test_context().find("homosapiens", GeneFamily::TR);
    EXPECT_EQ(select_references(catalog, "TRG", 'V', "", false).size(), 2u);
    EXPECT_EQ(select_references(catalog, "TRG", 'J', "", false).size(), 2u);

    auto functional_v = select_references(catalog, "TRG", 'V', "", true);
    ASSERT_EQ(functional_v.size(), 1u);
    EXPECT_EQ(functional_v[0].symbol, "TRGV9*01");

    auto functional_j = select_references(catalog, "TRG", 'J', "", true);
    ASSERT_EQ(functional_j.size(), 1u);
    EXPECT_EQ(functional_j[0].symbol, "TRGJ1*01");
}

// ============================================================================
// Aligned standardization
// ============================================================================

class JunctionTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        set_log_level(LogLevel::ERROR);
    }

    JunctionResult standardize(const std::string& seq, const JunctionOptions& options) {
        return standardize_junction(test_context(), seq, options);
    }

    static JunctionOptions trb() {
        JunctionOptions options;
        options.locus = "TRB";
        options.log_failures = false;
        return options;
    }
};

TEST_F(JunctionTest, ValidJunctionUnchanged) {
    auto result = standardize("CASSLGQGSYEQYF", trb());
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.junction(), "CASSLGQGSYEQYF");
    EXPECT_EQ(result.cdr3(), "ASSLGQGSYEQY");
}

TEST_F(JunctionTest, CaseAndWhitespaceIgnored) {
    EXPECT_EQ(standardize(" cassLGQGSYEQYF", trb()).junction(), "CASSLGQGSYEQYF");
}

TEST_F(JunctionTest, Cdr3ExtendedToJunction) {
    auto result = standardize("ASSLGQGSYEQY", trb());
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.junction(), "CASSLGQGSYEQYF");
    EXPECT_EQ(result.original_input(), "ASSLGQGSYEQY");
}

TEST_F(JunctionTest, OverhangTrimmed) {
    EXPECT_EQ(standardize("CASSLGQGSYEQYFGP", trb()).junction(), "CASSLGQGSYEQYF");
    EXPECT_EQ(standardize("YFCASSLGQGSYEQYF", trb()).junction(), "CASSLGQGSYEQYF");
}

TEST_F(JunctionTest, TooShort) {
    auto result = standardize("CF", trb());
    ASSERT_TRUE(result.failed());
    EXPECT_NE(result.error()->find("J alignment unsuccessful"), std::string::npos);
    EXPECT_NE(result.error()->find("V alignment unsuccessful"), std::string::npos);
    EXPECT_NE(result.error()->find("junction too short"), std::string::npos);
}

TEST_F(JunctionTest, LeadingResidueNeedsCCorrection) {
    auto result = standardize("WASSLGQGSYEQYF", trb());
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "V alignment unsuccessful; V side reconstruction unsuccessful.");
    EXPECT_EQ(result.attempted_fix(), "WASSLGQGSYEQYF");

    JunctionOptions options = trb();
    options.allow_c_correction = true;
    EXPECT_EQ(standardize("WASSLGQGSYEQYF", options).junction(), "CASSLGQGSYEQYF");
}

TEST_F(JunctionTest, TerminalResidueCorrection) {
    JunctionOptions options = trb();
    options.allow_fw_correction = true;
    EXPECT_EQ(standardize("CASSLGQGSYEQYL", options).junction(), "CASSLGQGSYEQYF");
}

TEST_F(JunctionTest, UnknownJSymbol) {
    JunctionOptions options = trb();
    options.j_symbol = "TRBJ9-9*01";
    auto result = standardize("CASSLGQGSYEQYF", options);
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "no sequence information known for TRBJ9-9*01.");
}

TEST_F(JunctionTest, JSymbolSelectsTerminalResidue) {
    JunctionOptions options;
    options.locus = "TR";
    options.log_failures = false;

    options.j_symbol = "TRAJ38";
    EXPECT_EQ(standardize("CSADKLI", options).junction(), "CSADKLIW");

    options.j_symbol = "traj37";
    EXPECT_EQ(standardize("CSADKLI", options).junction(), "CSADKLIF");
}

TEST_F(JunctionTest, IgJunction) {
    JunctionOptions options;
    options.locus = "IGH";
    options.log_failures = false;
    EXPECT_EQ(standardize("CARGGYFDYW", options).junction(), "CARGGYFDYW");
}

// ============================================================================
// Ties and reconstruction
// ============================================================================

// TRGJ1 ends its anchor in F, TRGJ2 (ORF) in W; TRGV9 reads ...YYCASSQ and
// TRGV10 (ORF) ...YYCTSSE.

TEST_F(JunctionTest, TiedJCorrectionsAreAmbiguous) {
    JunctionOptions options;
    options.locus = "TRG";
    options.log_failures = false;

    auto result = standardize("CASSGYT", options);
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "J side reconstruction ambiguous.");
    EXPECT_EQ(result.attempted_fix(), "CASSGYT");

    options.j_symbol = "TRGJ1";
    EXPECT_EQ(standardize("CASSGYT", options).junction(), "CASSGYTF");
}

TEST_F(JunctionTest, EnforceFunctionalJ) {
    JunctionOptions options;
    options.locus = "TRG";
    options.log_failures = false;
    options.enforce_functional_j = true;
    EXPECT_EQ(standardize("CASSGYT", options).junction(), "CASSGYTF");
}

TEST_F(JunctionTest, VReconstructionNeedsPermission) {
    JunctionOptions options;
    options.locus = "TRG";
    options.log_failures = false;

    auto result = standardize("SSGYTF", options);
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "V side reconstruction unsuccessful.");
    EXPECT_EQ(result.attempted_fix(), "SSGYTF");

    options.allow_v_reconstruction = true;
    EXPECT_EQ(standardize("SSGYTF", options).junction(), "CASSGYTF");
}

TEST_F(JunctionTest, EnforceFunctionalV) {
    JunctionOptions options;
    options.locus = "TRG";
    options.log_failures = false;
    options.allow_v_reconstruction = true;
    options.enforce_functional_v = false;

    auto result = standardize("SSGYTF", options);
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "V side reconstruction ambiguous.");

    options.v_symbol = "TRGV10";
    EXPECT_EQ(standardize("SSGYTF", options).junction(), "CTSSGYTF");

    options.enforce_functional_v = true;
    EXPECT_EQ(standardize("SSGYTF", options).error(),
              "no sequence information known for TRGV10.");
}

// TRDJ1 anchors on F and TRDJ2 on a non-canonical L, two residues past the
// end of CVVSGY.

TEST_F(JunctionTest, JReconstructionNeedsPermission) {
    JunctionOptions options;
    options.locus = "TRD";
    options.log_failures = false;

    auto result = standardize("CVVSGY", options);
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "J side reconstruction unsuccessful.");

    options.allow_j_reconstruction = true;
    EXPECT_EQ(standardize("CVVSGY", options).junction(), "CVVSGYTF");
}

TEST_F(JunctionTest, CanonicalEndingPreferredWithoutJSymbol) {
    JunctionOptions options;
    options.locus = "TRD";
    options.log_failures = false;
    options.allow_j_reconstruction = true;

    EXPECT_EQ(standardize("CVVSGY", options).junction(), "CVVSGYTF");

    options.j_symbol = "TRDJ2";
    EXPECT_EQ(standardize("CVVSGY", options).junction(), "CVVSGYTL");
}

TEST_F(JunctionTest, InvalidLocusThrows) {
    JunctionOptions options;
    options.locus = "XYZ";
    EXPECT_THROW(standardize("CASSLGQGSYEQYF", options), std::invalid_argument);
}

TEST_F(JunctionTest, UnsupportedSpecies) {
    JunctionOptions options = trb();
    options.species = "danio rerio";
    auto result = standardize("CASSLGQGSYEQYF", options);
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "unsupported species: danio rerio.");
}

TEST_F(JunctionTest, InvalidAminoAcids) {
    auto result = standardize("123456", trb());
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "not a valid amino acid sequence, found: 123456.");
    EXPECT_FALSE(result.attempted_fix().has_value());
}

// ============================================================================
// Motif-only standardization
// ============================================================================

TEST_F(JunctionTest, MotifModeAddsConservedResidues) {
    JunctionOptions options;
    options.log_failures = false;

    EXPECT_EQ(standardize("sadaf", options).junction(), "CSADAFF");
    EXPECT_EQ(standardize("casqyf", options).junction(), "CASQYF");
    EXPECT_EQ(standardize("ASQY", options).junction(), "CASQYF");
    EXPECT_EQ(standardize("CASQY", options).junction(), "CCASQYF");
    EXPECT_EQ(standardize("ASQYF", options).junction(), "CASQYFF");
}

TEST_F(JunctionTest, MotifModeStrict) {
    JunctionOptions options;
    options.log_failures = false;
    options.strict = true;

    auto result = standardize("sadaf", options);
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "not a valid junction sequence.");
    EXPECT_EQ(result.attempted_fix(), "SADAF");

    EXPECT_TRUE(standardize("CASQYF", options).success());
}

// ============================================================================
// Options
// ============================================================================

TEST(JunctionOptionsConfig, FromConfigFile) {
    JunctionOptions options = JunctionOptions::from_config(
        load_config_file(std::string(TEST_DATA_DIR) + "/junction_options.conf"));
    EXPECT_EQ(options.locus, "TRB");
    EXPECT_TRUE(options.allow_c_correction);
    EXPECT_FALSE(options.allow_fw_correction);
    EXPECT_EQ(options.max_j_mismatches, 2);
    EXPECT_EQ(options.min_j_score, 3);
}

TEST(JunctionOptionsConfig, UnknownKeyThrows) {
    EXPECT_THROW(JunctionOptions::from_config({{"loci", "TRB"}}), std::invalid_argument);
    EXPECT_THROW(JunctionOptions::from_config({{"max_v_mismatches", "many"}}),
                 std::invalid_argument);
}

TEST_F(JunctionTest, RepeatedCallsAgree) {
    JunctionOptions options = trb();
    options.allow_fw_correction = true;

    auto first = standardize("ASSLGQGSYEQL", options);
    auto second = standardize("ASSLGQGSYEQL", options);
    EXPECT_EQ(first.success(), second.success());
    EXPECT_EQ(first.error(), second.error());
    EXPECT_EQ(first.junction(), second.junction());
    EXPECT_EQ(first.attempted_fix(), second.attempted_fix());
}
