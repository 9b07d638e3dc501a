/**
 * Tests for TR symbol standardization against the test catalogs.
 */

#include <gtest/gtest.h>
#include "symbol_standardizer.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace immunorm;

class TrSymbolTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        set_log_level(LogLevel::ERROR);
    }

    static const ReferenceContext& context() {
        static const ReferenceContext loaded = ReferenceContext::load(TEST_DATA_DIR);
        return loaded;
    }

    StandardizationResult standardize(const std::string& symbol,
                                      const SymbolOptions& options = SymbolOptions(),
                                      const std::string& species = "homosapiens") {
        return standardize_symbol(context(), symbol, GeneFamily::TR, species, options);
    }

    static SymbolOptions enforced() {
        SymbolOptions options;
        options.enforce_functional = true;
        return options;
    }
};

// ============================================================================
// Already valid symbols
// ============================================================================

TEST_F(TrSymbolTest, ValidGene) {
    auto result = standardize("TRBV2");
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.gene(), "TRBV2");
    EXPECT_FALSE(result.allele().has_value());
}

TEST_F(TrSymbolTest, ValidAlleleWithSubgroup) {
    auto result = standardize("TRAV38-1*01");
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.allele(), "TRAV38-1*01");
    EXPECT_EQ(result.gene(), "TRAV38-1");
    EXPECT_EQ(result.subgroup(), "TRAV38");
}

TEST_F(TrSymbolTest, ShortAlleleDesignationPadded) {
    auto result = standardize("trbj2-7*2");
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.allele(), "TRBJ2-7*02");
}

// ============================================================================
// Resolution
// ============================================================================

TEST_F(TrSymbolTest, MissingPrefix) {
    EXPECT_EQ(standardize("aj1").gene(), "TRAJ1");
}

TEST_F(TrSymbolTest, DeprecatedSymbol) {
    EXPECT_EQ(standardize("TCRAV32S1").gene(), "TRAV25");
    EXPECT_EQ(standardize("TCRAV14S2").gene(), "TRAV38-1");
    EXPECT_EQ(standardize("TCRBV21S1").gene(), "TRBV11-1");
}

TEST_F(TrSymbolTest, DvDesignation) {
    EXPECT_EQ(standardize("TCRAV14/4").gene(), "TRAV14/DV4");
    EXPECT_EQ(standardize("TRDV4").gene(), "TRAV14/DV4");
    EXPECT_EQ(standardize("TRAV14").gene(), "TRAV14/DV4");
    EXPECT_EQ(standardize("TRAV14DV4").gene(), "TRAV14/DV4");
    EXPECT_EQ(standardize("29/DV5*01").allele(), "TRAV29/DV5*01");
}

TEST_F(TrSymbolTest, OrphonSlash) {
    EXPECT_EQ(standardize("TRBV20OR9-2").gene(), "TRBV20/OR9-2");
}

TEST_F(TrSymbolTest, LeadingZerosAndDash1) {
    EXPECT_EQ(standardize("TCRDV01-01*01").allele(), "TRDV1*01");
    EXPECT_EQ(standardize("TCRAV30-1").gene(), "TRAV30");
    EXPECT_EQ(standardize("TCRAV36-01*01").allele(), "TRAV36/DV7*01");
}

TEST_F(TrSymbolTest, PollutedInput) {
    EXPECT_EQ(standardize(" TRAV1&nbsp;-2 ").gene(), "TRAV1-2");
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(TrSymbolTest, UnrecognizedGene) {
    auto result = standardize("foobarbaz");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "unrecognized gene name");
    EXPECT_EQ(result.attempted_fix(), "FOOBARBAZ");
}

TEST_F(TrSymbolTest, AttemptedFixKeepsNormalizingSteps) {
    auto result = standardize("TRAV3D-3*01");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "unrecognized gene name");
    EXPECT_EQ(result.attempted_fix(), "TRAV3D-3*01");
}

TEST_F(TrSymbolTest, NonexistentAllele) {
    auto result = standardize("TRAV16*09");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "nonexistent allele for recognized gene");
    EXPECT_EQ(result.attempted_fix(), "TRAV16*09");
}

TEST_F(TrSymbolTest, SubgroupWithDash1GeneResolvesToGene) {
    EXPECT_EQ(standardize("TRAV38").gene(), "TRAV38-1");
}

TEST_F(TrSymbolTest, SubgroupRejectedByDefault) {
    auto result = standardize("TRAV13");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "is subgroup");
}

TEST_F(TrSymbolTest, SubgroupAcceptedWhenAllowed) {
    SymbolOptions options;
    options.allow_subgroup = true;
    auto result = standardize("TRAV13", options);
    ASSERT_TRUE(result.success());
    EXPECT_FALSE(result.gene().has_value());
    EXPECT_EQ(result.subgroup(), "TRAV13");
    EXPECT_EQ(result.highest_precision(), "TRAV13");
}

// ============================================================================
// Functionality
// ============================================================================

TEST_F(TrSymbolTest, PseudogeneAcceptedWithoutEnforcement) {
    EXPECT_TRUE(standardize("TRBV1").success());
    EXPECT_TRUE(standardize("TRAV35*03").success());
}

TEST_F(TrSymbolTest, EnforcedFunctionalityRejectsPseudogenes) {
    auto gene = standardize("TRBV1", enforced());
    ASSERT_TRUE(gene.failed());
    EXPECT_EQ(gene.error(), "gene has no functional alleles");
    EXPECT_EQ(gene.attempted_fix(), "TRBV1");

    auto allele = standardize("TRAV35*03", enforced());
    ASSERT_TRUE(allele.failed());
    EXPECT_EQ(allele.error(), "nonfunctional allele");

    EXPECT_TRUE(standardize("TRAV35*01", enforced()).success());
    EXPECT_TRUE(standardize("TRAV35", enforced()).success());
}

TEST_F(TrSymbolTest, OrfIsNotFunctional) {
    auto result = standardize("TRBJ2-7*02", enforced());
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "nonfunctional allele");
}

// ============================================================================
// Species
// ============================================================================

TEST_F(TrSymbolTest, MouseCatalog) {
    auto result = standardize("TRAV15-1/DV6-1*01", SymbolOptions(), "Mus musculus");
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.allele(), "TRAV15-1/DV6-1*01");
}

TEST_F(TrSymbolTest, AnySpeciesTriesEachCatalog) {
    EXPECT_TRUE(standardize("TRAV15-1/DV6-1", SymbolOptions(), "any").success());
    EXPECT_EQ(standardize("TCRAV32S1", SymbolOptions(), "any").gene(), "TRAV25");

    auto result = standardize("foobarbaz", SymbolOptions(), "any");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.attempted_fix(), "FOOBARBAZ");
}

TEST_F(TrSymbolTest, UnsupportedSpecies) {
    auto result = standardize("TRBV2", SymbolOptions(), "danio rerio");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error(), "unsupported species: daniorerio");
    EXPECT_EQ(result.attempted_fix(), "TRBV2");
}

// ============================================================================
// Shared catalogs
// ============================================================================

TEST_F(TrSymbolTest, ConcurrentFailuresAreLogged) {
    const ReferenceContext& catalogs = context();
    set_log_level(LogLevel::WARNING);

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&catalogs, &failures]() {
            for (int i = 0; i < 25; ++i) {
                auto result = standardize_symbol(catalogs, "foobarbaz", GeneFamily::TR,
                                                 "homosapiens");
                if (result.failed() && result.error() == "unrecognized gene name") failures++;
            }
        });
    }
    for (auto& worker : workers) worker.join();
    set_log_level(LogLevel::ERROR);

    EXPECT_EQ(failures.load(), 100);
}

// ============================================================================
// Options
// ============================================================================

TEST(SymbolOptionsConfig, FromConfig) {
    SymbolOptions options = SymbolOptions::from_config(
        {{"enforce_functional", "yes"}, {"log_failures", "false"}});
    EXPECT_TRUE(options.enforce_functional);
    EXPECT_FALSE(options.allow_subgroup);
    EXPECT_FALSE(options.log_failures);
}

TEST(SymbolOptionsConfig, UnknownKeyThrows) {
    EXPECT_THROW(SymbolOptions::from_config({{"enforce", "true"}}), std::invalid_argument);
    EXPECT_THROW(SymbolOptions::from_config({{"allow_subgroup", "sometimes"}}),
                 std::invalid_argument);
}
