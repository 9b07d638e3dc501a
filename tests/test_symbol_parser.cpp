/**
 * Tests for symbol_parser.hpp: cleaning, field padding and the three
 * symbol grammars.
 */

#include <gtest/gtest.h>
#include "symbol_parser.hpp"

using namespace immunorm;

// ============================================================================
// Cleaning and padding
// ============================================================================

TEST(CleanSymbol, UppercasesAndRemovesWhitespace) {
    EXPECT_EQ(clean_symbol(" trav 1-2 *01 "), "TRAV1-2*01");
    EXPECT_EQ(clean_symbol("hla-a\t*02:01"), "HLA-A*02:01");
}

TEST(CleanSymbol, RemovesMarkupPollutants) {
    EXPECT_EQ(clean_symbol("TRAV1&nbsp;-2"), "TRAV1-2");
    EXPECT_EQ(clean_symbol("TRAV1&ndash;2"), "TRAV1-2");
    EXPECT_EQ(clean_symbol("TRAV1\xE2\x80\x93" "2"), "TRAV1-2");
}

TEST(PadNumericField, PadsAndTrims) {
    EXPECT_EQ(pad_numeric_field("1"), "01");
    EXPECT_EQ(pad_numeric_field("001"), "01");
    EXPECT_EQ(pad_numeric_field("123"), "123");
    EXPECT_EQ(pad_numeric_field("1", 3), "001");
    EXPECT_EQ(pad_numeric_field("04P"), "04P");
}

TEST(IsAllDigits, Basic) {
    EXPECT_TRUE(is_all_digits("0123"));
    EXPECT_FALSE(is_all_digits(""));
    EXPECT_FALSE(is_all_digits("01N"));
}

TEST(JoinSymbol, RendersFields) {
    EXPECT_EQ(join_symbol("HLA-A", {"02", "01"}, ':'), "HLA-A*02:01");
    EXPECT_EQ(join_symbol("TRBV2", {"01"}, ':'), "TRBV2*01");
    EXPECT_EQ(join_symbol("TRBV2", {}, ':'), "TRBV2");
}

// ============================================================================
// Receptor grammar
// ============================================================================

TEST(ParseReceptorSymbol, GeneAndAllele) {
    ParsedSymbol parsed = parse_receptor_symbol("TRAV14/DV4*1");
    EXPECT_EQ(parsed.gene, "TRAV14/DV4");
    ASSERT_EQ(parsed.fields.size(), 1u);
    EXPECT_EQ(parsed.fields[0], "01");
}

TEST(ParseReceptorSymbol, GeneOnly) {
    ParsedSymbol parsed = parse_receptor_symbol("TRBV20/OR9-2");
    EXPECT_EQ(parsed.gene, "TRBV20/OR9-2");
    EXPECT_FALSE(parsed.has_allele());
}

TEST(ParseReceptorSymbol, TrailingJunkDropped) {
    ParsedSymbol parsed = parse_receptor_symbol("TRBV2*01_X");
    EXPECT_EQ(parsed, (ParsedSymbol{"TRBV2", {"01"}}));
}

TEST(ParseReceptorSymbol, UnmatchedInputBecomesGene) {
    ParsedSymbol parsed = parse_receptor_symbol("*01");
    EXPECT_EQ(parsed.gene, "*01");
    EXPECT_FALSE(parsed.has_allele());
}

// ============================================================================
// IG grammar
// ============================================================================

TEST(ParseIgSymbol, OrphonSuffixKeptLowercase) {
    ParsedSymbol parsed = parse_ig_symbol("IGHD1/OR15-1A*01");
    EXPECT_EQ(parsed.gene, "IGHD1/OR15-1a");
    ASSERT_EQ(parsed.fields.size(), 1u);
    EXPECT_EQ(parsed.fields[0], "01");
}

TEST(ParseIgSymbol, Parentheses) {
    ParsedSymbol parsed = parse_ig_symbol("IGLV(VI)-22-1");
    EXPECT_EQ(parsed.gene, "IGLV(VI)-22-1");
}

// ============================================================================
// HLA grammar
// ============================================================================

TEST(ParseHlaSymbol, FourFieldAllele) {
    ParsedSymbol parsed = parse_hla_symbol("HLA-A*02:01:01:01");
    EXPECT_EQ(parsed.gene, "HLA-A");
    EXPECT_EQ(parsed.fields, (std::vector<std::string>{"02", "01", "01", "01"}));
}

TEST(ParseHlaSymbol, ExpressionQualifierDropped) {
    ParsedSymbol parsed = parse_hla_symbol("HLA-A*24:09N");
    EXPECT_EQ(parsed.gene, "HLA-A");
    EXPECT_EQ(parsed.fields, (std::vector<std::string>{"24", "09"}));
}

TEST(ParseHlaSymbol, GroupSuffixKept) {
    ParsedSymbol parsed = parse_hla_symbol("HLA-DRB3*03:04P");
    EXPECT_EQ(parsed.gene, "HLA-DRB3");
    EXPECT_EQ(parsed.fields, (std::vector<std::string>{"03", "04P"}));
}

TEST(ParseHlaSymbol, ClassTwoWithoutAsterisk) {
    ParsedSymbol parsed = parse_hla_symbol("DQB103:01");
    EXPECT_EQ(parsed.gene, "DQB1");
    EXPECT_EQ(parsed.fields, (std::vector<std::string>{"03", "01"}));
}

TEST(ParseHlaSymbol, PeriodsBetweenDigitsAreColons) {
    ParsedSymbol parsed = parse_hla_symbol("HLA-B*35.3");
    EXPECT_EQ(parsed.gene, "HLA-B");
    EXPECT_EQ(parsed.fields, (std::vector<std::string>{"35", "03"}));
}

TEST(ParseHlaSymbol, B2M) {
    ParsedSymbol parsed = parse_hla_symbol("B2M");
    EXPECT_EQ(parsed.gene, "B2M");
    EXPECT_FALSE(parsed.has_allele());
}
