/**
 * Tests for file_parsers.hpp: line splitting, LineReader over plain and
 * gzip files, option strings and config files.
 */

#include <gtest/gtest.h>
#include "file_parsers.hpp"

#include <fstream>
#include <filesystem>
#include <zlib.h>

using namespace immunorm;

namespace {

// RAII temp file cleanup
class TempFile {
public:
    TempFile(const std::string& suffix = ".txt") {
        path_ = std::filesystem::temp_directory_path() /
                ("test_file_parsers_" + std::to_string(counter_++) + suffix);
    }
    ~TempFile() {
        std::filesystem::remove(path_);
    }
    std::string path() const { return path_.string(); }
private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

} // namespace

// ============================================================================
// Utility functions
// ============================================================================

TEST(SplitLine, KeepsEmptyFields) {
    auto fields = split_line("a\t\tb\t", '\t');
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "");
    EXPECT_EQ(fields[2], "b");
    EXPECT_EQ(fields[3], "");
}

TEST(SplitLine, NoDelimiter) {
    auto fields = split_line("TRAV1-1", '\t');
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields[0], "TRAV1-1");
}

TEST(Trim, StripsWhitespace) {
    EXPECT_EQ(trim("  TRBV2 \t\r\n"), "TRBV2");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(JoinPath, SingleSeparator) {
    EXPECT_EQ(join_path("data", "x.tsv"), "data/x.tsv");
    EXPECT_EQ(join_path("data/", "x.tsv"), "data/x.tsv");
    EXPECT_EQ(join_path("", "x.tsv"), "x.tsv");
}

// ============================================================================
// LineReader
// ============================================================================

TEST(LineReader, ReadsPlainFile) {
    TempFile tmp(".tsv");
    {
        std::ofstream out(tmp.path());
        out << "first\r\nsecond\n\nlast";
    }

    LineReader reader(tmp.path());
    std::string line;
    std::vector<std::string> lines;
    while (reader.next(line)) lines.push_back(line);

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "last");
    EXPECT_EQ(reader.line_number(), 4u);
}

TEST(LineReader, ReadsGzipFile) {
    TempFile tmp(".tsv.gz");
    {
        gzFile gz = gzopen(tmp.path().c_str(), "wb");
        ASSERT_NE(gz, nullptr);
        const std::string content = "TRBV2\t01\tF\nTRBV1\t01\tP\n";
        gzwrite(gz, content.c_str(), static_cast<unsigned int>(content.size()));
        gzclose(gz);
    }

    LineReader reader(tmp.path());
    std::string line;
    ASSERT_TRUE(reader.next(line));
    EXPECT_EQ(line, "TRBV2\t01\tF");
    ASSERT_TRUE(reader.next(line));
    EXPECT_EQ(line, "TRBV1\t01\tP");
    EXPECT_FALSE(reader.next(line));
}

TEST(LineReader, MissingFileThrows) {
    EXPECT_THROW(LineReader("/nonexistent/immunorm/catalog.tsv"), std::runtime_error);
}

// ============================================================================
// Options
// ============================================================================

TEST(OptionString, ParsesPairs) {
    auto options = parse_option_string("locus=TRB; allow_c_correction = true ;");
    ASSERT_EQ(options.size(), 2u);
    EXPECT_EQ(options["locus"], "TRB");
    EXPECT_EQ(options["allow_c_correction"], "true");
}

TEST(OptionString, EmptyStringGivesNoOptions) {
    EXPECT_TRUE(parse_option_string("").empty());
}

TEST(OptionString, PairWithoutEqualsThrows) {
    EXPECT_THROW(parse_option_string("locus=TRB;strict"), std::invalid_argument);
    EXPECT_THROW(parse_option_string("=TRB"), std::invalid_argument);
}

TEST(ConfigFile, SkipsCommentsAndBlankLines) {
    auto config = load_config_file(std::string(TEST_DATA_DIR) + "/junction_options.conf");
    ASSERT_EQ(config.size(), 3u);
    EXPECT_EQ(config["locus"], "TRB");
    EXPECT_EQ(config["allow_c_correction"], "true");
    EXPECT_EQ(config["max_j_mismatches"], "2");
}

TEST(ConfigFile, MissingFileThrows) {
    EXPECT_THROW(load_config_file("/nonexistent/immunorm.conf"), std::runtime_error);
}

TEST(OptionValues, Booleans) {
    EXPECT_TRUE(parse_bool_option("strict", "true"));
    EXPECT_TRUE(parse_bool_option("strict", "YES"));
    EXPECT_TRUE(parse_bool_option("strict", "1"));
    EXPECT_FALSE(parse_bool_option("strict", "False"));
    EXPECT_FALSE(parse_bool_option("strict", "no"));
    EXPECT_THROW(parse_bool_option("strict", "maybe"), std::invalid_argument);
}

TEST(OptionValues, Numbers) {
    EXPECT_DOUBLE_EQ(parse_double_option("mismatch_penalty", "-2.5"), -2.5);
    EXPECT_EQ(parse_int_option("min_j_score", "4"), 4);
    EXPECT_THROW(parse_int_option("min_j_score", "4x"), std::invalid_argument);
    EXPECT_THROW(parse_double_option("mismatch_penalty", "abc"), std::invalid_argument);
}
