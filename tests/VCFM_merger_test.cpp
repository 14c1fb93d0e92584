#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <zlib.h>
#include "../src/VCFM_merger/VCFM_merger.h"

namespace {

const char *VCF_A = "##fileformat=VCFv4.2\n"
                    "##source=lumpy\n"
                    "##INFO=<ID=SVTYPE,Number=1,Type=String,Description=\"Type of structural variant\">\n"
                    "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n"
                    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\tS2\tS3\n"
                    "chr1\t100\t.\tA\tT\t.\t.\t.\tGT\t0/0\t0/1\t./.\n";

const char *VCF_B = "##fileformat=VCFv4.2\n"
                    "##source=GATK\n"
                    "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n"
                    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS2\tS3\n"
                    "chr1\t100\t.\tA\tT\t.\t.\t.\tGT\t0/1\t1/1\n";

const char *MERGED_HEADER = "##fileformat=VCFv4.1\n"
                            "##source=lumpy\n"
                            "##source=GATK\n"
                            "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n"
                            "##INFO=<ID=SVTYPE,Number=1,Type=String,Description=\"Type of structural variant\">\n"
                            "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS2\tS3\n";

void writeGzip(const std::string &path, const std::string &text) {
    gzFile gz = gzopen(path.c_str(), "wb");
    ASSERT_NE(gz, nullptr);
    ASSERT_EQ(gzwrite(gz, text.data(), static_cast<unsigned>(text.size())), static_cast<int>(text.size()));
    ASSERT_EQ(gzclose(gz), Z_OK);
}

} // namespace

class MergerTest : public ::testing::Test {
  protected:
    MergeSummary merge(const std::string &a, const std::string &b, bool removeRef) {
        inA.str(a);
        inB.str(b);
        vcfm::ReaderLineSource srcA(inA);
        vcfm::ReaderLineSource srcB(inB);
        return VCFMMerger::mergeSources(srcA, srcB, "a.vcf", "b.vcf", removeRef, output, diag);
    }

    std::istringstream inA;
    std::istringstream inB;
    std::ostringstream output;
    std::ostringstream diag;
};

TEST_F(MergerTest, SharedSamplesWithRankTieBreak) {
    MergeSummary s = merge(VCF_A, VCF_B, false);

    EXPECT_EQ(output.str(), std::string(MERGED_HEADER) + "chr1\t100\t.\tA\tT\t.\t.\t.\tGT\t0/1\t./.\n"
                                                         "chr1\t100\t.\tA\tT\t.\t.\t.\tGT\t0/1\t1/1\n");
    EXPECT_EQ(s.records, 2u);
    EXPECT_EQ(s.conflicts, 0u);
    EXPECT_EQ(diag.str(), "");
}

TEST_F(MergerTest, RemoveRefDropsAllRefRecord) {
    std::string a = std::string(VCF_A) + "chr1\t200\t.\tG\tC\t.\t.\t.\tGT\t1/1\t0/0\t0|0\n";
    MergeSummary s = merge(a, VCF_B, true);

    EXPECT_EQ(s.records, 2u);
    EXPECT_EQ(s.totalA, 2u);
    EXPECT_EQ(s.skippedA, 1u);
    EXPECT_EQ(s.skippedB, 0u);
    EXPECT_EQ(output.str().find("chr1\t200"), std::string::npos);
    EXPECT_NE(diag.str().find(">> skipped 1 ref/unknown variants out of 2 from a.vcf\n"), std::string::npos);
    EXPECT_NE(diag.str().find(">> skipped 0 ref/unknown variants out of 1 from b.vcf\n"), std::string::npos);
}

TEST_F(MergerTest, MergesAcrossChromosomesInOrder) {
    std::string a = "##fileformat=VCFv4.2\n"
                    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\n"
                    "chr1\t10\t.\tN\t<DEL>\t.\t.\t.\tGT\t0/1\n"
                    "chr2\t10\t.\tA\tC\t.\t.\t.\tGT\t0/1\n";
    std::string b = "##fileformat=VCFv4.2\n"
                    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\n"
                    "chr1\t5\t.\tA\tC\t.\t.\t.\tGT\t1/1\n"
                    "chr1\t20\t.\tA\tC\t.\t.\t.\tGT\t1/1\n"
                    "chr2\t30\t.\tA\tC\t.\t.\t.\tGT\t1/1\n";
    merge(a, b, false);

    std::istringstream out(output.str());
    std::string line;
    std::vector<std::string> body;
    while (std::getline(out, line)) {
        if (line[0] != '#')
            body.push_back(line.substr(0, line.find('\t', line.find('\t') + 1)));
    }
    EXPECT_EQ(body, (std::vector<std::string>{"chr1\t5", "chr1\t10", "chr1\t20", "chr2\t10", "chr2\t30"}));
    EXPECT_NE(output.str().find("chr1\t10\t.\t.\t<DEL>"), std::string::npos);
}

TEST_F(MergerTest, ConflictsReportedOnDiagnostics) {
    std::string b = "##fileformat=VCFv4.2\n"
                    "##INFO=<ID=SVTYPE,Number=1,Type=Float,Description=\"Type of structural variant\">\n"
                    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS3\n";
    MergeSummary s = merge(VCF_A, b, false);
    EXPECT_EQ(s.conflicts, 1u);
    EXPECT_NE(diag.str().find("Warning: differing headers for SVTYPE"), std::string::npos);
    EXPECT_NE(output.str().find("Type=Float"), std::string::npos);
    EXPECT_EQ(output.str().find("Type=String,Description=\"Type"), std::string::npos);
}

TEST_F(MergerTest, MalformedHeaderThrows) {
    std::string bad = "##fileformat=VCFv4.2\n##FILTER=<Description=\"x\">\n";
    EXPECT_THROW(merge(bad, VCF_B, false), vcfm::ParseError);
}

TEST_F(MergerTest, ShortRowInUnsharedSampleThrows) {
    std::string a = "##fileformat=VCFv4.2\n"
                    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\tS2\n"
                    "chr1\t100\t.\tA\tT\t.\t.\t.\tGT\t0/1\n";
    std::string b = "##fileformat=VCFv4.2\n"
                    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\n"
                    "chr1\t200\t.\tA\tT\t.\t.\t.\tGT\t1/1\n";
    EXPECT_THROW(merge(a, b, false), vcfm::ParseError);
}

TEST(MergerFileTest,MergesCompressedAndPlainFiles) {
    std::string pathA = ::testing::TempDir() + "vcfm_merger_a.vcf.gz";
    std::string pathB = ::testing::TempDir() + "vcfm_merger_b.vcf";
    writeGzip(pathA, VCF_A);
    {
        std::ofstream b(pathB);
        b << VCF_B;
    }

    MergeOptions opts;
    opts.pathA = pathA;
    opts.pathB = pathB;
    std::ostringstream out, diag;
    MergeSummary s = VCFMMerger::mergeFiles(opts, out, diag);

    EXPECT_EQ(s.records, 2u);
    EXPECT_EQ(out.str().rfind(MERGED_HEADER, 0), 0u);
}

TEST(MergerArgsTest, ParsesOptionsAndPaths) {
    VCFMMerger merger;
    MergeOptions opts;
    bool showHelp = false;

    const char *args[] = {"VCFM_merger", "--remove-ref", "a.vcf", "b.vcf.gz"};
    ASSERT_TRUE(merger.parseArguments(4, const_cast<char **>(args), opts, showHelp));
    EXPECT_FALSE(showHelp);
    EXPECT_TRUE(opts.removeRef);
    EXPECT_EQ(opts.pathA, "a.vcf");
    EXPECT_EQ(opts.pathB, "b.vcf.gz");

    MergeOptions one;
    const char *oneArg[] = {"VCFM_merger", "a.vcf"};
    EXPECT_FALSE(merger.parseArguments(2, const_cast<char **>(oneArg), one, showHelp));

    MergeOptions stdinTwice;
    const char *dashes[] = {"VCFM_merger", "-", "-"};
    EXPECT_FALSE(merger.parseArguments(3, const_cast<char **>(dashes), stdinTwice, showHelp));

    MergeOptions help;
    const char *helpArgs[] = {"VCFM_merger", "-h"};
    EXPECT_TRUE(merger.parseArguments(2, const_cast<char **>(helpArgs), help, showHelp));
    EXPECT_TRUE(showHelp);
}

TEST(MergerArgsTest, MissingInputFails) {
    VCFMMerger merger;
    const char *args[] = {"VCFM_merger", "/nonexistent/a.vcf", "/nonexistent/b.vcf"};
    EXPECT_EQ(merger.run(3, const_cast<char **>(args)), 1);
}
