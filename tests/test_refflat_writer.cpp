#include <catch2/catch_test_macros.hpp>

#include "gtf2refflat/refflat_writer.hpp"

#include <sstream>

using namespace gtf2refflat;

TEST_CASE("RefFlat finalize - independent sorting of starts and ends", "[refflat]") {
    TranscriptState state;
    state.gene_id = "G1";
    state.transcript_id = "T1";
    state.chrom = "chrX";
    state.strand = Strand::Minus;
    state.merge_interval("exon", 500, 600);
    state.merge_interval("exon", 100, 200);
    state.merge_interval("exon", 300, 400);

    auto row = RefFlatWriter::finalize(state);

    REQUIRE(row.exon_starts == std::vector<int64_t>{100, 300, 500});
    REQUIRE(row.exon_ends == std::vector<int64_t>{200, 400, 600});
    REQUIRE(row.tx_start == 100);
    REQUIRE(row.tx_end == 600);
    REQUIRE(row.exon_count() == 3);
    REQUIRE(row.to_string() ==
            "G1\tT1\tchrX\t-\t100\t600\t100\t600\t3\t100,300,500\t200,400,600");
}

TEST_CASE("RefFlat finalize - resolved CDS start returns to 0-based", "[refflat]") {
    TranscriptState state;
    state.transcript_id = "T1";
    state.strand = Strand::Plus;
    state.merge_interval("exon", 100, 200);
    state.cds_start = 121;
    state.cds_end = 180;

    auto row = RefFlatWriter::finalize(state);
    REQUIRE(row.cds_start == 120);
    REQUIRE(row.cds_end == 180);
}

TEST_CASE("RefFlat finalize - pending merge becomes the last exon", "[refflat]") {
    TranscriptState state;
    state.transcript_id = "T1";
    state.merge_interval("cds", 100, 150);

    auto row = RefFlatWriter::finalize(state);
    REQUIRE(row.exon_starts == std::vector<int64_t>{100});
    REQUIRE(row.exon_ends == std::vector<int64_t>{150});
}

TEST_CASE("RefFlat finalize - transcript without intervals", "[refflat]") {
    TranscriptState state;
    state.transcript_id = "T1";
    REQUIRE_THROWS_AS(RefFlatWriter::finalize(state), ConversionError);
}

TEST_CASE("RefFlat write - rows joined without trailing newline", "[refflat]") {
    RefFlatRow a{"G1", "T1", "chr1", Strand::Plus, 0, 10, 0, 10, {0}, {10}};
    RefFlatRow b{"G2", "T2", "chr2", Strand::Minus, 5, 50, 7, 40, {5, 30}, {20, 50}};

    std::ostringstream out;
    RefFlatWriter::write(out, {a, b});

    REQUIRE(out.str() ==
            "G1\tT1\tchr1\t+\t0\t10\t0\t10\t1\t0\t10\n"
            "G2\tT2\tchr2\t-\t5\t50\t7\t40\t2\t5,30\t20,50");

    std::ostringstream empty;
    RefFlatWriter::write(empty, {});
    REQUIRE(empty.str().empty());
}

TEST_CASE("RefFlat write - unwritable path", "[refflat]") {
    REQUIRE_THROWS_AS(RefFlatWriter::write("/nonexistent/dir/out.refflat", {}), IoError);
}
