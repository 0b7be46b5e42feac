#include <catch2/catch_test_macros.hpp>

#include "gtf2refflat/transcript_state.hpp"

#include <vector>

using namespace gtf2refflat;

TEST_CASE("Interval merging - exon features", "[transcript_state]") {
    TranscriptState state;

    state.merge_interval("exon", 300, 400);
    state.merge_interval("exon", 100, 200);
    state.merge_interval("exon", 100, 200);  // duplicates are kept

    REQUIRE(state.has_exon_record);
    REQUIRE(state.exon_starts == std::vector<int64_t>{300, 100, 100});
    REQUIRE(state.exon_ends == std::vector<int64_t>{400, 200, 200});
}

TEST_CASE("Interval merging - non-exon features without exons", "[transcript_state]") {
    TranscriptState state;

    SECTION("Overlapping intervals extend the running merge") {
        state.merge_interval("cds", 100, 150);
        state.merge_interval("start_codon", 100, 103);
        state.merge_interval("utr", 140, 180);

        REQUIRE(state.exon_starts.empty());
        REQUIRE(state.running_merge.has_value());
        REQUIRE(state.running_merge->first == 100);
        REQUIRE(state.running_merge->second == 180);
    }

    SECTION("Touching intervals merge") {
        state.merge_interval("cds", 100, 150);
        state.merge_interval("cds", 150, 200);

        REQUIRE(state.exon_starts.empty());
        REQUIRE(state.running_merge->first == 100);
        REQUIRE(state.running_merge->second == 200);
    }

    SECTION("Disjoint intervals close the running merge") {
        state.merge_interval("cds", 100, 150);
        state.merge_interval("cds", 200, 250);
        state.merge_interval("stop_codon", 250, 253);

        REQUIRE(state.exon_starts == std::vector<int64_t>{100});
        REQUIRE(state.exon_ends == std::vector<int64_t>{150});
        REQUIRE(state.running_merge->first == 200);
        REQUIRE(state.running_merge->second == 253);

        state.close_running_merge();
        REQUIRE(state.exon_starts == std::vector<int64_t>{100, 200});
        REQUIRE(state.exon_ends == std::vector<int64_t>{150, 253});
        REQUIRE_FALSE(state.running_merge.has_value());
    }

    REQUIRE_FALSE(state.has_exon_record);
    REQUIRE(state.exon_starts.size() == state.exon_ends.size());
}

TEST_CASE("Interval merging - exon supersedes merged intervals", "[transcript_state]") {
    TranscriptState state;

    state.merge_interval("cds", 100, 150);
    state.merge_interval("cds", 200, 250);
    state.merge_interval("cds", 300, 350);
    state.merge_interval("exon", 90, 160);
    state.merge_interval("cds", 500, 600);  // ignored once exons exist

    REQUIRE(state.has_exon_record);
    REQUIRE(state.exon_starts == std::vector<int64_t>{90});
    REQUIRE(state.exon_ends == std::vector<int64_t>{160});

    state.close_running_merge();
    REQUIRE(state.exon_starts.size() == 1);
}

TEST_CASE("CDS resolution - plus strand", "[transcript_state][cds]") {
    TranscriptState state;
    state.strand = Strand::Plus;

    SECTION("Codons") {
        state.update_cds("start_codon", 100, 103);
        state.update_cds("stop_codon", 197, 200);

        REQUIRE(*state.cds_start == 101);
        REQUIRE(*state.cds_end == 200);
        REQUIRE(state.stop_resolved);
    }

    SECTION("CDS features only: last CDS end wins") {
        state.update_cds("cds", 100, 150);
        state.update_cds("cds", 200, 250);

        REQUIRE(*state.cds_start == 101);
        REQUIRE(*state.cds_end == 250);
        REQUIRE_FALSE(state.stop_resolved);
    }

    SECTION("Stop codon fixes the CDS end") {
        state.update_cds("cds", 100, 150);
        state.update_cds("stop_codon", 150, 153);
        state.update_cds("cds", 200, 250);

        REQUIRE(*state.cds_start == 101);
        REQUIRE(*state.cds_end == 153);
    }

    SECTION("Non-coding features leave CDS unresolved") {
        state.update_cds("exon", 100, 150);
        REQUIRE_FALSE(state.cds_start.has_value());
        REQUIRE_FALSE(state.cds_end.has_value());
    }
}

TEST_CASE("CDS resolution - minus strand", "[transcript_state][cds]") {
    TranscriptState state;
    state.strand = Strand::Minus;

    state.update_cds("stop_codon", 100, 103);
    state.update_cds("cds", 103, 180);
    state.update_cds("start_codon", 177, 180);
    state.update_cds("cds", 250, 300);

    REQUIRE(*state.cds_start == 101);
    REQUIRE(*state.cds_end == 180);
    REQUIRE(state.stop_resolved);
}

TEST_CASE("Transcript state - add_feature records identity", "[transcript_state]") {
    FeatureRecord exon{"chr3", 10, 20, Strand::Minus, "exon", "G7", "T7"};
    TranscriptState state(exon);
    state.add_feature(exon);

    REQUIRE(state.transcript_id == "T7");
    REQUIRE(state.gene_id == "G7");
    REQUIRE(state.chrom == "chr3");
    REQUIRE(state.strand == Strand::Minus);
    REQUIRE(state.type == "exon");
    REQUIRE(state.exon_starts == std::vector<int64_t>{10});
}
