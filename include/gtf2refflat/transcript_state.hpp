#pragma once

#include "feature_stream.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gtf2refflat {

/**
 * Accumulated structure of the transcript currently being read.
 *
 * exon_starts and exon_ends always have equal length. Once an "exon" feature
 * has been seen, non-exon features no longer contribute intervals.
 */
struct TranscriptState {
    std::string gene_id;
    std::string transcript_id;
    std::string chrom;
    Strand strand = Strand::Unknown;
    std::string type;           // Type of the most recent feature

    std::vector<int64_t> exon_starts;
    std::vector<int64_t> exon_ends;

    // 1-based CDS start and CDS end, as collected from codon/CDS features
    std::optional<int64_t> cds_start;
    std::optional<int64_t> cds_end;
    bool stop_resolved = false;

    bool has_exon_record = false;

    // Merge of non-exon intervals, used while has_exon_record is false
    std::optional<std::pair<int64_t, int64_t>> running_merge;

    TranscriptState() = default;
    explicit TranscriptState(const FeatureRecord& first);

    // Record the feature's identity fields and fold it into intervals and CDS
    void add_feature(const FeatureRecord& feature);

    // Build the exon lists from exon features, or merge non-exon features
    // into disjoint intervals when the transcript has no exon features
    void merge_interval(const std::string& feature_type, int64_t start, int64_t end);

    // Strand-aware CDS bounds from start_codon, stop_codon and cds features
    void update_cds(const std::string& feature_type, int64_t start, int64_t end);

    // Move a pending running merge into the exon lists
    void close_running_merge();
};

} // namespace gtf2refflat
