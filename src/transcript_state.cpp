#include "gtf2refflat/transcript_state.hpp"

#include <algorithm>

namespace gtf2refflat {

TranscriptState::TranscriptState(const FeatureRecord& first)
    : gene_id(first.gene_id),
      transcript_id(first.transcript_id),
      chrom(first.contig),
      strand(first.strand) {}

void TranscriptState::add_feature(const FeatureRecord& feature) {
    gene_id = feature.gene_id;
    chrom = feature.contig;
    strand = feature.strand;
    type = feature.type;

    merge_interval(feature.type, feature.start, feature.end);
    update_cds(feature.type, feature.start, feature.end);
}

void TranscriptState::merge_interval(const std::string& feature_type, int64_t start, int64_t end) {
    if (feature_type == "exon") {
        // First exon: intervals merged from other features are superseded
        if (!has_exon_record) {
            exon_starts.clear();
            exon_ends.clear();
            running_merge.reset();
        }
        exon_starts.push_back(start);
        exon_ends.push_back(end);
        has_exon_record = true;
        return;
    }

    if (has_exon_record) return;

    if (!running_merge) {
        running_merge = std::make_pair(start, end);
        return;
    }

    auto& [merge_start, merge_end] = *running_merge;
    if (start <= merge_end || end <= merge_end) {
        // Overlapping or touching: extend the running interval
        merge_start = std::min(start, merge_start);
        merge_end = std::max(end, merge_end);
    } else {
        exon_starts.push_back(merge_start);
        exon_ends.push_back(merge_end);
        running_merge = std::make_pair(start, end);
    }
}

void TranscriptState::update_cds(const std::string& feature_type, int64_t start, int64_t end) {
    // On the minus strand the stop codon marks the CDS start
    const char* start_marker = strand == Strand::Plus ? "start_codon" : "stop_codon";
    const char* end_marker = strand == Strand::Plus ? "stop_codon" : "start_codon";

    if (feature_type == start_marker) {
        cds_start = start + 1;
    }
    if (feature_type == end_marker) {
        cds_end = end;
        stop_resolved = true;
    }

    if (feature_type == "cds") {
        if (!cds_start) {
            cds_start = start + 1;
        }
        if (!stop_resolved) {
            cds_end = end;
        }
    }
}

void TranscriptState::close_running_merge() {
    if (has_exon_record || !running_merge) return;

    exon_starts.push_back(running_merge->first);
    exon_ends.push_back(running_merge->second);
    running_merge.reset();
}

} // namespace gtf2refflat
