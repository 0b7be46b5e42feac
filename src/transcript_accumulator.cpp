#include "gtf2refflat/transcript_accumulator.hpp"

#include <iostream>

namespace gtf2refflat {

void TranscriptAccumulator::process_feature(const FeatureRecord& feature) {
    ++total_features_;

    if (ignored_ids_.count(feature.transcript_id)) {
        ++ignored_features_;
        return;
    }

    if (live_ && live_->transcript_id != feature.transcript_id) {
        complete_live();
    } else if (live_ && live_->strand != feature.strand) {
        std::cerr << "Warning: all group members must be on the same strand; dropping transcript "
                  << feature.transcript_id << " (" << feature.contig << ":" << feature.start
                  << "-" << feature.end << " is on " << to_char(feature.strand)
                  << ", transcript is on " << to_char(live_->strand) << ")\n";
        ++strand_conflicts_;
        ++ignored_features_;
        ignored_ids_.insert(feature.transcript_id);
        live_.reset();
        return;
    }

    if (!live_) {
        live_.emplace(feature);
    }
    live_->add_feature(feature);
}

std::vector<RefFlatRow> TranscriptAccumulator::get_completed_rows() {
    std::vector<RefFlatRow> rows = std::move(completed_);
    completed_.clear();
    return rows;
}

std::vector<RefFlatRow> TranscriptAccumulator::flush() {
    if (live_) {
        complete_live();
    }
    return get_completed_rows();
}

void TranscriptAccumulator::complete_live() {
    TranscriptState state = std::move(*live_);
    live_.reset();
    completed_.push_back(RefFlatWriter::finalize(std::move(state)));
    ++rows_emitted_;
}

} // namespace gtf2refflat
