#pragma once

#include "gtf2refflat/feature_stream.hpp"
#include "gtf2refflat/refflat_writer.hpp"
#include "gtf2refflat/transcript_state.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace gtf2refflat {

/**
 * Groups a stream of features into transcripts and emits one RefFlat row
 * per transcript.
 *
 * Features of one transcript must arrive contiguously. A transcript is
 * complete as soon as a feature with a different transcript_id arrives.
 * A transcript whose features disagree on strand is dropped, and every later
 * feature carrying its transcript_id is ignored.
 *
 * Memory usage: O(E) where E = exon count of the live transcript
 */
class TranscriptAccumulator {
public:
    TranscriptAccumulator() = default;

    /**
     * Fold a feature into the live transcript, completing the previous
     * transcript if the transcript_id changed.
     */
    void process_feature(const FeatureRecord& feature);

    /**
     * Get rows of transcripts completed so far.
     * @return Completed rows (moved out, no longer tracked)
     */
    std::vector<RefFlatRow> get_completed_rows();

    /**
     * Finalize the live transcript, if any. Call at end of input.
     * @return All rows not yet retrieved
     */
    std::vector<RefFlatRow> flush();

    bool has_live_transcript() const { return live_.has_value(); }

    size_t total_features() const { return total_features_; }
    size_t strand_conflicts() const { return strand_conflicts_; }
    size_t ignored_features() const { return ignored_features_; }
    size_t rows_emitted() const { return rows_emitted_; }

private:
    void complete_live();

    std::optional<TranscriptState> live_;

    // transcript_ids dropped after a strand conflict
    std::unordered_set<std::string> ignored_ids_;

    std::vector<RefFlatRow> completed_;

    // Statistics
    size_t total_features_ = 0;
    size_t strand_conflicts_ = 0;
    size_t ignored_features_ = 0;
    size_t rows_emitted_ = 0;
};

} // namespace gtf2refflat
