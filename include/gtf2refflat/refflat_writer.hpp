#pragma once

#include "transcript_state.hpp"
#include "types.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace gtf2refflat {

// One RefFlat line; coordinates are 0-based half-open
struct RefFlatRow {
    std::string gene_name;
    std::string transcript_name;
    std::string chrom;
    Strand strand = Strand::Unknown;
    int64_t tx_start = 0;
    int64_t tx_end = 0;
    int64_t cds_start = 0;
    int64_t cds_end = 0;
    std::vector<int64_t> exon_starts;
    std::vector<int64_t> exon_ends;

    size_t exon_count() const { return exon_starts.size(); }

    // Tab-separated fields, no line terminator
    std::string to_string() const;
};

class RefFlatWriter {
public:
    /**
     * Finalize a completed transcript into its RefFlat row.
     *
     * Exon starts and exon ends are sorted independently of each other.
     * Unresolved CDS bounds fall back to the transcript bounds.
     * @throws ConversionError if the transcript has no intervals
     */
    static RefFlatRow finalize(TranscriptState state);

    // Write rows separated by '\n', without a trailing newline
    static void write(std::ostream& out, const std::vector<RefFlatRow>& rows);

    static void write(const std::string& output_path, const std::vector<RefFlatRow>& rows);
};

} // namespace gtf2refflat
