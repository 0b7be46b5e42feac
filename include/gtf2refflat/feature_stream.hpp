#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gtf2refflat {

// One annotation feature, 0-based half-open coordinates
struct FeatureRecord {
    std::string contig;
    int64_t start = 0;        // 0-based, inclusive
    int64_t end = 0;          // 0-based, exclusive
    Strand strand = Strand::Unknown;
    std::string type;         // Lowercased feature type ("exon", "cds", ...)
    std::string gene_id;
    std::string transcript_id;
};

/**
 * Lazy, single-pass reader of normalized annotation lines.
 *
 * Blank lines, comment lines and features without a transcript_id are
 * skipped; malformed lines throw ConversionError.
 */
class FeatureStream {
public:
    // Read from a normalized file
    // @throws IoError if the file cannot be opened
    explicit FeatureStream(const std::string& path);

    // Read from an existing stream (not owned)
    explicit FeatureStream(std::istream& in);

    // Non-copyable
    FeatureStream(const FeatureStream&) = delete;
    FeatureStream& operator=(const FeatureStream&) = delete;

    /**
     * Advance to the next feature.
     * @return false once the input is exhausted
     */
    bool next(FeatureRecord& record);

    // Parse one normalized line; nullopt when it has no transcript_id
    static std::optional<FeatureRecord> parse_line(const std::string& line,
                                                   size_t line_num = 0);

    size_t line_number() const { return line_num_; }
    size_t features_read() const { return features_read_; }
    size_t skipped_without_transcript() const { return skipped_; }

private:
    std::unique_ptr<std::ifstream> owned_;
    std::istream* in_;

    size_t line_num_ = 0;
    size_t features_read_ = 0;
    size_t skipped_ = 0;
};

// Stable grouping by transcript_id, transcripts in first-seen order
std::vector<FeatureRecord> group_by_transcript(std::vector<FeatureRecord> features);

} // namespace gtf2refflat
