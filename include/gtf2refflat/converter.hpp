#pragma once

#include "types.hpp"

#include <cstddef>
#include <string>

namespace gtf2refflat {

// User-facing message for any failed conversion
constexpr const char* CONVERSION_FAILURE_MESSAGE =
    "There was an error while converting the given GTF to a refFlat for CollectRnaSeqMetrics. "
    "Make sure the GTF file is tab separated.";

struct ConversionSummary {
    std::string normalized_path;
    std::string refflat_path;

    size_t lines_read = 0;
    size_t lines_normalized = 0;
    size_t features = 0;
    size_t skipped_without_transcript = 0;
    size_t strand_conflicts = 0;
    size_t ignored_features = 0;
    size_t rows_written = 0;
};

/**
 * GTF -> RefFlat conversion for one input file.
 *
 * Writes the normalized annotation next to the input, then streams it through
 * the transcript accumulator and writes the RefFlat table.
 */
class Converter {
public:
    explicit Converter(const Config& config);

    /**
     * Run the conversion.
     * @throws IoError if the input cannot be read or an output cannot be written
     * @throws ConversionError on malformed annotation content
     */
    ConversionSummary run();

    // <gtf_path minus a trailing .gz><suffix>
    static std::string derive_output_path(const std::string& gtf_path,
                                          const std::string& suffix);

private:
    Config config_;
};

} // namespace gtf2refflat
