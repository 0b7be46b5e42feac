#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace gtf2refflat {

/**
 * Rewrites GTF attribute columns into the compact key=value syntax read by
 * FeatureStream. Only gene_id (written as ID=) and transcript_id survive.
 */
class AttributeNormalizer {
public:
    struct Stats {
        size_t lines_read = 0;      // Raw input lines, including skipped ones
        size_t lines_written = 0;   // Lines emitted to the normalized stream
    };

    // True for lines that never reach the normalized stream (empty or '#')
    static bool is_skipped(const std::string& line);

    // Rewrite the attribute column of one GTF line
    // line_num is only used in error messages
    static std::string normalize_line(const std::string& line, size_t line_num = 0);

    // Normalize every retained line of in into out, newline-joined,
    // without a trailing newline
    static Stats normalize_stream(std::istream& in, std::ostream& out);

    // Same as normalize_stream, reading from a plain or gzipped (.gz) GTF file
    static Stats normalize_file(const std::string& gtf_path,
                                const std::string& output_path);
};

} // namespace gtf2refflat
