#include "gtf2refflat/attribute_normalizer.hpp"
#include "gtf2refflat/types.hpp"

#include <htslib/bgzf.h>
#include <htslib/kstring.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace gtf2refflat {

namespace {

const char COLUMN_DELIMITER = '\t';
const char ATTRIBUTE_DELIMITER = ' ';

// Helper to check if file is gzipped
bool is_gzipped(const std::string& path) {
    return path.size() >= 3 && path.substr(path.size() - 3) == ".gz";
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (true) {
        size_t pos = s.find(delim, begin);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(begin));
            break;
        }
        parts.push_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return parts;
}

std::string strip_quotes(std::string value) {
    value.erase(std::remove(value.begin(), value.end(), '"'), value.end());
    return value;
}

// Feeds normalized lines to out, joined by '\n'
class NormalizedSink {
public:
    explicit NormalizedSink(std::ostream& out) : out_(out) {}

    void consume(std::string line, AttributeNormalizer::Stats& stats) {
        ++stats.lines_read;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (AttributeNormalizer::is_skipped(line)) {
            return;
        }

        std::string normalized = AttributeNormalizer::normalize_line(line, stats.lines_read);
        if (stats.lines_written > 0) {
            out_ << '\n';
        }
        out_ << normalized;
        ++stats.lines_written;
    }

private:
    std::ostream& out_;
};

} // namespace

bool AttributeNormalizer::is_skipped(const std::string& line) {
    return line.empty() || line[0] == '#';
}

std::string AttributeNormalizer::normalize_line(const std::string& line, size_t line_num) {
    std::vector<std::string> columns = split(line, COLUMN_DELIMITER);

    // Not a 9-column record; leave it for FeatureStream to reject
    if (columns.size() < 9) {
        return line;
    }

    std::vector<std::string> tokens = split(columns.back(), ATTRIBUTE_DELIMITER);

    // Fragments are concatenated as-is: each GTF value token still carries
    // its terminating ';', which is what separates the fragments.
    std::string attributes;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        const char* key = nullptr;
        if (token == "gene_id") {
            key = "ID=";
        } else if (token == "transcript_id") {
            key = "transcript_id=";
        } else {
            continue;
        }

        if (i + 1 >= tokens.size()) {
            throw ConversionError("Attribute " + token + " has no value at line " +
                                  std::to_string(line_num) + ": " + line);
        }
        attributes += key;
        attributes += strip_quotes(tokens[++i]);
    }
    if (!attributes.empty() && attributes.back() == ';') {
        attributes.pop_back();
    }

    std::string result;
    for (size_t i = 0; i + 1 < columns.size(); ++i) {
        result += columns[i];
        result += COLUMN_DELIMITER;
    }
    result += attributes;
    return result;
}

AttributeNormalizer::Stats AttributeNormalizer::normalize_stream(std::istream& in,
                                                                 std::ostream& out) {
    Stats stats;
    NormalizedSink sink(out);

    std::string line;
    while (std::getline(in, line)) {
        sink.consume(std::move(line), stats);
    }
    if (in.bad()) {
        throw IoError("Failed while reading GTF input");
    }
    return stats;
}

AttributeNormalizer::Stats AttributeNormalizer::normalize_file(const std::string& gtf_path,
                                                               const std::string& output_path) {
    auto open_output = [&output_path](std::ofstream& out) {
        out.open(output_path, std::ios::binary);
        if (!out.is_open()) {
            throw IoError("Cannot open normalized output file: " + output_path);
        }
    };

    std::ofstream out;
    Stats stats;

    if (is_gzipped(gtf_path)) {
        // Use BGZF for gzipped files
        BGZF* fp = bgzf_open(gtf_path.c_str(), "r");
        if (!fp) {
            throw IoError("Cannot open gzipped GTF file: " + gtf_path);
        }

        kstring_t str = {0, 0, nullptr};
        int ret = 0;
        try {
            open_output(out);
            NormalizedSink sink(out);
            while ((ret = bgzf_getline(fp, '\n', &str)) >= 0) {
                sink.consume(std::string(str.s, str.l), stats);
            }
        } catch (...) {
            free(str.s);
            bgzf_close(fp);
            throw;
        }
        free(str.s);
        bgzf_close(fp);

        // -1 is EOF, anything lower is a read/decompression error
        if (ret < -1) {
            throw IoError("Failed while reading gzipped GTF file: " + gtf_path);
        }
    } else {
        // Use standard ifstream for plain text files
        std::ifstream file(gtf_path);
        if (!file.is_open()) {
            throw IoError("Cannot open GTF file: " + gtf_path);
        }
        open_output(out);
        stats = normalize_stream(file, out);
    }

    out.flush();
    if (!out) {
        throw IoError("Could not write to file " + output_path);
    }
    return stats;
}

} // namespace gtf2refflat
