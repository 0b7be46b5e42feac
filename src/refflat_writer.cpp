#include "gtf2refflat/refflat_writer.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace gtf2refflat {

namespace {

const char COLUMN_DELIMITER = '\t';
const char COORDINATE_DELIMITER = ',';

void join_coordinates(std::ostream& out, const std::vector<int64_t>& values) {
    bool first = true;
    for (int64_t v : values) {
        if (!first) out << COORDINATE_DELIMITER;
        out << v;
        first = false;
    }
}

} // namespace

std::string RefFlatRow::to_string() const {
    std::ostringstream oss;
    oss << gene_name << COLUMN_DELIMITER
        << transcript_name << COLUMN_DELIMITER
        << chrom << COLUMN_DELIMITER
        << to_char(strand) << COLUMN_DELIMITER
        << tx_start << COLUMN_DELIMITER
        << tx_end << COLUMN_DELIMITER
        << cds_start << COLUMN_DELIMITER
        << cds_end << COLUMN_DELIMITER
        << exon_count() << COLUMN_DELIMITER;
    join_coordinates(oss, exon_starts);
    oss << COLUMN_DELIMITER;
    join_coordinates(oss, exon_ends);
    return oss.str();
}

RefFlatRow RefFlatWriter::finalize(TranscriptState state) {
    state.close_running_merge();

    if (state.exon_starts.empty()) {
        throw ConversionError("Transcript " + state.transcript_id + " has no exon intervals");
    }

    std::sort(state.exon_starts.begin(), state.exon_starts.end());
    std::sort(state.exon_ends.begin(), state.exon_ends.end());

    RefFlatRow row;
    row.gene_name = std::move(state.gene_id);
    row.transcript_name = std::move(state.transcript_id);
    row.chrom = std::move(state.chrom);
    row.strand = state.strand;
    row.tx_start = state.exon_starts.front();
    row.tx_end = state.exon_ends.back();

    // Collected CDS start is 1-based
    row.cds_start = state.cds_start ? *state.cds_start - 1 : row.tx_start;
    row.cds_end = state.cds_end ? *state.cds_end : row.tx_end;

    row.exon_starts = std::move(state.exon_starts);
    row.exon_ends = std::move(state.exon_ends);
    return row;
}

void RefFlatWriter::write(std::ostream& out, const std::vector<RefFlatRow>& rows) {
    bool first = true;
    for (const auto& row : rows) {
        if (!first) out << '\n';
        out << row.to_string();
        first = false;
    }
}

void RefFlatWriter::write(const std::string& output_path, const std::vector<RefFlatRow>& rows) {
    std::ofstream file(output_path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open output RefFlat file: " + output_path);
    }

    write(file, rows);

    file.flush();
    if (!file) {
        throw IoError("Could not write to file " + output_path);
    }
}

} // namespace gtf2refflat
