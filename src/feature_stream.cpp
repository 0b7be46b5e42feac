#include "gtf2refflat/feature_stream.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace gtf2refflat {

namespace {

int64_t parse_coordinate(const std::string& field, const std::string& line, size_t line_num) {
    size_t consumed = 0;
    int64_t value = 0;
    try {
        value = std::stoll(field, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != field.size()) {
        throw ConversionError("Invalid coordinate '" + field + "' at line " +
                              std::to_string(line_num) + ": " + line);
    }
    return value;
}

// First element of a GFF3-style value list ("a,b" -> "a")
std::string first_value(const std::string& value) {
    return value.substr(0, value.find(','));
}

} // namespace

FeatureStream::FeatureStream(const std::string& path)
    : owned_(std::make_unique<std::ifstream>(path)), in_(owned_.get()) {
    if (!owned_->is_open()) {
        throw IoError("Cannot open normalized annotation file: " + path);
    }
}

FeatureStream::FeatureStream(std::istream& in) : in_(&in) {}

bool FeatureStream::next(FeatureRecord& record) {
    std::string line;
    while (std::getline(*in_, line)) {
        ++line_num_;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') continue;

        auto parsed = parse_line(line, line_num_);
        if (!parsed) {
            ++skipped_;
            continue;
        }

        record = std::move(*parsed);
        ++features_read_;
        return true;
    }

    if (in_->bad()) {
        throw IoError("Failed while reading normalized annotation at line " +
                      std::to_string(line_num_));
    }
    return false;
}

std::optional<FeatureRecord> FeatureStream::parse_line(const std::string& line, size_t line_num) {
    std::vector<std::string> columns;
    std::istringstream iss(line);
    std::string column;
    while (std::getline(iss, column, '\t')) {
        columns.push_back(column);
    }
    // A trailing tab leaves an empty attribute column
    if (!line.empty() && line.back() == '\t') {
        columns.emplace_back();
    }

    // Fields: seqid source type start end score strand phase attributes
    if (columns.size() < 9) {
        throw ConversionError("Expected 9 tab-separated columns at line " +
                              std::to_string(line_num) + ": " + line);
    }

    std::string gene_id;
    std::string transcript_id;

    std::istringstream attrs(columns[8]);
    std::string pair;
    while (std::getline(attrs, pair, ';')) {
        size_t eq_pos = pair.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = pair.substr(0, eq_pos);
        std::string value = first_value(pair.substr(eq_pos + 1));

        if (key == "ID") {
            gene_id = value;
        } else if (key == "transcript_id") {
            transcript_id = value;
        }
    }

    if (transcript_id.empty()) {
        return std::nullopt;
    }

    FeatureRecord record;
    record.contig = columns[0];
    record.type = columns[2];
    std::transform(record.type.begin(), record.type.end(), record.type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    int64_t start = parse_coordinate(columns[3], line, line_num);
    int64_t end = parse_coordinate(columns[4], line, line_num);
    if (start > end) {
        throw ConversionError("Start cannot be greater than end at line " +
                              std::to_string(line_num) + ": " + line);
    }

    // GTF uses 1-based coordinates, convert to 0-based
    record.start = start - 1;
    record.end = end;
    record.strand = strand_from_char(columns[6].empty() ? '.' : columns[6][0]);
    record.gene_id = gene_id.empty() ? "NA" : gene_id;
    record.transcript_id = std::move(transcript_id);
    return record;
}

std::vector<FeatureRecord> group_by_transcript(std::vector<FeatureRecord> features) {
    std::unordered_map<std::string, size_t> first_seen;
    for (const auto& feature : features) {
        first_seen.emplace(feature.transcript_id, first_seen.size());
    }

    std::stable_sort(features.begin(), features.end(),
                     [&first_seen](const FeatureRecord& a, const FeatureRecord& b) {
                         return first_seen.at(a.transcript_id) < first_seen.at(b.transcript_id);
                     });
    return features;
}

} // namespace gtf2refflat
