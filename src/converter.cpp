#include "gtf2refflat/converter.hpp"
#include "gtf2refflat/attribute_normalizer.hpp"
#include "gtf2refflat/feature_stream.hpp"
#include "gtf2refflat/refflat_writer.hpp"
#include "gtf2refflat/transcript_accumulator.hpp"

#include <iostream>
#include <vector>

namespace gtf2refflat {

Converter::Converter(const Config& config) : config_(config) {
    if (config_.normalized_path.empty()) {
        config_.normalized_path = derive_output_path(config_.gtf_path, ".gff3");
    }
    if (config_.refflat_path.empty()) {
        config_.refflat_path = derive_output_path(config_.gtf_path, ".refflat");
    }
}

std::string Converter::derive_output_path(const std::string& gtf_path, const std::string& suffix) {
    std::string base = gtf_path;
    if (base.size() >= 3 && base.substr(base.size() - 3) == ".gz") {
        base.erase(base.size() - 3);
    }
    return base + suffix;
}

ConversionSummary Converter::run() {
    ConversionSummary summary;
    summary.normalized_path = config_.normalized_path;
    summary.refflat_path = config_.refflat_path;

    if (config_.verbose) {
        std::cerr << "Normalizing GTF attributes...\n";
        std::cerr << "  Input: " << config_.gtf_path << "\n";
        std::cerr << "  Normalized: " << config_.normalized_path << "\n";
    }

    auto norm_stats = AttributeNormalizer::normalize_file(config_.gtf_path, config_.normalized_path);
    summary.lines_read = norm_stats.lines_read;
    summary.lines_normalized = norm_stats.lines_written;

    if (config_.verbose) {
        std::cerr << "Collecting transcripts...\n";
    }

    FeatureStream stream(config_.normalized_path);
    TranscriptAccumulator accumulator;

    FeatureRecord feature;
    if (config_.group_transcripts) {
        std::vector<FeatureRecord> features;
        while (stream.next(feature)) {
            features.push_back(std::move(feature));
        }
        for (const auto& f : group_by_transcript(std::move(features))) {
            accumulator.process_feature(f);
        }
    } else {
        while (stream.next(feature)) {
            accumulator.process_feature(feature);
        }
    }
    std::vector<RefFlatRow> rows = accumulator.flush();

    summary.features = stream.features_read();
    summary.skipped_without_transcript = stream.skipped_without_transcript();
    summary.strand_conflicts = accumulator.strand_conflicts();
    summary.ignored_features = accumulator.ignored_features();

    RefFlatWriter::write(config_.refflat_path, rows);
    summary.rows_written = rows.size();

    if (config_.verbose) {
        std::cerr << "Conversion complete:\n"
                  << "  Lines read: " << summary.lines_read << "\n"
                  << "  Features: " << summary.features << "\n"
                  << "  Skipped (no transcript_id): " << summary.skipped_without_transcript << "\n"
                  << "  Strand conflicts: " << summary.strand_conflicts << "\n"
                  << "  Rows written: " << summary.rows_written << "\n"
                  << "  RefFlat: " << summary.refflat_path << "\n";
    }

    return summary;
}

} // namespace gtf2refflat
