#include "gtf2refflat/converter.hpp"
#include "gtf2refflat/types.hpp"

#include <CLI/CLI.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    CLI::App app{"gtf2refflat: Convert a GTF annotation into a RefFlat table"};

    gtf2refflat::Config config;

    app.add_option("-g,--gtf", config.gtf_path,
        "Gene annotations in GTF form (plain or gzipped)")->required();

    // Output options
    app.add_option("-o,--refflat", config.refflat_path,
        "Output RefFlat file (default: <gtf>.refflat)");
    app.add_option("--normalized", config.normalized_path,
        "Normalized annotation file written during conversion (default: <gtf>.gff3)");

    // Processing options
    app.add_flag("--group-transcripts", config.group_transcripts,
        "Group features by transcript_id before conversion (for non-contiguous input)");
    app.add_flag("--verbose", config.verbose,
        "Display additional information during processing");

    CLI11_PARSE(app, argc, argv);

    try {
        gtf2refflat::Converter converter(config);
        converter.run();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << gtf2refflat::CONVERSION_FAILURE_MESSAGE << "\n"
                  << "  Cause: " << e.what() << "\n";
        return 1;
    }
}
