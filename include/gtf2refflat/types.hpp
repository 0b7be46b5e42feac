#pragma once

#include <stdexcept>
#include <string>

namespace gtf2refflat {

// Strand enumeration
enum class Strand : char { Plus = '+', Minus = '-', Unknown = '.' };

inline char to_char(Strand s) {
    return static_cast<char>(s);
}

inline Strand strand_from_char(char c) {
    switch (c) {
        case '+': return Strand::Plus;
        case '-': return Strand::Minus;
        default: return Strand::Unknown;
    }
}

// Input cannot be opened/read, or an artifact cannot be written
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed annotation content or an unfinishable transcript
class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Configuration for the conversion pipeline
struct Config {
    // Input GTF (plain or gzipped)
    std::string gtf_path;

    // Output paths; derived from gtf_path when empty
    std::string normalized_path;
    std::string refflat_path;

    // Insert a stable group-by-transcript stage before accumulation
    bool group_transcripts = false;

    bool verbose = false;
};

} // namespace gtf2refflat
