#pragma once
// Structural checks for coding sequences.
//
// check_cds() is the gate in front of every index calculation: sequences
// failing an enabled check are dropped and reported, the rest continue.

#include "cubkit/codon_tables.hpp"
#include "cubkit/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cubkit {

enum class QcFailure : uint8_t {
    TooShort,       // shorter than min_len
    BadLength,      // length not a multiple of 3
    NoStart,        // first codon is not an accepted start codon
    NoStop,         // last codon is not a stop codon
    InternalStop    // stop codon before the last codon
};

const char* qc_failure_label(QcFailure f);

struct QcOptions {
    bool check_len = true;
    bool check_start = true;
    bool check_stop = true;
    bool check_istop = true;
    size_t min_len = 6;        // nucleotides, before trimming
    bool rm_start = true;      // drop the start codon of passing sequences
    bool rm_stop = true;       // drop the stop codon of passing sequences
    // Accepted start codons; empty = the table's initiation codons
    std::vector<std::string> start_codons{"ATG"};
};

struct QcExclusion {
    std::string id;
    std::vector<QcFailure> failures;  // every enabled check that failed
};

struct QcResult {
    GeneMap<std::string> passed;      // normalized (uppercase, T) and trimmed
    std::vector<QcExclusion> excluded;
};

// Failed checks for one normalized sequence (empty = passes)
std::vector<QcFailure> check_sequence(const std::string& seq,
                                      const CodonTable& table,
                                      const QcOptions& opts);

QcResult check_cds(const GeneMap<std::string>& seqs,
                   const CodonTable& table,
                   const QcOptions& opts = {});

} // namespace cubkit
