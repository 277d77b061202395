#pragma once

#include "cubkit/types.hpp"

#include <array>
#include <string>
#include <vector>

namespace cubkit {

// Fast complement - direct lookup (U complements like T)
inline char fast_complement(char c) {
    switch (c) {
        case 'A': return 'T';
        case 'T': case 'U': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'a': return 't';
        case 't': case 'u': return 'a';
        case 'c': return 'g';
        case 'g': return 'c';
        default: return 'N';
    }
}

inline std::string reverse_complement(const std::string& seq) {
    std::string rc;
    rc.reserve(seq.length());
    for (auto it = seq.rbegin(); it != seq.rend(); ++it) {
        rc += fast_complement(*it);
    }
    return rc;
}

// Three-letter amino acid name for a one-letter code ("Stop" for '*')
const char* amino_acid_name(char aa_code);

// One-letter code for a three-letter name, case-insensitive; 0 if unknown
char amino_acid_code(const std::string& name);

struct CodonInfo {
    std::string codon;        // DNA alphabet, e.g. "TTA"
    char aa_code = 'X';       // one-letter amino acid, '*' for stop
    std::string amino_acid;   // three-letter name, "Stop" for stop codons
    std::string subfam;       // "<AA>_<first two bases>", empty for stops
    bool is_start = false;
    bool is_stop = false;     // may terminate a CDS (includes reassignable stops)
};

/**
 * Synonymous codons of one amino acid sharing the first two bases.
 * Six-fold families (Leu, Ser, Arg in the standard code) split into a
 * 4-codon and a 2-codon subfamily.
 */
struct Subfamily {
    std::string label;
    std::string amino_acid;
    char aa_code = 'X';
    std::vector<int> codons;  // codon indices, ascending
};

/**
 * Genetic code table for one NCBI translation table.
 *
 * Codons are stored in index order (TTT, TTC, TTA, ..., GGG). Every sense
 * codon belongs to exactly one subfamily; stop codons belong to none.
 * Tables are immutable once built.
 */
class CodonTable {
public:
    // Build from an NCBI table id ("1", "11", ...). Throws InvalidCodeId.
    static CodonTable from_id(const std::string& code_id);

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }

    const CodonInfo& operator[](int idx) const { return codons_[idx]; }
    const std::array<CodonInfo, NUM_CODONS>& codons() const { return codons_; }

    const std::vector<Subfamily>& subfamilies() const { return subfams_; }

    // Subfamily index of a codon, -1 for codons translated as '*'
    int subfamily_of(int codon_idx) const { return subfam_of_[codon_idx]; }

    bool is_stop(int codon_idx) const { return codons_[codon_idx].is_stop; }
    bool is_start(int codon_idx) const { return codons_[codon_idx].is_start; }
    char translate(int codon_idx) const {
        return codon_idx < 0 ? 'X' : codons_[codon_idx].aa_code;
    }

    std::vector<int> start_codons() const;
    std::vector<int> stop_codons() const;

    // Codons encoding a one-letter amino acid, ascending
    std::vector<int> codons_for(char aa_code) const;

private:
    CodonTable() = default;

    std::string id_;
    std::string name_;
    std::array<CodonInfo, NUM_CODONS> codons_;
    std::vector<Subfamily> subfams_;
    std::array<int, NUM_CODONS> subfam_of_{};
};

// Shared immutable table for an NCBI id. Throws InvalidCodeId.
const CodonTable& get_codon_table(const std::string& code_id = "1");

// Supported NCBI table ids, ascending
std::vector<std::string> available_code_ids();

} // namespace cubkit
