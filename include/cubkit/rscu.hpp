#pragma once
// Relative synonymous codon usage
//
// RSCU(c) = (count(c) + pseudo) / mean over the subfamily of (count + pseudo)
//
// Within a subfamily with any usage the values sum to the subfamily size.
// A subfamily with zero usage (and no pseudocount) is undefined: NA.

#include "cubkit/codon_tables.hpp"
#include "cubkit/types.hpp"

#include <array>
#include <string>
#include <vector>

namespace cubkit {

struct RscuEntry {
    int index = -1;
    std::string codon;
    std::string amino_acid;
    std::string subfam;
    double count = 0.0;   // summed over genes, before pseudocount
    double prop = NA;     // share of the subfamily total
    double rscu = NA;
};

// One entry per sense codon, in codon index order
std::vector<RscuEntry> estimate_rscu(const PooledCounts& totals,
                                     const CodonTable& table,
                                     double pseudo_count = 0.0);

std::vector<RscuEntry> estimate_rscu(const CodonCounts& totals,
                                     const CodonTable& table,
                                     double pseudo_count = 0.0);

std::vector<RscuEntry> estimate_rscu(const CodonCountMatrix& counts,
                                     const CodonTable& table,
                                     double pseudo_count = 0.0);

// Restricted to a gene subset (e.g. highly expressed genes)
std::vector<RscuEntry> estimate_rscu(const CodonCountMatrix& counts,
                                     const std::vector<std::string>& gene_ids,
                                     const CodonTable& table,
                                     double pseudo_count = 0.0);

// 64-slot view indexed by codon; NA where no entry exists
std::array<double, NUM_CODONS> rscu_lookup(const std::vector<RscuEntry>& rscu);

} // namespace cubkit
