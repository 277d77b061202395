#pragma once
// Codon adaptation index
//
// w(c) = RSCU(c) / max RSCU in the subfamily of c, from a reference set.
// CAI(gene) = exp( sum_c n_c log w(c) / sum_c n_c ) over codons with a
// defined weight. Stop codons and single-codon subfamilies carry no weight.

#include "cubkit/codon_tables.hpp"
#include "cubkit/rscu.hpp"
#include "cubkit/types.hpp"

#include <array>
#include <vector>

namespace cubkit {

using CodonWeights = std::array<double, NUM_CODONS>;

// Relative adaptiveness; NA for stops, single-codon subfamilies and
// subfamilies whose reference RSCU is undefined or all zero
CodonWeights cai_weights(const std::vector<RscuEntry>& reference, const CodonTable& table);

/**
 * Count-weighted geometric mean of codon weights.
 *
 * Codons with NA weight are skipped. A used codon with weight 0 makes the
 * result exactly 0. NA when no used codon has a weight.
 */
double geometric_index(const CodonCounts& counts, const CodonWeights& weights);

GeneMap<double> geometric_index(const CodonCountMatrix& counts, const CodonWeights& weights);

GeneMap<double> compute_cai(const CodonCountMatrix& counts, const CodonTable& table,
                            const std::vector<RscuEntry>& reference);

} // namespace cubkit
