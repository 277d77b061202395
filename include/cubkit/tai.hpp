#pragma once

#include "cubkit/codon_tables.hpp"
#include "cubkit/trna_weights.hpp"
#include "cubkit/types.hpp"

#include <vector>

namespace cubkit {

/**
 * tRNA adaptation index: count-weighted geometric mean of tRNA weights,
 * with the same exclusions as the CAI (stops, Met, Trp).
 */
GeneMap<double> compute_tai(const CodonCountMatrix& counts, const CodonTable& table,
                            const std::vector<TrnaWeightEntry>& weights);

} // namespace cubkit
