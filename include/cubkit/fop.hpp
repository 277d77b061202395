#pragma once

#include "cubkit/codon_tables.hpp"
#include "cubkit/types.hpp"

#include <vector>

namespace cubkit {

/**
 * Fraction of optimal codons.
 *
 * Per gene: optimal codon count over the count of all codons in subfamilies
 * that contain at least one optimal codon. Stop codons and single-codon
 * subfamilies (Met, Trp) are ignored even when listed. NA when a gene uses
 * none of the scored subfamilies.
 */
double compute_fop(const CodonCounts& counts, const CodonTable& table,
                   const std::vector<int>& optimal_codons);

GeneMap<double> compute_fop(const CodonCountMatrix& counts, const CodonTable& table,
                            const std::vector<int>& optimal_codons);

} // namespace cubkit
