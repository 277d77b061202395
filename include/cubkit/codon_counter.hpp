#pragma once

#include "cubkit/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cubkit {

struct CountSummary {
    size_t counted = 0;   // triplets tallied
    size_t skipped = 0;   // triplets with a non-ACGTU character
};

/**
 * Count non-overlapping codons from position 0.
 *
 * Throws MalformedSequence when the length is not a multiple of 3.
 * Triplets with ambiguous bases are skipped and reported in `summary`.
 */
CodonCounts count_codons(const std::string& seq,
                         CountSummary* summary = nullptr,
                         const std::string& gene_id = "<sequence>");

// One row per gene, same order as `seqs`. Genes are counted in parallel.
CodonCountMatrix count_codons(const GeneMap<std::string>& seqs);

uint64_t total_codons(const CodonCounts& counts);

// Column sums over all genes
PooledCounts sum_counts(const CodonCountMatrix& counts);

// Column sums over the listed genes; throws InputError for unknown ids
PooledCounts sum_counts(const CodonCountMatrix& counts,
                       const std::vector<std::string>& gene_ids);

} // namespace cubkit
