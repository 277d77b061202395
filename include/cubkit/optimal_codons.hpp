#pragma once
// Optimal codon estimation
//
// For every subfamily with two or more codons, the share of each codon in
// each gene is regressed on a per-gene bias score (ENC by default). Codons
// whose usage rises with bias, at a Benjamini-Hochberg q-value below the
// threshold, are called optimal. The regression needs every gene, so this
// is the one place where per-gene work joins.

#include "cubkit/codon_tables.hpp"
#include "cubkit/enc.hpp"
#include "cubkit/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cubkit {

enum class ScoreDirection {
    LowerIsBiased,    // ENC-like: small score = strong bias
    HigherIsBiased    // expression-like: large score = strong selection
};

struct OptimalCodonOptions {
    double fdr = 0.01;                 // q-value threshold for "optimal"
    size_t min_genes = 3;              // informative genes per subfamily
    EncMethod enc_method = EncMethod::Wright;
    // Optional per-gene score replacing ENC. Genes without a score are
    // left out of the regression.
    const GeneMap<double>* gene_score = nullptr;
    ScoreDirection score_direction = ScoreDirection::HigherIsBiased;
};

struct OptimalCodonRecord {
    int index = -1;
    std::string codon;
    std::string amino_acid;
    std::string subfam;
    double coefficient = NA;   // slope of usage share on score
    double p_value = NA;
    double q_value = NA;
    size_t n_genes = 0;        // genes with usage in the subfamily
    bool optimal = false;
};

/**
 * One record per codon of every multi-codon subfamily, in codon index order.
 *
 * Throws InsufficientData when a subfamily has fewer than min_genes
 * informative genes or when the score has no variance.
 */
std::vector<OptimalCodonRecord> estimate_optimal_codons(const CodonCountMatrix& counts,
                                                        const CodonTable& table,
                                                        const OptimalCodonOptions& opts = {});

// Codon indices flagged optimal
std::vector<int> optimal_codon_set(const std::vector<OptimalCodonRecord>& records);

} // namespace cubkit
