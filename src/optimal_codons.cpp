#include "cubkit/optimal_codons.hpp"
#include "cubkit/stats.hpp"

#include <algorithm>

namespace cubkit {

std::vector<OptimalCodonRecord> estimate_optimal_codons(const CodonCountMatrix& counts,
                                                        const CodonTable& table,
                                                        const OptimalCodonOptions& opts) {
    if (opts.min_genes < 3) {
        throw InputError("min_genes must be >= 3 for a slope t-test");
    }

    // Per-gene score and the sign that points towards stronger bias
    std::vector<double> score(counts.size(), NA);
    double bias_sign = -1.0;
    if (opts.gene_score) {
        for (size_t i = 0; i < counts.size(); ++i) {
            if (const double* s = opts.gene_score->find(counts.id(i))) score[i] = *s;
        }
        bias_sign = opts.score_direction == ScoreDirection::HigherIsBiased ? 1.0 : -1.0;
    } else {
        score = compute_enc(counts, table, opts.enc_method).values();
    }

    std::vector<OptimalCodonRecord> records;
    std::vector<double> p_values;

    for (const auto& sf : table.subfamilies()) {
        if (sf.codons.size() < 2) continue;

        // Genes with usage in this subfamily and a defined score
        std::vector<size_t> genes;
        std::vector<double> x;
        for (size_t i = 0; i < counts.size(); ++i) {
            if (is_na(score[i])) continue;
            uint64_t total = 0;
            for (int c : sf.codons) total += counts.value(i)[c];
            if (total == 0) continue;
            genes.push_back(i);
            x.push_back(score[i]);
        }

        if (genes.size() < opts.min_genes) {
            throw InsufficientData("Subfamily " + sf.label + " has " +
                                   std::to_string(genes.size()) +
                                   " informative genes, need at least " +
                                   std::to_string(opts.min_genes));
        }

        for (int c : sf.codons) {
            std::vector<double> y;
            y.reserve(genes.size());
            for (size_t i : genes) {
                const CodonCounts& row = counts.value(i);
                double total = 0.0;
                for (int s : sf.codons) total += row[s];
                y.push_back(row[c] / total);
            }

            const RegressionResult fit = linear_regression(x, y);

            OptimalCodonRecord rec;
            rec.index = c;
            rec.codon = table[c].codon;
            rec.amino_acid = sf.amino_acid;
            rec.subfam = sf.label;
            rec.coefficient = fit.slope;
            rec.p_value = fit.p_value;
            rec.n_genes = genes.size();
            records.push_back(std::move(rec));
            p_values.push_back(fit.p_value);
        }
    }

    const std::vector<double> q_values = benjamini_hochberg(p_values);
    for (size_t i = 0; i < records.size(); ++i) {
        auto& rec = records[i];
        rec.q_value = q_values[i];
        rec.optimal = rec.coefficient * bias_sign > 0.0 && rec.q_value < opts.fdr;
    }

    std::sort(records.begin(), records.end(),
              [](const OptimalCodonRecord& a, const OptimalCodonRecord& b) {
                  return a.index < b.index;
              });
    return records;
}

std::vector<int> optimal_codon_set(const std::vector<OptimalCodonRecord>& records) {
    std::vector<int> out;
    for (const auto& rec : records) {
        if (rec.optimal) out.push_back(rec.index);
    }
    return out;
}

} // namespace cubkit
