#include "cubkit/cai.hpp"

#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cubkit {

CodonWeights cai_weights(const std::vector<RscuEntry>& reference, const CodonTable& table) {
    const auto rscu = rscu_lookup(reference);

    CodonWeights w;
    w.fill(NA);
    for (const auto& sf : table.subfamilies()) {
        if (sf.codons.size() < 2) continue;

        double max_rscu = NA;
        for (int c : sf.codons) {
            if (is_na(rscu[c])) continue;
            max_rscu = is_na(max_rscu) ? rscu[c] : std::max(max_rscu, rscu[c]);
        }
        if (is_na(max_rscu) || max_rscu <= 0.0) continue;

        for (int c : sf.codons) {
            if (!is_na(rscu[c])) w[c] = rscu[c] / max_rscu;
        }
    }
    return w;
}

double geometric_index(const CodonCounts& counts, const CodonWeights& weights) {
    double log_sum = 0.0;
    double n = 0.0;
    for (size_t c = 0; c < NUM_CODONS; ++c) {
        if (counts[c] == 0 || is_na(weights[c])) continue;
        if (weights[c] <= 0.0) return 0.0;
        log_sum += counts[c] * std::log(weights[c]);
        n += counts[c];
    }
    return n > 0.0 ? std::exp(log_sum / n) : NA;
}

GeneMap<double> geometric_index(const CodonCountMatrix& counts, const CodonWeights& weights) {
    const size_t n = counts.size();
    std::vector<double> values(n, NA);

    #pragma omp parallel for schedule(dynamic, 256)
    for (size_t i = 0; i < n; ++i) {
        values[i] = geometric_index(counts.value(i), weights);
    }
    return counts.with_values(std::move(values));
}

GeneMap<double> compute_cai(const CodonCountMatrix& counts, const CodonTable& table,
                            const std::vector<RscuEntry>& reference) {
    return geometric_index(counts, cai_weights(reference, table));
}

} // namespace cubkit
