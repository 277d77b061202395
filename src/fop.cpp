#include "cubkit/fop.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cubkit {

namespace {

struct FopMask {
    std::array<bool, NUM_CODONS> optimal{};
    std::array<bool, NUM_CODONS> scored{};
};

FopMask build_mask(const CodonTable& table, const std::vector<int>& optimal_codons) {
    FopMask mask;
    for (int c : optimal_codons) {
        if (c < 0 || c >= static_cast<int>(NUM_CODONS)) continue;
        const int sf = table.subfamily_of(c);
        if (sf < 0) continue;
        const auto& members = table.subfamilies()[sf].codons;
        if (members.size() < 2) continue;
        mask.optimal[c] = true;
        for (int m : members) mask.scored[m] = true;
    }
    return mask;
}

double fop_with_mask(const CodonCounts& counts, const FopMask& mask) {
    double num = 0.0, den = 0.0;
    for (size_t c = 0; c < NUM_CODONS; ++c) {
        if (!mask.scored[c]) continue;
        den += counts[c];
        if (mask.optimal[c]) num += counts[c];
    }
    return den > 0.0 ? num / den : NA;
}

} // namespace

double compute_fop(const CodonCounts& counts, const CodonTable& table,
                   const std::vector<int>& optimal_codons) {
    return fop_with_mask(counts, build_mask(table, optimal_codons));
}

GeneMap<double> compute_fop(const CodonCountMatrix& counts, const CodonTable& table,
                            const std::vector<int>& optimal_codons) {
    const FopMask mask = build_mask(table, optimal_codons);
    const size_t n = counts.size();
    std::vector<double> values(n, NA);

    #pragma omp parallel for schedule(dynamic, 256)
    for (size_t i = 0; i < n; ++i) {
        values[i] = fop_with_mask(counts.value(i), mask);
    }
    return counts.with_values(std::move(values));
}

} // namespace cubkit
