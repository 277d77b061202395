#include "cubkit/rscu.hpp"
#include "cubkit/codon_counter.hpp"

#include <algorithm>

namespace cubkit {

std::vector<RscuEntry> estimate_rscu(const PooledCounts& totals,
                                     const CodonTable& table,
                                     double pseudo_count) {
    if (pseudo_count < 0.0) {
        throw InputError("Pseudocount must be >= 0");
    }

    std::array<RscuEntry, NUM_CODONS> by_codon;
    std::array<bool, NUM_CODONS> present{};

    for (const auto& sf : table.subfamilies()) {
        const double n = static_cast<double>(sf.codons.size());
        double raw_total = 0.0;
        double total = 0.0;
        for (int c : sf.codons) {
            raw_total += static_cast<double>(totals[c]);
            total += static_cast<double>(totals[c]) + pseudo_count;
        }

        for (int c : sf.codons) {
            RscuEntry e;
            e.index = c;
            e.codon = table[c].codon;
            e.amino_acid = sf.amino_acid;
            e.subfam = sf.label;
            const double count = static_cast<double>(totals[c]);
            e.count = count;
            if (raw_total > 0.0) e.prop = count / raw_total;
            if (total > 0.0) e.rscu = (count + pseudo_count) / (total / n);
            by_codon[c] = std::move(e);
            present[c] = true;
        }
    }

    std::vector<RscuEntry> out;
    out.reserve(NUM_CODONS);
    for (size_t c = 0; c < NUM_CODONS; ++c) {
        if (present[c]) out.push_back(std::move(by_codon[c]));
    }
    return out;
}

std::vector<RscuEntry> estimate_rscu(const CodonCounts& totals,
                                     const CodonTable& table,
                                     double pseudo_count) {
    PooledCounts wide{};
    std::copy(totals.begin(), totals.end(), wide.begin());
    return estimate_rscu(wide, table, pseudo_count);
}

std::vector<RscuEntry> estimate_rscu(const CodonCountMatrix& counts,
                                     const CodonTable& table,
                                     double pseudo_count) {
    return estimate_rscu(sum_counts(counts), table, pseudo_count);
}

std::vector<RscuEntry> estimate_rscu(const CodonCountMatrix& counts,
                                     const std::vector<std::string>& gene_ids,
                                     const CodonTable& table,
                                     double pseudo_count) {
    return estimate_rscu(sum_counts(counts, gene_ids), table, pseudo_count);
}

std::array<double, NUM_CODONS> rscu_lookup(const std::vector<RscuEntry>& rscu) {
    std::array<double, NUM_CODONS> out;
    out.fill(NA);
    for (const auto& e : rscu) {
        if (e.index >= 0 && e.index < static_cast<int>(NUM_CODONS)) out[e.index] = e.rscu;
    }
    return out;
}

} // namespace cubkit
