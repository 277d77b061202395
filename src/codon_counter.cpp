#include "cubkit/codon_counter.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cubkit {

CodonCounts count_codons(const std::string& seq,
                         CountSummary* summary,
                         const std::string& gene_id) {
    if (seq.size() % 3 != 0) {
        throw MalformedSequence(gene_id, "length " + std::to_string(seq.size()) +
                                         " is not a multiple of 3");
    }

    CodonCounts counts{};
    size_t skipped = 0;
    for (size_t i = 0; i + 2 < seq.size(); i += 3) {
        const int idx = codon_index(seq[i], seq[i + 1], seq[i + 2]);
        if (idx < 0) {
            ++skipped;
            continue;
        }
        ++counts[idx];
    }

    if (summary) {
        summary->counted = seq.size() / 3 - skipped;
        summary->skipped = skipped;
    }
    return counts;
}

CodonCountMatrix count_codons(const GeneMap<std::string>& seqs) {
    const size_t n = seqs.size();

    // Validate up front so nothing throws inside the parallel region
    for (size_t i = 0; i < n; ++i) {
        if (seqs.value(i).size() % 3 != 0) {
            throw MalformedSequence(seqs.id(i), "length " +
                                    std::to_string(seqs.value(i).size()) +
                                    " is not a multiple of 3");
        }
    }

    std::vector<CodonCounts> rows(n);
    #pragma omp parallel for schedule(dynamic, 256)
    for (size_t i = 0; i < n; ++i) {
        rows[i] = count_codons(seqs.value(i), nullptr, seqs.id(i));
    }
    return seqs.with_values(std::move(rows));
}

uint64_t total_codons(const CodonCounts& counts) {
    uint64_t total = 0;
    for (Count c : counts) total += c;
    return total;
}

PooledCounts sum_counts(const CodonCountMatrix& counts) {
    PooledCounts totals{};
    for (const auto& row : counts.values()) {
        for (size_t c = 0; c < NUM_CODONS; ++c) totals[c] += row[c];
    }
    return totals;
}

PooledCounts sum_counts(const CodonCountMatrix& counts,
                        const std::vector<std::string>& gene_ids) {
    PooledCounts totals{};
    for (const auto& id : gene_ids) {
        const CodonCounts& row = counts.at(id);
        for (size_t c = 0; c < NUM_CODONS; ++c) totals[c] += row[c];
    }
    return totals;
}

} // namespace cubkit
