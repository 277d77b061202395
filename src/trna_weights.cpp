#include "cubkit/trna_weights.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace cubkit {

char trna_amino_acid_code(const std::string& label) {
    std::string base = label;
    while (!base.empty() && std::isdigit(static_cast<unsigned char>(base.back()))) {
        base.pop_back();
    }
    return amino_acid_code(base);
}

TrnaGene parse_trna_key(const std::string& key, double copies) {
    if (!std::isfinite(copies) || copies < 0.0) {
        throw InputError("Invalid tRNA copy number for '" + key + "'");
    }

    TrnaGene gene;
    gene.copies = copies;

    std::string anticodon = key;
    const size_t dash = key.rfind('-');
    if (dash != std::string::npos) {
        gene.amino_acid = key.substr(0, dash);
        anticodon = key.substr(dash + 1);
        const char aa = trna_amino_acid_code(gene.amino_acid);
        if (aa == 0 || aa == '*') {
            throw InputError("Unknown tRNA amino acid in '" + key + "'");
        }
        // Canonical capitalisation
        gene.amino_acid = amino_acid_name(aa);
    }

    gene.anticodon = normalize_sequence(anticodon);
    if (codon_index(gene.anticodon) < 0) {
        throw InputError("Invalid anticodon in '" + key + "'");
    }
    return gene;
}

namespace {

bool in_multi_codon_subfamily(const CodonTable& table, int c) {
    const int sf = table.subfamily_of(c);
    return sf >= 0 && table.subfamilies()[sf].codons.size() > 1;
}

} // namespace

std::vector<TrnaWeightEntry> estimate_trna_weights(const TrnaPool& pool,
                                                   const CodonTable& table,
                                                   const WobbleParams& params,
                                                   TrnaNormalization norm) {
    std::array<double, NUM_CODONS> raw{};

    for (const auto& trna : pool) {
        const std::string anticodon = normalize_sequence(trna.anticodon);
        const std::string cognate = reverse_complement(anticodon);
        const int cognate_idx = codon_index(cognate);
        if (cognate_idx < 0) {
            throw InputError("Invalid anticodon: '" + trna.anticodon + "'");
        }

        const char cognate_aa = table.translate(cognate_idx);
        const char aa = trna.amino_acid.empty() ? cognate_aa
                                                : amino_acid_code(trna.amino_acid);
        // Suppressor or unlabelled stop-reading tRNAs decode nothing here
        if (aa == 0 || aa == '*') continue;

        auto add = [&](char third, double efficiency) {
            const int idx = codon_index(cognate[0], cognate[1], third);
            if (table.translate(idx) == aa) raw[idx] += efficiency * trna.copies;
        };

        switch (anticodon[0]) {
            case 'A':  // inosine
                add('T', 1.0 - params.s_iu);
                add('C', 1.0 - params.s_ic);
                add('A', 1.0 - params.s_ia);
                break;
            case 'G':
                add('C', 1.0);
                add('T', 1.0 - params.s_gu);
                break;
            case 'T':
                add('A', 1.0);
                add('G', 1.0 - params.s_ug);
                break;
            case 'C':
                if (aa == cognate_aa) {
                    add('G', 1.0);
                } else {
                    // Lysidine/agmatidine modified tRNA-Ile(CAT) reads ATA
                    add('A', 1.0 - params.s_la);
                }
                break;
            default:
                break;
        }
    }

    // Normalization denominators
    std::map<char, double> family_max;
    double global_max = 0.0;
    for (int c = 0; c < static_cast<int>(NUM_CODONS); ++c) {
        if (table.subfamily_of(c) < 0) continue;
        auto& m = family_max[table.translate(c)];
        m = std::max(m, raw[c]);
        global_max = std::max(global_max, raw[c]);
    }

    std::vector<TrnaWeightEntry> entries;
    entries.reserve(NUM_CODONS);
    for (int c = 0; c < static_cast<int>(NUM_CODONS); ++c) {
        const int sf = table.subfamily_of(c);
        if (sf < 0) continue;

        TrnaWeightEntry e;
        e.index = c;
        e.codon = table[c].codon;
        e.amino_acid = table[c].amino_acid;
        e.subfam = table.subfamilies()[sf].label;
        e.raw = raw[c];
        const double denom = norm == TrnaNormalization::Global
                                 ? global_max
                                 : family_max[table.translate(c)];
        e.weight = denom > 0.0 ? raw[c] / denom : 0.0;
        entries.push_back(std::move(e));
    }

    // Floor: geometric mean of the non-zero synonymous-codon weights
    double log_sum = 0.0;
    size_t n_nonzero = 0;
    for (const auto& e : entries) {
        if (e.weight > 0.0 && in_multi_codon_subfamily(table, e.index)) {
            log_sum += std::log(e.weight);
            ++n_nonzero;
        }
    }
    if (n_nonzero == 0) {
        throw InsufficientData("No tRNA in the pool decodes a synonymous codon");
    }
    const double floor_weight = std::exp(log_sum / static_cast<double>(n_nonzero));

    for (auto& e : entries) {
        if (e.weight <= 0.0) {
            e.weight = floor_weight;
            e.floored = true;
        }
    }
    return entries;
}

CodonWeights trna_weight_lookup(const std::vector<TrnaWeightEntry>& weights,
                                const CodonTable& table) {
    CodonWeights w;
    w.fill(NA);
    for (const auto& e : weights) {
        if (e.index < 0 || e.index >= static_cast<int>(NUM_CODONS)) continue;
        if (!in_multi_codon_subfamily(table, e.index)) continue;
        w[e.index] = e.weight;
    }
    return w;
}

} // namespace cubkit
