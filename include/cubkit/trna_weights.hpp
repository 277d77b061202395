#pragma once
// tRNA adaptation weights (dos Reis et al. 2004)
//
// Each codon's raw weight is the copy number of every tRNA able to decode
// it, discounted by the wobble efficiency of the codon:anticodon pair
// (1 - s). Anticodons are written 5'->3', so the first anticodon base
// (position 34) faces the third codon base. Anticodon A34 is read as
// inosine.
//
//   codon xyT : A34 (1 - s_IU), G34 (1 - s_GU)
//   codon xyC : G34,            A34 (1 - s_IC)
//   codon xyA : T34,            A34 (1 - s_IA), C34 (1 - s_LA, lysidine Ile tRNA)
//   codon xyG : C34,            T34 (1 - s_UG)
//
// A tRNA only decodes codons of its own amino acid.

#include "cubkit/cai.hpp"
#include "cubkit/codon_tables.hpp"
#include "cubkit/types.hpp"

#include <string>
#include <vector>

namespace cubkit {

struct TrnaGene {
    std::string amino_acid;   // three-letter; empty = amino acid of the cognate codon
    std::string anticodon;    // 5'->3', DNA alphabet
    double copies = 0.0;      // gene copy number or abundance
};

using TrnaPool = std::vector<TrnaGene>;

// One-letter amino acid for a tRNA label, case-insensitive. GtRNAdb
// isoacceptor suffixes fold into the base amino acid ("Ile2" -> 'I').
// 0 when unknown.
char trna_amino_acid_code(const std::string& label);

// "AGC", "Ala-AGC" or "Ile2-CAT" (U accepted). Throws InputError on a bad key.
TrnaGene parse_trna_key(const std::string& key, double copies);

// Selective constraints s (0 = Watson-Crick efficiency)
struct WobbleParams {
    double s_iu = 0.0;
    double s_gu = 0.41;
    double s_ic = 0.28;
    double s_ia = 0.9999;
    double s_ug = 0.68;
    double s_la = 0.89;
};

enum class TrnaNormalization {
    PerFamily,   // max weight within each amino acid is 1
    Global       // max weight over all sense codons is 1
};

struct TrnaWeightEntry {
    int index = -1;
    std::string codon;
    std::string amino_acid;
    std::string subfam;
    double raw = 0.0;      // summed pairing capacity
    double weight = NA;    // normalized, zero replaced by the floor
    bool floored = false;  // weight is the floor value
};

/**
 * One entry per sense codon, in codon index order.
 *
 * Codons without pairing capacity get the geometric mean of the non-zero
 * weights of multi-codon subfamilies. Throws InsufficientData when no tRNA
 * decodes any synonymous codon.
 */
std::vector<TrnaWeightEntry> estimate_trna_weights(const TrnaPool& pool,
                                                   const CodonTable& table,
                                                   const WobbleParams& params = {},
                                                   TrnaNormalization norm = TrnaNormalization::PerFamily);

// Weights for the tAI: NA for stops and single-codon subfamilies
CodonWeights trna_weight_lookup(const std::vector<TrnaWeightEntry>& weights,
                                const CodonTable& table);

} // namespace cubkit
