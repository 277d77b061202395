#pragma once
// Effective number of codons
//
// Subfamilies are grouped by size k. With F_k the mean homozygosity of the
// observed subfamilies of size k and N_k the number of size-k subfamilies
// in the code table:
//
//   ENC = N_1 + sum_{k>=2} N_k / F_k
//
// Size classes with no observed subfamily are left out. F_k is clamped to
// [1/k, 1], so ENC never exceeds the number of sense codons (61 in the
// standard code) and never drops below the number of counted subfamilies.

#include "cubkit/codon_tables.hpp"
#include "cubkit/types.hpp"

#include <string>

namespace cubkit {

enum class EncMethod {
    Wright,   // F = (n * sum p^2 - 1) / (n - 1), subfamilies with n >= 2
    Sun       // F = sum ((n_i + 1) / (n + k))^2, class mean weighted by n
};

const char* enc_method_name(EncMethod m);

// "wright" or "sun"; throws InputError otherwise
EncMethod parse_enc_method(const std::string& name);

// NA when no multi-codon subfamily is usable
double compute_enc(const CodonCounts& counts, const CodonTable& table,
                   EncMethod method = EncMethod::Wright);

GeneMap<double> compute_enc(const CodonCountMatrix& counts, const CodonTable& table,
                            EncMethod method = EncMethod::Wright);

} // namespace cubkit
