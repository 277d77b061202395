#include "cubkit/enc.hpp"

#include <algorithm>
#include <map>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cubkit {

const char* enc_method_name(EncMethod m) {
    switch (m) {
        case EncMethod::Wright: return "wright";
        case EncMethod::Sun: return "sun";
    }
    return "unknown";
}

EncMethod parse_enc_method(const std::string& name) {
    if (name == "wright" || name == "Wright") return EncMethod::Wright;
    if (name == "sun" || name == "Sun") return EncMethod::Sun;
    throw InputError("Unknown ENC method '" + name + "' (expected wright or sun)");
}

namespace {

struct ClassAccumulator {
    size_t n_subfams = 0;   // in the code table
    double f_sum = 0.0;     // sum of F (Wright) or n*F (Sun)
    double weight = 0.0;    // number of observed subfamilies (Wright) or sum n (Sun)
};

} // namespace

double compute_enc(const CodonCounts& counts, const CodonTable& table, EncMethod method) {
    std::map<size_t, ClassAccumulator> classes;

    for (const auto& sf : table.subfamilies()) {
        const size_t k = sf.codons.size();
        auto& acc = classes[k];
        ++acc.n_subfams;
        if (k < 2) continue;

        double n = 0.0;
        for (int c : sf.codons) n += counts[c];

        if (method == EncMethod::Wright) {
            if (n < 2.0) continue;
            double sum_p2 = 0.0;
            for (int c : sf.codons) {
                const double p = counts[c] / n;
                sum_p2 += p * p;
            }
            acc.f_sum += (n * sum_p2 - 1.0) / (n - 1.0);
            acc.weight += 1.0;
        } else {
            if (n < 1.0) continue;
            double f = 0.0;
            for (int c : sf.codons) {
                const double p = (counts[c] + 1.0) / (n + static_cast<double>(k));
                f += p * p;
            }
            acc.f_sum += n * f;
            acc.weight += n;
        }
    }

    double enc = 0.0;
    bool any = false;
    for (const auto& [k, acc] : classes) {
        if (k < 2 || acc.weight <= 0.0) continue;
        const double f = std::clamp(acc.f_sum / acc.weight,
                                    1.0 / static_cast<double>(k), 1.0);
        enc += static_cast<double>(acc.n_subfams) / f;
        any = true;
    }
    if (!any) return NA;

    auto single = classes.find(1);
    if (single != classes.end()) enc += static_cast<double>(single->second.n_subfams);
    return enc;
}

GeneMap<double> compute_enc(const CodonCountMatrix& counts, const CodonTable& table,
                            EncMethod method) {
    const size_t n = counts.size();
    std::vector<double> values(n, NA);

    #pragma omp parallel for schedule(dynamic, 256)
    for (size_t i = 0; i < n; ++i) {
        values[i] = compute_enc(counts.value(i), table, method);
    }
    return counts.with_values(std::move(values));
}

} // namespace cubkit
