#include "cubkit/sequence_qc.hpp"

#include <algorithm>

namespace cubkit {

const char* qc_failure_label(QcFailure f) {
    switch (f) {
        case QcFailure::TooShort: return "too_short";
        case QcFailure::BadLength: return "length_not_multiple_of_3";
        case QcFailure::NoStart: return "no_start_codon";
        case QcFailure::NoStop: return "no_stop_codon";
        case QcFailure::InternalStop: return "internal_stop_codon";
    }
    return "unknown";
}

namespace {

std::vector<int> accepted_starts(const CodonTable& table, const QcOptions& opts) {
    if (opts.start_codons.empty()) return table.start_codons();

    std::vector<int> starts;
    for (const auto& codon : opts.start_codons) {
        const int idx = codon_index(codon);
        if (idx < 0) {
            throw InputError("Invalid start codon: '" + codon + "'");
        }
        starts.push_back(idx);
    }
    return starts;
}

bool is_start_in(const std::vector<int>& starts, int idx) {
    return idx >= 0 && std::find(starts.begin(), starts.end(), idx) != starts.end();
}

std::vector<QcFailure> check_with_starts(const std::string& seq,
                                         const CodonTable& table,
                                         const QcOptions& opts,
                                         const std::vector<int>& starts) {
    std::vector<QcFailure> failures;
    const size_t n_codons = seq.size() / 3;

    if (seq.size() < opts.min_len) {
        failures.push_back(QcFailure::TooShort);
    }
    if (opts.check_len && seq.size() % 3 != 0) {
        failures.push_back(QcFailure::BadLength);
    }
    if (opts.check_start) {
        const int first = n_codons > 0 ? codon_index(seq[0], seq[1], seq[2]) : -1;
        if (!is_start_in(starts, first)) failures.push_back(QcFailure::NoStart);
    }
    if (opts.check_stop) {
        const size_t p = (n_codons - (n_codons > 0 ? 1 : 0)) * 3;
        const int last = n_codons > 0 ? codon_index(seq[p], seq[p + 1], seq[p + 2]) : -1;
        if (last < 0 || !table.is_stop(last)) failures.push_back(QcFailure::NoStop);
    }
    if (opts.check_istop && n_codons > 1) {
        // Reassignable stops read as sense inside a CDS
        for (size_t c = 0; c + 1 < n_codons; ++c) {
            const int idx = codon_index(seq[3 * c], seq[3 * c + 1], seq[3 * c + 2]);
            if (idx >= 0 && table.translate(idx) == '*') {
                failures.push_back(QcFailure::InternalStop);
                break;
            }
        }
    }
    return failures;
}

} // namespace

std::vector<QcFailure> check_sequence(const std::string& seq,
                                      const CodonTable& table,
                                      const QcOptions& opts) {
    return check_with_starts(seq, table, opts, accepted_starts(table, opts));
}

QcResult check_cds(const GeneMap<std::string>& seqs,
                   const CodonTable& table,
                   const QcOptions& opts) {
    const std::vector<int> starts = accepted_starts(table, opts);

    QcResult result;
    result.passed.reserve(seqs.size());

    for (size_t i = 0; i < seqs.size(); ++i) {
        std::string seq = normalize_sequence(seqs.value(i));
        auto failures = check_with_starts(seq, table, opts, starts);
        if (!failures.empty()) {
            result.excluded.push_back({seqs.id(i), std::move(failures)});
            continue;
        }

        const size_t n_codons = seq.size() / 3;
        size_t begin = 0;
        size_t end = seq.size();
        if (opts.rm_stop && n_codons > 0) {
            const size_t p = (n_codons - 1) * 3;
            const int last = codon_index(seq[p], seq[p + 1], seq[p + 2]);
            if (last >= 0 && table.is_stop(last) && end == p + 3) end = p;
        }
        if (opts.rm_start && n_codons > 0 && begin + 3 <= end &&
            is_start_in(starts, codon_index(seq[0], seq[1], seq[2]))) {
            begin = 3;
        }
        result.passed.insert(seqs.id(i), seq.substr(begin, end - begin));
    }

    return result;
}

} // namespace cubkit
