/**
 * @file cmd_count.cpp
 * @brief Per-gene codon counts and pooled RSCU.
 */

#include "pipeline.hpp"
#include "cubkit/rscu.hpp"
#include "cubkit/sequence_io.hpp"

namespace cubkit {
namespace cli {

namespace {

void run_count(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);
    const CodonCountMatrix counts = load_counts(opts, table, log);

    OutputTarget out(opts.output_file);
    write_counts_tsv(out.stream(), counts);
    out.close();
}

void run_rscu(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);
    const CodonCountMatrix counts = load_counts(opts, table, log);

    std::vector<RscuEntry> rscu;
    if (opts.subset_file.empty()) {
        rscu = estimate_rscu(counts, table, opts.pseudo_count);
    } else {
        const auto ids = select_listed_genes(counts, read_id_list(opts.subset_file),
                                             opts.subset_file, log);
        rscu = estimate_rscu(counts, ids, table, opts.pseudo_count);
    }

    OutputTarget out(opts.output_file);
    write_rscu_tsv(out.stream(), rscu);
    out.close();
}

struct CountRegistrar {
    CountRegistrar() {
        auto& registry = SubcommandRegistry::instance();
        registry.add({"count", "Per-gene codon counts (64 columns)", 30, run_count});
        registry.add({"rscu", "Relative synonymous codon usage over all or selected genes",
                      31, run_rscu});
    }
};
static CountRegistrar registrar;

}  // namespace

}  // namespace cli
}  // namespace cubkit
