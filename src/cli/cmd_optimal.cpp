/**
 * @file cmd_optimal.cpp
 * @brief Optimal codons by regression of codon share on a per-gene bias score.
 */

#include "pipeline.hpp"
#include "cubkit/optimal_codons.hpp"
#include "cubkit/sequence_io.hpp"

#include <memory>

namespace cubkit {
namespace cli {

namespace {

void run_optimal(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);
    const CodonCountMatrix counts = load_counts(opts, table, log);

    OptimalCodonOptions oc;
    oc.fdr = opts.fdr;
    oc.min_genes = opts.min_genes;
    oc.enc_method = opts.enc_method;

    std::unique_ptr<GeneMap<double>> scores;
    if (!opts.score_file.empty()) {
        scores = std::make_unique<GeneMap<double>>(read_gene_scores(opts.score_file));
        log.step("Read " + std::to_string(scores->size()) + " gene scores from " +
                 opts.score_file);
        oc.gene_score = scores.get();
        oc.score_direction = opts.score_direction;
    }

    const auto records = estimate_optimal_codons(counts, table, oc);
    log.step(std::to_string(optimal_codon_set(records).size()) + " of " +
             std::to_string(records.size()) + " codons optimal at FDR " +
             std::to_string(opts.fdr));

    OutputTarget out(opts.output_file);
    write_optimal_codons_tsv(out.stream(), records);
    out.close();
}

struct OptimalRegistrar {
    OptimalRegistrar() {
        SubcommandRegistry::instance().add(
            {"optimal", "Optimal codons from codon usage vs. gene bias", 40, run_optimal});
    }
};
static OptimalRegistrar registrar;

}  // namespace

}  // namespace cli
}  // namespace cubkit
