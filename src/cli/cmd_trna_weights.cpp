/**
 * @file cmd_trna_weights.cpp
 * @brief Codon weights from a tRNA gene pool (dos Reis wobble model).
 */

#include "pipeline.hpp"
#include "cubkit/sequence_io.hpp"
#include "cubkit/trna_weights.hpp"

#include <algorithm>

namespace cubkit {
namespace cli {

namespace {

void run_trna_weights(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);
    const TrnaPool pool = load_trna_pool(opts, log);

    const auto weights = estimate_trna_weights(pool, table, opts.wobble, opts.trna_norm);
    const auto n_floored = std::count_if(weights.begin(), weights.end(),
                                         [](const TrnaWeightEntry& e) { return e.floored; });
    log.step(std::to_string(n_floored) + " codons without a decoding tRNA set to the floor");

    OutputTarget out(opts.output_file);
    write_trna_weights_tsv(out.stream(), weights);
    out.close();
}

struct TrnaWeightsRegistrar {
    TrnaWeightsRegistrar() {
        SubcommandRegistry::instance().add(
            {"trna-weights", "Codon weights from tRNA gene copy numbers", 60, run_trna_weights});
    }
};
static TrnaWeightsRegistrar registrar;

}  // namespace

}  // namespace cli
}  // namespace cubkit
