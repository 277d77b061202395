/**
 * @file cmd_indices.cpp
 * @brief Per-gene codon usage indices: ENC, Fop, CAI and tAI.
 *
 * All four write a two-column TSV (gene, value) with NA where the index is
 * undefined for a gene.
 */

#include "pipeline.hpp"
#include "cubkit/cai.hpp"
#include "cubkit/codon_counter.hpp"
#include "cubkit/enc.hpp"
#include "cubkit/errors.hpp"
#include "cubkit/fop.hpp"
#include "cubkit/rscu.hpp"
#include "cubkit/sequence_io.hpp"
#include "cubkit/tai.hpp"
#include "cubkit/trna_weights.hpp"

namespace cubkit {
namespace cli {

namespace {

void write_values(const Options& opts, const std::string& column,
                  const GeneMap<double>& values) {
    OutputTarget out(opts.output_file);
    write_gene_values_tsv(out.stream(), column, values);
    out.close();
}

void run_enc(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);
    const CodonCountMatrix counts = load_counts(opts, table, log);
    const GeneMap<double> enc = compute_enc(counts, table, opts.enc_method);
    log.step(std::string("ENC (") + enc_method_name(opts.enc_method) + ") computed");
    write_values(opts, "enc", enc);
}

void run_fop(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);
    const std::vector<int> optimal = read_codon_list(opts.optimal_file);
    if (optimal.empty()) {
        throw InputError("No optimal codons in " + opts.optimal_file);
    }
    log.step("Read " + std::to_string(optimal.size()) + " optimal codons");

    const CodonCountMatrix counts = load_counts(opts, table, log);
    write_values(opts, "fop", compute_fop(counts, table, optimal));
}

void run_cai(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);
    const CodonCountMatrix counts = load_counts(opts, table, log);

    std::vector<RscuEntry> reference;
    if (!opts.ref_file.empty()) {
        const GeneMap<std::string> ref_seqs = load_cds(opts.ref_file, opts, table, log);
        reference = estimate_rscu(count_codons(ref_seqs), table, opts.pseudo_count);
    } else {
        const auto ids = select_listed_genes(counts, read_id_list(opts.ref_ids_file),
                                             opts.ref_ids_file, log);
        reference = estimate_rscu(counts, ids, table, opts.pseudo_count);
    }

    write_values(opts, "cai", compute_cai(counts, table, reference));
}

void run_tai(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);
    const TrnaPool pool = load_trna_pool(opts, log);
    const auto weights = estimate_trna_weights(pool, table, opts.wobble, opts.trna_norm);

    const CodonCountMatrix counts = load_counts(opts, table, log);
    write_values(opts, "tai", compute_tai(counts, table, weights));
}

struct IndicesRegistrar {
    IndicesRegistrar() {
        auto& registry = SubcommandRegistry::instance();
        registry.add({"enc", "Effective number of codons per gene", 35, run_enc});
        registry.add({"fop", "Frequency of optimal codons per gene", 45, run_fop});
        registry.add({"cai", "Codon adaptation index per gene", 50, run_cai});
        registry.add({"tai", "tRNA adaptation index per gene", 65, run_tai});
    }
};
static IndicesRegistrar registrar;

}  // namespace

}  // namespace cli
}  // namespace cubkit
