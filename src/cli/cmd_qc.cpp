/**
 * @file cmd_qc.cpp
 * @brief Filter a CDS FASTA through the structural checks.
 *
 * Passing sequences are written as FASTA (trimmed unless --keep-start /
 * --keep-stop); excluded genes and every failed check go to --report.
 */

#include "pipeline.hpp"
#include "cubkit/sequence_io.hpp"

namespace cubkit {
namespace cli {

namespace {

void run_qc(const Options& opts, log_utils::StepLogger& log) {
    const CodonTable& table = get_codon_table(opts.genetic_code);

    QcResult qc;
    const GeneMap<std::string> passed = load_cds(opts.input_file, opts, table, log, &qc);

    OutputTarget out(opts.output_file);
    write_fasta(out.stream(), passed);
    out.close();

    if (!opts.report_file.empty()) {
        OutputTarget report(opts.report_file);
        write_qc_report_tsv(report.stream(), qc);
        report.close();
        log.step("Wrote " + std::to_string(qc.excluded.size()) +
                 " exclusions to " + opts.report_file);
    }
}

struct QcRegistrar {
    QcRegistrar() {
        SubcommandRegistry::instance().add(
            {"qc", "Check CDS structure and write the passing sequences", 20, run_qc});
    }
};
static QcRegistrar registrar;

}  // namespace

}  // namespace cli
}  // namespace cubkit
