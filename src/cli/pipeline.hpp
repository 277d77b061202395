#pragma once
// Shared steps of the subcommands: reading CDS through QC, output
// streams, tRNA pools and thread setup.

#include "args.hpp"
#include "subcommand.hpp"
#include "cubkit/codon_tables.hpp"
#include "cubkit/log_utils.hpp"
#include "cubkit/sequence_qc.hpp"
#include "cubkit/trna_weights.hpp"
#include "cubkit/types.hpp"

#include <fstream>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace cubkit {
namespace cli {

/**
 * Parse arguments for `command`, set up threads and logging, and run the
 * body. Usage errors and CubError exceptions are reported on stderr and
 * turned into exit code 1.
 */
int run_subcommand(const std::string& command, int argc, char* argv[],
                   const CommandBody& body);

// Apply -t to OpenMP; no-op without OpenMP or when threads == 0
void set_threads(int num_threads);

// stdout for "" or "-", otherwise the opened file. Throws InputError.
class OutputTarget {
public:
    explicit OutputTarget(const std::string& path);

    std::ostream& stream() { return file_.is_open() ? file_ : std::cout; }

    // Flush and check for write errors
    void close();

private:
    std::string path_;
    std::ofstream file_;
};

/**
 * Read a CDS FASTA and run QC (unless --no-qc), logging how many
 * sequences were dropped. Excluded genes go to `qc_out` when given.
 * Throws InputError when no sequence survives.
 */
GeneMap<std::string> load_cds(const std::string& path,
                              const Options& opts,
                              const CodonTable& table,
                              log_utils::StepLogger& log,
                              QcResult* qc_out = nullptr);

// load_cds() followed by codon counting
CodonCountMatrix load_counts(const Options& opts,
                             const CodonTable& table,
                             log_utils::StepLogger& log);

/**
 * Ids from a gene list (--ref-ids, --subset) that are rows of `counts`.
 * Listed genes that are absent or failed QC are dropped with a warning;
 * throws InsufficientData when none is left.
 */
std::vector<std::string> select_listed_genes(const CodonCountMatrix& counts,
                                             const std::vector<std::string>& ids,
                                             const std::string& source,
                                             log_utils::StepLogger& log);

// From --trna or --gtrnadb
TrnaPool load_trna_pool(const Options& opts, log_utils::StepLogger& log);

}  // namespace cli
}  // namespace cubkit
