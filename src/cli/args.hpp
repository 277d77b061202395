#pragma once

#include "cubkit/enc.hpp"
#include "cubkit/optimal_codons.hpp"
#include "cubkit/sequence_qc.hpp"
#include "cubkit/trna_weights.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cubkit {
namespace cli {

// Thrown instead of calling exit(): --help/--version (code 0) and usage errors (code 1)
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& msg = "")
        : std::runtime_error(msg), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct Options {
    std::string command;
    std::string input_file;
    std::string output_file;          // empty = stdout
    std::string genetic_code = "1";
    int num_threads = 0;              // 0 = OpenMP default
    bool verbose = false;

    // Sequence QC, applied before any codon counting
    bool run_qc = true;
    QcOptions qc;
    std::string report_file;          // qc: exclusion report

    // count / rscu / cai
    double pseudo_count = 0.0;
    std::string subset_file;          // rscu: gene ids to pool

    // enc / optimal
    EncMethod enc_method = EncMethod::Wright;

    // optimal
    double fdr = 0.01;
    size_t min_genes = 3;
    std::string score_file;
    ScoreDirection score_direction = ScoreDirection::HigherIsBiased;

    // fop
    std::string optimal_file;

    // cai
    std::string ref_file;             // reference CDS FASTA
    std::string ref_ids_file;         // reference gene ids within the input

    // trna-weights / tai
    std::string trna_file;
    std::string gtrnadb_file;
    TrnaNormalization trna_norm = TrnaNormalization::PerFamily;
    WobbleParams wobble;

    // codon-table
    bool list_codes = false;
};

// Print version string to stdout
void print_version();

// Print usage/help for one subcommand to stdout
void print_usage(const std::string& command, const char* program_name = "cubkit");

// Flags shared by every command that reads CDS input. Consumes a value
// from argv when the flag takes one; returns false for unknown flags.
bool parse_common_flag(int argc, char* argv[], int& i, Options& opts);

// Parse the arguments following the subcommand name (argv[0] is the
// command). Throws ParseArgsExit on --help/--version and usage errors.
Options parse_args(const std::string& command, int argc, char* argv[]);

}  // namespace cli
}  // namespace cubkit
