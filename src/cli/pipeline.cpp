#include "pipeline.hpp"
#include "cubkit/codon_counter.hpp"
#include "cubkit/errors.hpp"
#include "cubkit/sequence_io.hpp"

#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cubkit {
namespace cli {

int run_subcommand(const std::string& command, int argc, char* argv[],
                   const CommandBody& body) {
    try {
        const Options opts = parse_args(command, argc, argv);
        set_threads(opts.num_threads);

        log_utils::StepLogger log(opts.verbose);
        body(opts, log);
        log.done();
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'cubkit " << command << " --help' for usage.\n";
        }
        return e.exit_code();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

void set_threads(int num_threads) {
#ifdef _OPENMP
    if (num_threads > 0) {
        omp_set_num_threads(num_threads);
    }
#else
    (void)num_threads;
#endif
}

OutputTarget::OutputTarget(const std::string& path) : path_(path) {
    if (path.empty() || path == "-") return;
    file_.open(path);
    if (!file_) {
        throw InputError("Cannot open output file: " + path);
    }
}

void OutputTarget::close() {
    std::ostream& out = stream();
    out.flush();
    if (!out) {
        throw InputError("Write failed: " + (path_.empty() ? std::string("<stdout>") : path_));
    }
    if (file_.is_open()) file_.close();
}

GeneMap<std::string> load_cds(const std::string& path,
                              const Options& opts,
                              const CodonTable& table,
                              log_utils::StepLogger& log,
                              QcResult* qc_out) {
    GeneMap<std::string> seqs = read_fasta_map(path);
    log.step("Read " + std::to_string(seqs.size()) + " sequences from " + path);

    if (!opts.run_qc) {
        for (size_t i = 0; i < seqs.size(); ++i) {
            seqs.value(i) = normalize_sequence(seqs.value(i));
        }
        if (seqs.empty()) {
            throw InputError("No sequences in " + path);
        }
        return seqs;
    }

    QcResult qc = check_cds(seqs, table, opts.qc);
    log.step("QC: " + std::to_string(qc.passed.size()) + " passed, " +
             std::to_string(qc.excluded.size()) + " excluded");
    if (log.verbose()) {
        for (const auto& ex : qc.excluded) {
            std::cerr << "  excluded " << ex.id << ":";
            for (QcFailure f : ex.failures) std::cerr << " " << qc_failure_label(f);
            std::cerr << "\n";
        }
    } else if (!qc.excluded.empty()) {
        std::cerr << "Warning: " << qc.excluded.size() << " of " << seqs.size()
                  << " sequences failed QC and were excluded (-v for details)\n";
    }
    if (qc.passed.empty()) {
        throw InputError("No sequence in " + path + " passed QC");
    }

    GeneMap<std::string> passed = std::move(qc.passed);
    if (qc_out) {
        qc_out->excluded = std::move(qc.excluded);
    }
    return passed;
}

CodonCountMatrix load_counts(const Options& opts,
                             const CodonTable& table,
                             log_utils::StepLogger& log) {
    const GeneMap<std::string> seqs = load_cds(opts.input_file, opts, table, log);
    CodonCountMatrix counts = count_codons(seqs);
    log.step("Counted codons in " + std::to_string(counts.size()) + " genes");
    return counts;
}

std::vector<std::string> select_listed_genes(const CodonCountMatrix& counts,
                                             const std::vector<std::string>& ids,
                                             const std::string& source,
                                             log_utils::StepLogger& log) {
    std::vector<std::string> kept;
    std::vector<std::string> dropped;
    for (const auto& id : ids) {
        if (counts.contains(id)) {
            kept.push_back(id);
        } else {
            dropped.push_back(id);
        }
    }

    if (!dropped.empty()) {
        std::cerr << "Warning: " << dropped.size() << " of " << ids.size() << " genes listed in "
                  << source << " are absent or failed QC";
        if (log.verbose()) {
            std::cerr << ":";
            for (const auto& id : dropped) std::cerr << " " << id;
        }
        std::cerr << "\n";
    }
    if (kept.empty()) {
        throw InsufficientData("No gene listed in " + source + " is among the counted sequences");
    }

    log.step("Using " + std::to_string(kept.size()) + " genes from " + source);
    return kept;
}

TrnaPool load_trna_pool(const Options& opts, log_utils::StepLogger& log) {
    if (!opts.trna_file.empty()) {
        TrnaPool pool = read_trna_table(opts.trna_file);
        log.step("Read " + std::to_string(pool.size()) + " tRNA entries from " + opts.trna_file);
        return pool;
    }

    size_t skipped = 0;
    TrnaPool pool = trna_pool_from_gtrnadb(opts.gtrnadb_file, &skipped);
    log.step("Read " + std::to_string(pool.size()) + " anticodons from " + opts.gtrnadb_file +
             " (" + std::to_string(skipped) + " genes skipped)");
    return pool;
}

}  // namespace cli
}  // namespace cubkit
