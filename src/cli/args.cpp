#include "args.hpp"
#include "cubkit/errors.hpp"
#include "cubkit/version.h"

#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cubkit {
namespace cli {

namespace {

// Commands that take a CDS FASTA through -i
bool reads_cds(const std::string& command) {
    return command != "codon-table" && command != "trna-weights";
}

bool command_in(const std::string& command, std::initializer_list<const char*> names) {
    return std::any_of(names.begin(), names.end(),
                       [&](const char* n) { return command == n; });
}

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw ParseArgsExit(1, "Error: Missing value for " + flag);
    }
    return argv[++i];
}

size_t parse_size(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        const unsigned long long parsed = std::stoull(value, &idx);
        if (idx != value.size() || value[0] == '-') {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return static_cast<size_t>(parsed);
    } catch (const std::invalid_argument&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    } catch (const std::out_of_range&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        const int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    } catch (const std::out_of_range&) {
        throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
    }
}

double parse_double(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        const double parsed = std::stod(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
    } catch (const std::out_of_range&) {
        throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
    }
}

double parse_penalty(const std::string& flag, const std::string& value) {
    const double s = parse_double(flag, value);
    if (s < 0.0 || s > 1.0) {
        throw ParseArgsExit(1, "Error: " + flag + " must be in [0, 1]");
    }
    return s;
}

std::vector<std::string> parse_start_codons(const std::string& value) {
    std::vector<std::string> codons;
    if (value == "table") return codons;  // the table's initiation codons

    std::istringstream iss(value);
    std::string codon;
    while (std::getline(iss, codon, ',')) {
        codon = normalize_sequence(codon);
        if (codon_index(codon) < 0) {
            throw ParseArgsExit(1, "Error: Invalid start codon: " + codon);
        }
        codons.push_back(codon);
    }
    if (codons.empty()) {
        throw ParseArgsExit(1, "Error: --start-codons needs at least one codon");
    }
    return codons;
}

void print_common_usage() {
    std::cout << "Input / output:\n";
    std::cout << "  -i, --input <file>       CDS FASTA (plain or .gz)\n";
    std::cout << "  -o, --output <file>      Output TSV (default: stdout)\n";
    std::cout << "  -g, --genetic-code <id>  NCBI translation table (default: 1)\n";
    std::cout << "  -t, --threads <int>      Number of threads (default: auto)\n";
    std::cout << "\nSequence QC:\n";
    std::cout << "  --no-qc                  Skip QC; sequences are counted as given\n";
    std::cout << "  --no-check-len           Accept lengths not divisible by 3\n";
    std::cout << "  --no-check-start         Accept sequences without a start codon\n";
    std::cout << "  --no-check-stop          Accept sequences without a stop codon\n";
    std::cout << "  --no-check-istop         Accept internal stop codons\n";
    std::cout << "  --min-len <int>          Minimum length in nt (default: 6)\n";
    std::cout << "  --start-codons <list>    Comma-separated start codons, or 'table'\n";
    std::cout << "                           for the table's initiation codons (default: ATG)\n";
    std::cout << "  --keep-start             Keep the start codon of passing sequences\n";
    std::cout << "  --keep-stop              Keep the stop codon of passing sequences\n";
}

void print_trna_usage() {
    std::cout << "tRNA pool (one required):\n";
    std::cout << "  --trna <file>            Table of '<anticodon>\\t<copies>' or\n";
    std::cout << "                           '<Aa>-<anticodon>\\t<copies>'\n";
    std::cout << "  --gtrnadb <file>         GtRNAdb tRNA gene FASTA\n";
    std::cout << "\nWeights:\n";
    std::cout << "  --global-norm            Normalize by the global maximum instead of\n";
    std::cout << "                           per amino acid\n";
    std::cout << "  --s-iu, --s-gu, --s-ic, --s-ia, --s-ug, --s-la <f>\n";
    std::cout << "                           Wobble pairing penalties in [0, 1]\n";
    std::cout << "                           (default: 0, 0.41, 0.28, 0.9999, 0.68, 0.89)\n";
}

}  // namespace

void print_version() {
    std::cout << "cubkit " << CUBKIT_VERSION << "\n";
}

void print_usage(const std::string& command, const char* program_name) {
    std::cout << "cubkit v" << CUBKIT_VERSION << "\n\n";

    if (command == "codon-table") {
        std::cout << "Usage: " << program_name << " codon-table [-g <id>] [options]\n\n";
        std::cout << "Print a genetic code table with subfamily labels.\n\n";
        std::cout << "Options:\n";
        std::cout << "  -g, --genetic-code <id>  NCBI translation table (default: 1)\n";
        std::cout << "  -o, --output <file>      Output TSV (default: stdout)\n";
        std::cout << "  --list                   List supported table ids and names\n";
    } else if (command == "trna-weights") {
        std::cout << "Usage: " << program_name << " trna-weights --trna <file> [options]\n\n";
        std::cout << "Estimate per-codon tRNA adaptation weights.\n\n";
        std::cout << "  -g, --genetic-code <id>  NCBI translation table (default: 1)\n";
        std::cout << "  -o, --output <file>      Output TSV (default: stdout)\n\n";
        print_trna_usage();
    } else {
        std::cout << "Usage: " << program_name << " " << command << " -i <cds.fa> [options]\n\n";
        print_common_usage();
        std::cout << "\n";
        if (command == "qc") {
            std::cout << "qc:\n";
            std::cout << "  --report <file>          Write excluded genes and reasons (TSV)\n";
            std::cout << "                           Output (-o) is the passing FASTA\n";
        } else if (command == "rscu") {
            std::cout << "rscu:\n";
            std::cout << "  --pseudo <f>             Pseudocount added to each codon (default: 0)\n";
            std::cout << "  --subset <file>          Pool only the gene ids listed in file\n";
        } else if (command == "enc") {
            std::cout << "enc:\n";
            std::cout << "  --method <name>          wright (default) or sun\n";
        } else if (command == "optimal") {
            std::cout << "optimal:\n";
            std::cout << "  --fdr <f>                q-value threshold (default: 0.01)\n";
            std::cout << "  --min-genes <int>        Informative genes per subfamily (default: 3)\n";
            std::cout << "  --method <name>          ENC variant for the bias score (default: wright)\n";
            std::cout << "  --score <file>           Per-gene score '<id>\\t<value>' instead of ENC\n";
            std::cout << "  --score-direction <d>    higher (default) or lower: which end of\n";
            std::cout << "                           --score marks strongly biased genes\n";
        } else if (command == "fop") {
            std::cout << "fop:\n";
            std::cout << "  --optimal <file>         Optimal codons: list or 'optimal' output\n";
        } else if (command == "cai") {
            std::cout << "cai (one reference required):\n";
            std::cout << "  --ref <file>             Reference CDS FASTA (QC applied)\n";
            std::cout << "  --ref-ids <file>         Reference gene ids within the input\n";
            std::cout << "  --pseudo <f>             Pseudocount for reference RSCU (default: 0)\n";
        } else if (command == "tai") {
            print_trna_usage();
        }
    }

    std::cout << "\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
}

bool parse_common_flag(int argc, char* argv[], int& i, Options& opts) {
    const std::string arg = argv[i];

    if (arg == "-i" || arg == "--input") {
        opts.input_file = require_value(argc, argv, i, arg);
    } else if (arg == "-o" || arg == "--output") {
        opts.output_file = require_value(argc, argv, i, arg);
    } else if (arg == "-g" || arg == "--genetic-code") {
        opts.genetic_code = require_value(argc, argv, i, arg);
    } else if (arg == "-t" || arg == "--threads") {
        opts.num_threads = parse_int(arg, require_value(argc, argv, i, arg));
        if (opts.num_threads < 1) {
            throw ParseArgsExit(1, "Error: --threads must be >= 1");
        }
    } else if (arg == "-v" || arg == "--verbose") {
        opts.verbose = true;
    } else if (arg == "--no-qc") {
        opts.run_qc = false;
    } else if (arg == "--no-check-len") {
        opts.qc.check_len = false;
    } else if (arg == "--no-check-start") {
        opts.qc.check_start = false;
    } else if (arg == "--no-check-stop") {
        opts.qc.check_stop = false;
    } else if (arg == "--no-check-istop") {
        opts.qc.check_istop = false;
    } else if (arg == "--keep-start") {
        opts.qc.rm_start = false;
    } else if (arg == "--keep-stop") {
        opts.qc.rm_stop = false;
    } else if (arg == "--min-len") {
        opts.qc.min_len = parse_size(arg, require_value(argc, argv, i, arg));
    } else if (arg == "--start-codons") {
        opts.qc.start_codons = parse_start_codons(require_value(argc, argv, i, arg));
    } else {
        return false;
    }
    return true;
}

Options parse_args(const std::string& command, int argc, char* argv[]) {
    Options opts;
    opts.command = command;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(command);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (parse_common_flag(argc, argv, i, opts)) {
            continue;
        } else if (arg == "--report" && command == "qc") {
            opts.report_file = require_value(argc, argv, i, arg);
        } else if (arg == "--pseudo" && command_in(command, {"rscu", "cai"})) {
            opts.pseudo_count = parse_double(arg, require_value(argc, argv, i, arg));
            if (opts.pseudo_count < 0.0) {
                throw ParseArgsExit(1, "Error: --pseudo must be >= 0");
            }
        } else if (arg == "--subset" && command == "rscu") {
            opts.subset_file = require_value(argc, argv, i, arg);
        } else if (arg == "--method" && command_in(command, {"enc", "optimal"})) {
            const std::string name = require_value(argc, argv, i, arg);
            try {
                opts.enc_method = parse_enc_method(name);
            } catch (const InputError& e) {
                throw ParseArgsExit(1, std::string("Error: ") + e.what());
            }
        } else if (arg == "--fdr" && command == "optimal") {
            opts.fdr = parse_double(arg, require_value(argc, argv, i, arg));
            if (opts.fdr <= 0.0 || opts.fdr > 1.0) {
                throw ParseArgsExit(1, "Error: --fdr must be in (0, 1]");
            }
        } else if (arg == "--min-genes" && command == "optimal") {
            opts.min_genes = parse_size(arg, require_value(argc, argv, i, arg));
            if (opts.min_genes < 3) {
                throw ParseArgsExit(1, "Error: --min-genes must be >= 3");
            }
        } else if (arg == "--score" && command == "optimal") {
            opts.score_file = require_value(argc, argv, i, arg);
        } else if (arg == "--score-direction" && command == "optimal") {
            const std::string dir = require_value(argc, argv, i, arg);
            if (dir == "higher") {
                opts.score_direction = ScoreDirection::HigherIsBiased;
            } else if (dir == "lower") {
                opts.score_direction = ScoreDirection::LowerIsBiased;
            } else {
                throw ParseArgsExit(1, "Error: --score-direction must be 'higher' or 'lower'");
            }
        } else if (arg == "--optimal" && command == "fop") {
            opts.optimal_file = require_value(argc, argv, i, arg);
        } else if (arg == "--ref" && command == "cai") {
            opts.ref_file = require_value(argc, argv, i, arg);
        } else if (arg == "--ref-ids" && command == "cai") {
            opts.ref_ids_file = require_value(argc, argv, i, arg);
        } else if (arg == "--list" && command == "codon-table") {
            opts.list_codes = true;
        } else if (command_in(command, {"trna-weights", "tai"})) {
            if (arg == "--trna") {
                opts.trna_file = require_value(argc, argv, i, arg);
            } else if (arg == "--gtrnadb") {
                opts.gtrnadb_file = require_value(argc, argv, i, arg);
            } else if (arg == "--global-norm") {
                opts.trna_norm = TrnaNormalization::Global;
            } else if (arg == "--s-iu") {
                opts.wobble.s_iu = parse_penalty(arg, require_value(argc, argv, i, arg));
            } else if (arg == "--s-gu") {
                opts.wobble.s_gu = parse_penalty(arg, require_value(argc, argv, i, arg));
            } else if (arg == "--s-ic") {
                opts.wobble.s_ic = parse_penalty(arg, require_value(argc, argv, i, arg));
            } else if (arg == "--s-ia") {
                opts.wobble.s_ia = parse_penalty(arg, require_value(argc, argv, i, arg));
            } else if (arg == "--s-ug") {
                opts.wobble.s_ug = parse_penalty(arg, require_value(argc, argv, i, arg));
            } else if (arg == "--s-la") {
                opts.wobble.s_la = parse_penalty(arg, require_value(argc, argv, i, arg));
            } else {
                throw ParseArgsExit(1, "Error: Unknown option: " + arg);
            }
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (reads_cds(command)) {
        if (opts.input_file.empty()) {
            throw ParseArgsExit(1, "Error: No input file specified");
        }
    } else if (!opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: " + command + " does not take an input file");
    }

    if (command == "fop" && opts.optimal_file.empty()) {
        throw ParseArgsExit(1, "Error: fop requires --optimal");
    }
    if (command == "cai" && opts.ref_file.empty() == opts.ref_ids_file.empty()) {
        throw ParseArgsExit(1, "Error: cai requires exactly one of --ref and --ref-ids");
    }
    if (command_in(command, {"trna-weights", "tai"}) &&
        opts.trna_file.empty() == opts.gtrnadb_file.empty()) {
        throw ParseArgsExit(1, "Error: " + command + " requires exactly one of --trna and --gtrnadb");
    }

    return opts;
}

}  // namespace cli
}  // namespace cubkit
