// cubkit command line tool
//
//   cubkit codon-table -g 11              Genetic code with subfamilies
//   cubkit qc -i cds.fa -o clean.fa       Structural CDS checks
//   cubkit optimal -i cds.fa              Optimal codons
//   cubkit cai -i cds.fa --ref-ids hx.txt Codon adaptation index
//
// Commands live in src/cli/cmd_*.cpp and register themselves.

#include "cli/subcommand.hpp"

int main(int argc, char* argv[]) {
    return cubkit::cli::SubcommandRegistry::instance().dispatch(argc, argv);
}
