/**
 * @file cmd_codon_table.cpp
 * @brief Print an NCBI genetic code with amino acids and subfamilies.
 */

#include "pipeline.hpp"
#include "cubkit/codon_tables.hpp"
#include "cubkit/sequence_io.hpp"

#include <ostream>

namespace cubkit {
namespace cli {

namespace {

void run_codon_table(const Options& opts, log_utils::StepLogger& log) {
    OutputTarget out(opts.output_file);

    if (opts.list_codes) {
        out.stream() << "id\tname\n";
        for (const auto& id : available_code_ids()) {
            out.stream() << id << '\t' << get_codon_table(id).name() << '\n';
        }
    } else {
        const CodonTable& table = get_codon_table(opts.genetic_code);
        log.step("Genetic code " + table.id() + ": " + table.name() + ", " +
                 std::to_string(table.subfamilies().size()) + " subfamilies");
        write_codon_table_tsv(out.stream(), table);
    }
    out.close();
}

struct CodonTableRegistrar {
    CodonTableRegistrar() {
        SubcommandRegistry::instance().add(
            {"codon-table", "Print a genetic code table with subfamily labels", 10,
             run_codon_table});
    }
};
static CodonTableRegistrar registrar;

}  // namespace

}  // namespace cli
}  // namespace cubkit
