#include "cubkit/tai.hpp"
#include "cubkit/cai.hpp"

namespace cubkit {

GeneMap<double> compute_tai(const CodonCountMatrix& counts, const CodonTable& table,
                            const std::vector<TrnaWeightEntry>& weights) {
    return geometric_index(counts, trna_weight_lookup(weights, table));
}

} // namespace cubkit
