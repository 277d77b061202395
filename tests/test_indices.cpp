// tests/test_indices.cpp
//
// Fop and CAI on hand-built genes.

#include "cubkit/cai.hpp"
#include "cubkit/codon_counter.hpp"
#include "cubkit/fop.hpp"
#include "cubkit/rscu.hpp"

#include <cmath>
#include <iostream>
#include <string>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

int idx(const char* codon) { return cubkit::codon_index(codon); }

int test_fop() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    cubkit::CodonCounts c{};
    c[idx("AAA")] = 3;
    c[idx("AAG")] = 1;
    c[idx("GCT")] = 5;   // Ala has no optimal codon: not scored

    const std::vector<int> optimal = {idx("AAA")};
    expect(near(cubkit::compute_fop(c, t, optimal), 0.75), "3 of 4 Lys codons optimal", failed);

    // Met, Trp and stops in the list change nothing
    const std::vector<int> noisy = {idx("AAA"), idx("ATG"), idx("TGG"), idx("TAA")};
    expect(near(cubkit::compute_fop(c, t, noisy), 0.75), "single-codon and stop entries ignored", failed);

    cubkit::CodonCounts ala{};
    ala[idx("GCT")] = 4;
    expect(cubkit::is_na(cubkit::compute_fop(ala, t, optimal)), "no scored codon is NA", failed);

    cubkit::CodonCounts none{};
    none[idx("AAG")] = 2;
    expect(near(cubkit::compute_fop(none, t, optimal), 0.0), "no optimal codon used", failed);

    // Six-fold split: an optimal CTG does not score the TT subfamily
    cubkit::CodonCounts leu{};
    leu[idx("CTG")] = 1;
    leu[idx("CTT")] = 1;
    leu[idx("TTA")] = 6;
    expect(near(cubkit::compute_fop(leu, t, {idx("CTG")}), 0.5), "Leu_TT not scored by CTG", failed);

    cubkit::CodonCountMatrix m;
    m.insert("x", c);
    m.insert("y", ala);
    const auto fop = cubkit::compute_fop(m, t, optimal);
    expect(fop.id(0) == "x" && near(fop.value(0), 0.75), "matrix row x", failed);
    expect(cubkit::is_na(fop.at("y")), "matrix row y", failed);
    return failed;
}

int test_cai_weights() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    cubkit::CodonCounts ref{};
    ref[idx("AAA")] = 3;
    ref[idx("AAG")] = 1;
    ref[idx("ATG")] = 7;
    ref[idx("TAA")] = 2;
    const auto w = cubkit::cai_weights(cubkit::estimate_rscu(ref, t), t);

    expect(near(w[idx("AAA")], 1.0) && near(w[idx("AAG")], 1.0 / 3.0), "w = rscu / max", failed);
    expect(cubkit::is_na(w[idx("ATG")]), "Met has no weight", failed);
    expect(cubkit::is_na(w[idx("TGG")]), "Trp has no weight", failed);
    expect(cubkit::is_na(w[idx("TAA")]), "stop has no weight", failed);
    expect(cubkit::is_na(w[idx("GCT")]), "unused reference subfamily has no weight", failed);

    for (int c = 0; c < static_cast<int>(cubkit::NUM_CODONS); ++c) {
        if (!cubkit::is_na(w[c])) expect(w[c] > 0.0 && w[c] <= 1.0, "weight in (0, 1]", failed);
    }
    return failed;
}

int test_cai_values() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    cubkit::GeneMap<std::string> ref_seqs;
    ref_seqs.insert("r1", "AAAAAAAAAAAG");   // AAA x3, AAG x1
    const auto reference = cubkit::estimate_rscu(cubkit::count_codons(ref_seqs), t);

    cubkit::GeneMap<std::string> seqs;
    seqs.insert("best", "AAAAAA");
    seqs.insert("mixed", "AAAAAG");
    seqs.insert("met_only", "ATGTGG");
    const auto cai = cubkit::compute_cai(cubkit::count_codons(seqs), t, reference);

    expect(near(cai.at("best"), 1.0), "only best codons gives 1", failed);
    expect(near(cai.at("mixed"), std::sqrt(1.0 / 3.0)), "geometric mean", failed);
    expect(cubkit::is_na(cai.at("met_only")), "no weighted codon is NA", failed);

    // A codon never seen in the reference has weight 0 and forces CAI to 0
    cubkit::GeneMap<std::string> biased_ref;
    biased_ref.insert("r", "AAAAAAAAAAAA");
    const auto ref0 = cubkit::estimate_rscu(cubkit::count_codons(biased_ref), t);
    cubkit::GeneMap<std::string> genes;
    genes.insert("uses_AAG", "AAAAAGAAA");
    genes.insert("only_AAA", "AAAAAA");
    const auto cai0 = cubkit::compute_cai(cubkit::count_codons(genes), t, ref0);
    expect(cai0.at("uses_AAG") == 0.0, "unseen reference codon gives CAI 0", failed);
    expect(near(cai0.at("only_AAA"), 1.0), "exclusive reference codon gives 1", failed);

    // Pseudocount keeps unseen codons above zero
    const auto ref_pc = cubkit::estimate_rscu(cubkit::count_codons(biased_ref), t, 0.5);
    const auto cai_pc = cubkit::compute_cai(cubkit::count_codons(genes), t, ref_pc);
    expect(cai_pc.at("uses_AAG") > 0.0 && cai_pc.at("uses_AAG") < 1.0, "pseudocount CAI in (0, 1)", failed);
    return failed;
}

} // namespace

int main() {
    int total = 0;
    total += test_fop();
    total += test_cai_weights();
    total += test_cai_values();

    if (total == 0) {
        std::cout << "All index tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
