// tests/test_trna_weights.cpp
//
// tRNA weights with the default wobble penalties:
// s(G:U) = 0.41, s(I:C) = 0.28, s(I:A) = 0.9999, s(U:G) = 0.68, s(L:A) = 0.89.

#include "cubkit/errors.hpp"
#include "cubkit/tai.hpp"
#include "cubkit/trna_weights.hpp"

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

const cubkit::TrnaWeightEntry* entry(const std::vector<cubkit::TrnaWeightEntry>& w,
                                     const char* codon) {
    for (const auto& e : w) {
        if (e.codon == codon) return &e;
    }
    return nullptr;
}

int test_parse_keys() {
    int failed = 0;

    auto g = cubkit::parse_trna_key("AGC", 3.0);
    expect(g.amino_acid.empty() && g.anticodon == "AGC" && g.copies == 3.0, "bare anticodon", failed);

    g = cubkit::parse_trna_key("ala-agc", 1.0);
    expect(g.amino_acid == "Ala" && g.anticodon == "AGC", "labelled key canonicalized", failed);

    g = cubkit::parse_trna_key("Ile-CAU", 1.0);
    expect(g.amino_acid == "Ile" && g.anticodon == "CAT", "RNA anticodon normalized", failed);

    g = cubkit::parse_trna_key("Ile2-CAT", 1.0);
    expect(g.amino_acid == "Ile" && g.anticodon == "CAT" && g.copies == 1.0,
           "isoacceptor suffix folds into Ile", failed);
    expect(cubkit::trna_amino_acid_code("Leu3") == 'L', "Leu3 is Leu", failed);
    expect(cubkit::trna_amino_acid_code("SeC") == 0, "SeC has no code", failed);

    for (const auto& [key, copies] : std::vector<std::pair<std::string, double>>{
             {"Xyz-AGC", 1.0}, {"Ala-AGCT", 1.0}, {"ANC", 1.0}, {"Ala-AGC", -1.0}}) {
        bool threw = false;
        try {
            (void)cubkit::parse_trna_key(key, copies);
        } catch (const cubkit::InputError&) {
            threw = true;
        }
        expect(threw, "InputError for " + key, failed);
    }
    return failed;
}

int test_wobble_rules() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    const cubkit::TrnaPool pool = {
        cubkit::parse_trna_key("TTT", 1.0),        // Lys, U34 reads A and G
        cubkit::parse_trna_key("AGC", 1.0),        // Ala, I34 reads T, C, A
        cubkit::parse_trna_key("GCC", 1.0),        // Gly, G34 reads C and T
        cubkit::parse_trna_key("Ile-CAT", 2.0),    // lysidine: reads ATA
        cubkit::parse_trna_key("CAT", 1.0),        // Met
    };
    const auto w = cubkit::estimate_trna_weights(pool, t);
    expect(w.size() == 61, "one entry per sense codon", failed);

    expect(near(entry(w, "AAA")->raw, 1.0), "U:A", failed);
    expect(near(entry(w, "AAG")->raw, 0.32), "U:G", failed);
    expect(near(entry(w, "GCT")->raw, 1.0), "I:U", failed);
    expect(near(entry(w, "GCC")->raw, 0.72), "I:C", failed);
    expect(near(entry(w, "GCA")->raw, 0.0001, 1e-12), "I:A", failed);
    expect(entry(w, "GCG")->raw == 0.0, "I does not read G", failed);
    expect(near(entry(w, "GGC")->raw, 1.0), "G:C", failed);
    expect(near(entry(w, "GGT")->raw, 0.59), "G:U", failed);
    expect(near(entry(w, "ATA")->raw, 2.0 * 0.11), "lysidine reads ATA", failed);
    expect(entry(w, "ATG")->raw == 1.0, "Met tRNA reads ATG only", failed);

    // Per-family normalization
    expect(near(entry(w, "ATA")->weight, 1.0), "ATA is the Ile maximum", failed);
    expect(near(entry(w, "AAG")->weight, 0.32), "Lys weights", failed);
    expect(entry(w, "GCA")->weight > 0.0, "tiny but non-zero weight kept", failed);
    return failed;
}

int test_floor_and_normalization() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    const cubkit::TrnaPool lys = {cubkit::parse_trna_key("Lys-TTT", 1.0)};
    const auto w = cubkit::estimate_trna_weights(lys, t);
    const double floor_w = std::sqrt(0.32);

    expect(!entry(w, "AAA")->floored && !entry(w, "AAG")->floored, "decoded codons not floored", failed);
    expect(entry(w, "GCT")->floored && near(entry(w, "GCT")->weight, floor_w),
           "undecoded codon gets geometric mean floor", failed);
    for (const auto& e : w) {
        expect(e.weight > 0.0 && e.weight <= 1.0, "weight in (0, 1] for " + e.codon, failed);
    }

    const cubkit::TrnaPool two = {cubkit::parse_trna_key("TTT", 2.0),
                                  cubkit::parse_trna_key("GCC", 1.0)};
    const auto fam = cubkit::estimate_trna_weights(two, t);
    const auto glob = cubkit::estimate_trna_weights(two, t, {}, cubkit::TrnaNormalization::Global);
    expect(near(entry(fam, "GGC")->weight, 1.0), "per-family: Gly maximum is 1", failed);
    expect(near(entry(glob, "GGC")->weight, 0.5), "global: Gly relative to Lys", failed);
    expect(near(entry(glob, "AAA")->weight, 1.0), "global maximum is 1", failed);

    // Custom penalty
    cubkit::WobbleParams p;
    p.s_ug = 0.5;
    expect(near(entry(cubkit::estimate_trna_weights(lys, t, p), "AAG")->weight, 0.5),
           "custom U:G penalty", failed);
    return failed;
}

int test_no_usable_trna() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    for (const auto& pool : {cubkit::TrnaPool{cubkit::parse_trna_key("CAT", 1.0)},
                             cubkit::TrnaPool{cubkit::parse_trna_key("TTA", 1.0)},
                             cubkit::TrnaPool{}}) {
        bool threw = false;
        try {
            (void)cubkit::estimate_trna_weights(pool, t);
        } catch (const cubkit::InsufficientData&) {
            threw = true;
        }
        expect(threw, "pool without synonymous decoding", failed);
    }
    return failed;
}

int test_tai() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    const cubkit::TrnaPool lys = {cubkit::parse_trna_key("TTT", 1.0)};
    const auto w = cubkit::estimate_trna_weights(lys, t);

    const auto lookup = cubkit::trna_weight_lookup(w, t);
    expect(cubkit::is_na(lookup[idx("ATG")]), "Met excluded from tAI", failed);
    expect(cubkit::is_na(lookup[idx("TGG")]), "Trp excluded from tAI", failed);
    expect(cubkit::is_na(lookup[idx("TAA")]), "stop excluded from tAI", failed);

    cubkit::CodonCountMatrix m;
    cubkit::CodonCounts best{};
    best[idx("AAA")] = 4;
    best[idx("ATG")] = 1;
    m.insert("best", best);
    cubkit::CodonCounts mixed{};
    mixed[idx("AAA")] = 1;
    mixed[idx("AAG")] = 1;
    m.insert("mixed", mixed);
    cubkit::CodonCounts ala{};
    ala[idx("GCT")] = 3;
    m.insert("ala", ala);
    m.insert("met", [] { cubkit::CodonCounts c{}; c[cubkit::codon_index("ATG")] = 2; return c; }());

    const auto tai = cubkit::compute_tai(m, t, w);
    expect(near(tai.at("best"), 1.0), "only best codons", failed);
    expect(near(tai.at("mixed"), std::sqrt(0.32)), "geometric mean", failed);
    expect(near(tai.at("ala"), std::sqrt(0.32)), "floored codons", failed);
    expect(cubkit::is_na(tai.at("met")), "no weighted codon is NA", failed);
    return failed;
}

} // namespace

int main() {
    int total = 0;
    total += test_parse_keys();
    total += test_wobble_rules();
    total += test_floor_and_normalization();
    total += test_no_usable_trna();
    total += test_tai();

    if (total == 0) {
        std::cout << "All tRNA weight tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
