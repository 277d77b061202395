// tests/test_codon_tables.cpp
//
// Genetic code tables: NCBI translation, start/stop sets and the split of
// six-fold amino acids into subfamilies.

#include "cubkit/codon_tables.hpp"
#include "cubkit/errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

int idx(const char* codon) { return cubkit::codon_index(codon); }

bool contains(const std::vector<int>& v, int x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

int test_standard_code() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    expect(t.id() == "1", "table id", failed);
    expect(t.name() == "Standard", "table name", failed);
    expect(t.translate(idx("ATG")) == 'M', "ATG is Met", failed);
    expect(t.translate(idx("TGG")) == 'W', "TGG is Trp", failed);
    expect(t.translate(idx("GCC")) == 'A', "GCC is Ala", failed);
    expect(t.translate(-1) == 'X', "invalid index translates to X", failed);
    expect(t[idx("TTT")].amino_acid == "Phe", "three-letter name", failed);

    const auto stops = t.stop_codons();
    expect(stops.size() == 3, "three stop codons", failed);
    expect(contains(stops, idx("TAA")) && contains(stops, idx("TAG")) &&
           contains(stops, idx("TGA")), "TAA/TAG/TGA are stops", failed);
    expect(t[idx("TAA")].amino_acid == "Stop", "stop name", failed);
    expect(t[idx("TAA")].subfam.empty(), "stop has no subfamily", failed);

    const auto starts = t.start_codons();
    expect(contains(starts, idx("ATG")), "ATG is a start", failed);
    expect(!contains(starts, idx("GTG")), "GTG is not a start in code 1", failed);
    return failed;
}

int test_subfamilies() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    expect(t.subfamilies().size() == 23, "23 subfamilies in the standard code", failed);

    // Six-fold amino acids split by the first two bases
    expect(t[idx("TTA")].subfam == "Leu_TT", "TTA in Leu_TT", failed);
    expect(t[idx("TTG")].subfam == "Leu_TT", "TTG in Leu_TT", failed);
    expect(t[idx("CTG")].subfam == "Leu_CT", "CTG in Leu_CT", failed);
    expect(t[idx("AGC")].subfam == "Ser_AG", "AGC in Ser_AG", failed);
    expect(t[idx("TCA")].subfam == "Ser_TC", "TCA in Ser_TC", failed);
    expect(t[idx("AGA")].subfam == "Arg_AG", "AGA in Arg_AG", failed);
    expect(t[idx("CGA")].subfam == "Arg_CG", "CGA in Arg_CG", failed);

    const int leu_tt = t.subfamily_of(idx("TTA"));
    const int leu_ct = t.subfamily_of(idx("CTT"));
    expect(leu_tt != leu_ct, "Leu subfamilies are distinct", failed);
    expect(t.subfamilies()[leu_tt].codons.size() == 2, "Leu_TT has 2 codons", failed);
    expect(t.subfamilies()[leu_ct].codons.size() == 4, "Leu_CT has 4 codons", failed);
    expect(t.subfamilies()[leu_ct].amino_acid == "Leu", "subfamily amino acid", failed);
    expect(t.subfamily_of(idx("TGA")) == -1, "stop codon has no subfamily index", failed);

    // Every sense codon belongs to exactly one subfamily
    size_t n_codons = 0;
    std::vector<int> seen(cubkit::NUM_CODONS, 0);
    for (const auto& sf : t.subfamilies()) {
        n_codons += sf.codons.size();
        for (int c : sf.codons) ++seen[c];
        expect(std::is_sorted(sf.codons.begin(), sf.codons.end()),
               "subfamily codons ascending: " + sf.label, failed);
    }
    expect(n_codons == 61, "61 sense codons across subfamilies", failed);
    for (int c = 0; c < static_cast<int>(cubkit::NUM_CODONS); ++c) {
        const int expected = t.translate(c) == '*' ? 0 : 1;
        expect(seen[c] == expected, "membership of " + cubkit::codon_string(c), failed);
    }

    const auto ile = t.codons_for('I');
    expect(ile.size() == 3, "Ile has three codons", failed);
    return failed;
}

int test_alternative_codes() {
    int failed = 0;

    const auto& mito = cubkit::get_codon_table("2");
    expect(mito.translate(idx("TGA")) == 'W', "code 2: TGA is Trp", failed);
    expect(mito.translate(idx("ATA")) == 'M', "code 2: ATA is Met", failed);
    expect(mito.is_stop(idx("AGA")), "code 2: AGA is stop", failed);
    expect(mito[idx("TGA")].subfam == "Trp_TG", "code 2: TGA joins Trp_TG", failed);
    expect(mito.subfamilies()[mito.subfamily_of(idx("TGG"))].codons.size() == 2,
           "code 2: Trp is two-fold", failed);

    const auto& bact = cubkit::get_codon_table("11");
    const auto starts = bact.start_codons();
    expect(contains(starts, idx("GTG")) && contains(starts, idx("TTG")),
           "code 11: GTG and TTG are starts", failed);

    // Reassignable stop: sense inside a gene, may still end one
    const auto& kary = cubkit::get_codon_table("27");
    expect(kary.translate(idx("TGA")) == 'W', "code 27: TGA reads Trp", failed);
    expect(kary.is_stop(idx("TGA")), "code 27: TGA may terminate", failed);
    expect(kary.subfamily_of(idx("TGA")) >= 0, "code 27: TGA in a subfamily", failed);
    expect(kary.translate(idx("TAA")) == 'Q', "code 27: TAA reads Gln", failed);

    // Cached tables are shared
    expect(&cubkit::get_codon_table("11") == &bact, "table cache returns same object", failed);
    expect(&cubkit::get_codon_table(" 11 ") == &bact, "id is trimmed", failed);
    return failed;
}

int test_invalid_ids() {
    int failed = 0;

    for (const char* bad : {"7", "0", "abc", "", "34"}) {
        bool threw = false;
        try {
            (void)cubkit::get_codon_table(bad);
        } catch (const cubkit::InvalidCodeId& e) {
            threw = e.code_id() == bad;
        }
        expect(threw, std::string("InvalidCodeId for '") + bad + "'", failed);
    }

    const auto ids = cubkit::available_code_ids();
    expect(!ids.empty() && ids.front() == "1", "available ids start at 1", failed);
    expect(std::find(ids.begin(), ids.end(), "7") == ids.end(), "7 is not available", failed);
    for (const auto& id : ids) {
        expect(cubkit::CodonTable::from_id(id).id() == id, "from_id round-trips " + id, failed);
    }
    return failed;
}

int test_helpers() {
    int failed = 0;
    expect(cubkit::codon_index("TTT") == 0, "TTT is index 0", failed);
    expect(cubkit::codon_index("GGG") == 63, "GGG is index 63", failed);
    expect(cubkit::codon_index("aug") == idx("ATG"), "lowercase RNA codon", failed);
    expect(cubkit::codon_index("ANG") == -1, "ambiguous codon", failed);
    expect(cubkit::codon_string(idx("CAT")) == "CAT", "codon string", failed);
    expect(cubkit::reverse_complement("AGC") == "GCT", "reverse complement", failed);
    expect(cubkit::amino_acid_code("ile") == 'I', "amino acid lookup is case-insensitive", failed);
    expect(cubkit::amino_acid_code("Foo") == 0, "unknown amino acid", failed);
    expect(std::string(cubkit::amino_acid_name('K')) == "Lys", "amino acid name", failed);
    return failed;
}

} // namespace

int main() {
    int total = 0;
    total += test_standard_code();
    total += test_subfamilies();
    total += test_alternative_codes();
    total += test_invalid_ids();
    total += test_helpers();

    if (total == 0) {
        std::cout << "All codon table tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
