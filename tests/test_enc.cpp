// tests/test_enc.cpp

#include "cubkit/enc.hpp"
#include "cubkit/errors.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

using cubkit::EncMethod;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

int idx(const char* codon) { return cubkit::codon_index(codon); }

cubkit::CodonCounts uniform_counts(const cubkit::CodonTable& t, cubkit::Count n) {
    cubkit::CodonCounts c{};
    for (const auto& sf : t.subfamilies()) {
        for (int codon : sf.codons) c[codon] = n;
    }
    return c;
}

cubkit::CodonCounts one_codon_per_subfamily(const cubkit::CodonTable& t, cubkit::Count n) {
    cubkit::CodonCounts c{};
    for (const auto& sf : t.subfamilies()) c[sf.codons.front()] = n;
    return c;
}

int test_extremes() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    const auto uniform = uniform_counts(t, 10);
    expect(near(cubkit::compute_enc(uniform, t, EncMethod::Wright), 61.0), "Wright: uniform usage gives 61", failed);
    expect(near(cubkit::compute_enc(uniform, t, EncMethod::Sun), 61.0, 1e-6), "Sun: uniform usage gives 61", failed);

    const auto biased = one_codon_per_subfamily(t, 10);
    expect(near(cubkit::compute_enc(biased, t, EncMethod::Wright), 23.0),
           "Wright: one codon per subfamily gives 23", failed);
    const double sun = cubkit::compute_enc(biased, t, EncMethod::Sun);
    expect(sun > 23.0 && sun < 61.0, "Sun: strong bias stays within bounds", failed);

    // Only single-codon subfamilies used
    cubkit::CodonCounts met{};
    met[idx("ATG")] = 5;
    met[idx("TGG")] = 5;
    expect(cubkit::is_na(cubkit::compute_enc(met, t)), "no multi-codon usage is NA", failed);
    expect(cubkit::is_na(cubkit::compute_enc(cubkit::CodonCounts{}, t)), "empty gene is NA", failed);
    return failed;
}

int test_partial_classes() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    // Only Lys observed: N_1 + N_2 / F_2 with the other classes left out
    cubkit::CodonCounts lys{};
    lys[idx("AAA")] = 10;
    expect(near(cubkit::compute_enc(lys, t), 2.0 + 12.0), "exclusive AAA", failed);

    lys[idx("AAA")] = 3;
    lys[idx("AAG")] = 1;
    expect(near(cubkit::compute_enc(lys, t), 2.0 + 24.0), "F = 0.5 for 3:1 with n = 4", failed);

    // F below 1/k is clamped
    lys[idx("AAA")] = 5;
    lys[idx("AAG")] = 5;
    expect(near(cubkit::compute_enc(lys, t), 26.0), "F clamped to 1/k", failed);

    // Wright needs n >= 2 per subfamily, Sun does not
    cubkit::CodonCounts single{};
    single[idx("AAA")] = 1;
    expect(cubkit::is_na(cubkit::compute_enc(single, t, EncMethod::Wright)), "Wright skips n = 1", failed);
    expect(near(cubkit::compute_enc(single, t, EncMethod::Sun), 2.0 + 12.0 / (5.0 / 9.0)),
           "Sun with one observation", failed);

    cubkit::CodonCounts sun8{};
    sun8[idx("AAA")] = 8;
    expect(near(cubkit::compute_enc(sun8, t, EncMethod::Sun), 2.0 + 12.0 / 0.82),
           "Sun pseudocounted homozygosity", failed);
    return failed;
}

int test_bounds_and_matrix() {
    int failed = 0;
    const auto& t = cubkit::get_codon_table("1");

    // Deterministic pseudo-random usage with every codon present
    uint32_t state = 12345;
    cubkit::CodonCountMatrix m;
    for (int g = 0; g < 25; ++g) {
        cubkit::CodonCounts c{};
        for (size_t i = 0; i < cubkit::NUM_CODONS; ++i) {
            state = state * 1103515245u + 12345u;
            c[i] = 1 + (state >> 16) % 30;
        }
        m.insert("g" + std::to_string(g), c);
    }

    for (EncMethod method : {EncMethod::Wright, EncMethod::Sun}) {
        const auto enc = cubkit::compute_enc(m, t, method);
        expect(enc.size() == m.size(), "one value per gene", failed);
        for (size_t i = 0; i < enc.size(); ++i) {
            expect(enc.id(i) == m.id(i), "gene order kept", failed);
            const double v = enc.value(i);
            expect(v >= 23.0 - 1e-9 && v <= 61.0 + 1e-9,
                   std::string(cubkit::enc_method_name(method)) + " ENC within [23, 61] for " + enc.id(i),
                   failed);
            expect(near(v, cubkit::compute_enc(m.value(i), t, method)), "matrix matches single", failed);
        }
    }

    // Vertebrate mitochondrial code: 60 sense codons
    const auto& mito = cubkit::get_codon_table("2");
    expect(near(cubkit::compute_enc(uniform_counts(mito, 20), mito), 60.0), "code 2 maximum is 60", failed);
    return failed;
}

int test_method_names() {
    int failed = 0;
    expect(cubkit::parse_enc_method("wright") == EncMethod::Wright, "parse wright", failed);
    expect(cubkit::parse_enc_method("sun") == EncMethod::Sun, "parse sun", failed);
    bool threw = false;
    try {
        (void)cubkit::parse_enc_method("novembre");
    } catch (const cubkit::InputError&) {
        threw = true;
    }
    expect(threw, "unknown method", failed);
    return failed;
}

} // namespace

int main() {
    int total = 0;
    total += test_extremes();
    total += test_partial_classes();
    total += test_bounds_and_matrix();
    total += test_method_names();

    if (total == 0) {
        std::cout << "All ENC tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
