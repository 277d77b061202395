#pragma once

#include "cubkit/errors.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cubkit {

using Count = uint32_t;

constexpr size_t NUM_CODONS = 64;

// Per-codon counts, indexed by codon_index()
using CodonCounts = std::array<Count, NUM_CODONS>;

// Column sums over many genes; wider than a single row
using PooledCounts = std::array<uint64_t, NUM_CODONS>;

// Missing value marker. Undefined ratios propagate as NA instead of 0.
inline constexpr double NA = std::numeric_limits<double>::quiet_NaN();

inline bool is_na(double v) { return std::isnan(v); }

// Nucleotide encoding in NCBI translation table order
enum class Nucleotide : uint8_t {
    T = 0,
    C = 1,
    A = 2,
    G = 3,
    N = 4  // Unknown
};

// Convert char to nucleotide (U is read as T)
inline Nucleotide char_to_nt(char c) {
    switch (c) {
        case 'T': case 't': case 'U': case 'u': return Nucleotide::T;
        case 'C': case 'c': return Nucleotide::C;
        case 'A': case 'a': return Nucleotide::A;
        case 'G': case 'g': return Nucleotide::G;
        default: return Nucleotide::N;
    }
}

// Convert nucleotide to char
inline char nt_to_char(Nucleotide nt) {
    switch (nt) {
        case Nucleotide::T: return 'T';
        case Nucleotide::C: return 'C';
        case Nucleotide::A: return 'A';
        case Nucleotide::G: return 'G';
        default: return 'N';
    }
}

// Codon to array index (0-63): T=0, C=1, A=2, G=3, index = b1*16 + b2*4 + b3
// Returns -1 for ambiguous bases.
inline int codon_index(char c1, char c2, char c3) {
    const auto n1 = char_to_nt(c1);
    const auto n2 = char_to_nt(c2);
    const auto n3 = char_to_nt(c3);
    if (n1 == Nucleotide::N || n2 == Nucleotide::N || n3 == Nucleotide::N) return -1;
    return static_cast<int>(n1) * 16 + static_cast<int>(n2) * 4 + static_cast<int>(n3);
}

inline int codon_index(std::string_view codon) {
    if (codon.size() != 3) return -1;
    return codon_index(codon[0], codon[1], codon[2]);
}

// Index back to DNA codon string ("TTT" for 0)
inline std::string codon_string(int idx) {
    std::string codon(3, 'N');
    codon[0] = nt_to_char(static_cast<Nucleotide>((idx >> 4) & 3));
    codon[1] = nt_to_char(static_cast<Nucleotide>((idx >> 2) & 3));
    codon[2] = nt_to_char(static_cast<Nucleotide>(idx & 3));
    return codon;
}

// Uppercase, U -> T. Other characters are kept as-is.
std::string normalize_sequence(std::string_view seq);

/**
 * Insertion-ordered mapping from gene id to value.
 *
 * Every per-gene table in cubkit is keyed by gene id, so results can never
 * be silently misaligned with their inputs. Iteration follows insertion
 * order, which for sequences read from FASTA is file order.
 */
template <typename T>
class GeneMap {
public:
    GeneMap() = default;

    void reserve(size_t n) {
        ids_.reserve(n);
        values_.reserve(n);
        index_.reserve(n);
    }

    // Throws DuplicateGeneId if id is already present
    void insert(const std::string& id, T value) {
        if (!index_.emplace(id, ids_.size()).second) {
            throw DuplicateGeneId(id);
        }
        ids_.push_back(id);
        values_.push_back(std::move(value));
    }

    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }

    bool contains(const std::string& id) const {
        return index_.find(id) != index_.end();
    }

    // nullptr when absent
    const T* find(const std::string& id) const {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &values_[it->second];
    }

    const T& at(const std::string& id) const {
        const T* v = find(id);
        if (!v) throw InputError("Unknown gene id: '" + id + "'");
        return *v;
    }

    const std::string& id(size_t i) const { return ids_[i]; }
    const T& value(size_t i) const { return values_[i]; }
    T& value(size_t i) { return values_[i]; }

    const std::vector<std::string>& ids() const { return ids_; }
    const std::vector<T>& values() const { return values_; }

    // New map with the same keys, in the same order, holding `values`
    template <typename U>
    GeneMap<U> with_values(std::vector<U> values) const {
        if (values.size() != ids_.size()) {
            throw std::invalid_argument("GeneMap::with_values: size mismatch");
        }
        GeneMap<U> out;
        out.ids_ = ids_;
        out.index_ = index_;
        out.values_ = std::move(values);
        return out;
    }

private:
    template <typename> friend class GeneMap;

    std::vector<std::string> ids_;
    std::vector<T> values_;
    std::unordered_map<std::string, size_t> index_;
};

using CodonCountMatrix = GeneMap<CodonCounts>;

} // namespace cubkit
