#pragma once

#include "cubkit/codon_tables.hpp"
#include "cubkit/optimal_codons.hpp"
#include "cubkit/rscu.hpp"
#include "cubkit/sequence_qc.hpp"
#include "cubkit/trna_weights.hpp"
#include "cubkit/types.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace cubkit {

/**
 * Sequence record from a FASTA file
 */
struct SequenceRecord {
    std::string id;            // header up to the first whitespace
    std::string description;   // rest of the header
    std::string sequence;
};

/**
 * FASTA file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed files (zlib reads both)
 * - Multi-line records
 * - Iterator-based and callback-based processing
 */
class SequenceReader {
public:
    /**
     * Open a FASTA file. Throws InputError if it cannot be opened.
     */
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    /**
     * Read next sequence
     * Returns false when end of file is reached
     */
    bool read_next(SequenceRecord& record);

    /**
     * Process all sequences with a callback
     */
    void for_each(std::function<void(const SequenceRecord&)> callback);

    /**
     * Read all sequences into memory
     */
    std::vector<SequenceRecord> read_all();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// All records keyed by id; throws DuplicateGeneId on repeated ids
GeneMap<std::string> read_fasta_map(const std::string& path);

void write_fasta(std::ostream& out, const GeneMap<std::string>& seqs,
                 size_t line_width = 60);

/**
 * tRNA copy-number table: "<key>\t<copies>" per line, key "AGC" or
 * "Ala-AGC". Lines starting with '#' and a "anticodon" header are skipped.
 */
TrnaPool read_trna_table(const std::string& path);

/**
 * Count tRNA genes from a GtRNAdb FASTA (headers "...tRNA-Ala-AGC-1-1").
 * Genes of unknown type (SeC, Sup, Undet, iMet) are skipped; their number
 * goes to `skipped` when given. Isoacceptor digits ("Ile2") are dropped.
 */
TrnaPool trna_pool_from_gtrnadb(const std::string& fasta_path, size_t* skipped = nullptr);

// "<gene id>\t<score>" per line
GeneMap<double> read_gene_scores(const std::string& path);

// First column of each non-comment line
std::vector<std::string> read_id_list(const std::string& path);

/**
 * Codons from a list file. Accepts one codon per line, or the TSV written
 * by write_optimal_codons_tsv (rows with optimal = 1 are kept).
 */
std::vector<int> read_codon_list(const std::string& path);

// TSV writers; NA is written for undefined values
void write_codon_table_tsv(std::ostream& out, const CodonTable& table);
void write_qc_report_tsv(std::ostream& out, const QcResult& qc);
void write_counts_tsv(std::ostream& out, const CodonCountMatrix& counts);
void write_rscu_tsv(std::ostream& out, const std::vector<RscuEntry>& rscu);
void write_gene_values_tsv(std::ostream& out, const std::string& column,
                           const GeneMap<double>& values);
void write_optimal_codons_tsv(std::ostream& out,
                              const std::vector<OptimalCodonRecord>& records);
void write_trna_weights_tsv(std::ostream& out,
                            const std::vector<TrnaWeightEntry>& weights);

} // namespace cubkit
