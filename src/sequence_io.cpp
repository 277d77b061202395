#include "cubkit/sequence_io.hpp"

#include <cctype>
#include <cstring>
#include <iomanip>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <zlib.h>

namespace cubkit {

namespace {

// Large I/O buffer for better throughput
constexpr unsigned GZBUF_SIZE = 4 * 1024 * 1024;

// Line reader over zlib; gzread passes uncompressed files through unchanged
class GzLines {
public:
    explicit GzLines(const std::string& path)
        : path_(path)
        , gz_(gzopen(path.c_str(), "rb"))
        , buffer_(65536) {
        if (!gz_) {
            throw InputError("Failed to open file: " + path);
        }
        gzbuffer(gz_, GZBUF_SIZE);
    }

    ~GzLines() {
        if (gz_) gzclose(gz_);
    }

    GzLines(const GzLines&) = delete;
    GzLines& operator=(const GzLines&) = delete;

    // Next line without trailing newline / CR. Returns false at EOF.
    bool getline(std::string& line) {
        line.clear();
        bool got_any = false;
        while (gzgets(gz_, buffer_.data(), static_cast<int>(buffer_.size()))) {
            got_any = true;
            size_t len = std::strlen(buffer_.data());
            const bool eol = len > 0 && buffer_[len - 1] == '\n';
            if (eol) --len;
            line.append(buffer_.data(), len);
            if (eol) break;
        }
        if (!got_any) {
            int err = Z_OK;
            const char* msg = gzerror(gz_, &err);
            if (err != Z_OK && err != Z_STREAM_END) {
                throw InputError("Read error in " + path_ + ": " + msg);
            }
            return false;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

private:
    std::string path_;
    gzFile gz_;
    std::vector<char> buffer_;
};

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string f;
    while (iss >> f) fields.push_back(f);
    return fields;
}

bool is_comment_or_blank(const std::string& line) {
    for (char c : line) {
        if (c == '#') return true;
        if (c != ' ' && c != '\t') return false;
    }
    return true;
}

bool parse_double(const std::string& s, double& out) {
    try {
        size_t idx = 0;
        out = std::stod(s, &idx);
        return idx == s.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

void put_value(std::ostream& out, double v) {
    if (is_na(v)) {
        out << "NA";
    } else {
        out << v;
    }
}

} // namespace

// SequenceReader implementation
class SequenceReader::Impl {
public:
    explicit Impl(const std::string& filename) : lines_(filename) {}

    GzLines lines_;
    std::string lookahead_line_;  // For FASTA multi-line handling
    bool has_lookahead_ = false;
};

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>(filename)) {}

SequenceReader::~SequenceReader() = default;

bool SequenceReader::read_next(SequenceRecord& record) {
    std::string line;

    if (impl_->has_lookahead_) {
        line = std::move(impl_->lookahead_line_);
        impl_->has_lookahead_ = false;
    } else if (!impl_->lines_.getline(line)) {
        return false;
    }

    // Skip empty lines
    while (line.empty()) {
        if (!impl_->lines_.getline(line)) return false;
    }

    if (line[0] != '>') {
        throw InputError("Expected FASTA header, got: " + line.substr(0, 40));
    }

    // Parse header
    const char* hdr = line.c_str() + 1;  // Skip '>'
    const char* space = std::strpbrk(hdr, " \t");
    if (space) {
        record.id.assign(hdr, space - hdr);
        record.description.assign(space + 1);
    } else {
        record.id.assign(hdr);
        record.description.clear();
    }
    if (record.id.empty()) {
        throw InputError("FASTA record with empty id");
    }

    // Read sequence lines until next header or EOF
    record.sequence.clear();
    while (impl_->lines_.getline(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            // Save for next call
            impl_->lookahead_line_ = std::move(line);
            impl_->has_lookahead_ = true;
            break;
        }
        for (char c : line) {
            if (c != ' ' && c != '\t') record.sequence += c;
        }
    }

    return true;
}

void SequenceReader::for_each(std::function<void(const SequenceRecord&)> callback) {
    SequenceRecord record;
    while (read_next(record)) {
        callback(record);
    }
}

std::vector<SequenceRecord> SequenceReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

GeneMap<std::string> read_fasta_map(const std::string& path) {
    GeneMap<std::string> seqs;
    SequenceReader reader(path);
    SequenceRecord record;
    while (reader.read_next(record)) {
        seqs.insert(record.id, std::move(record.sequence));
    }
    return seqs;
}

void write_fasta(std::ostream& out, const GeneMap<std::string>& seqs, size_t line_width) {
    if (line_width == 0) line_width = std::string::npos;
    for (size_t i = 0; i < seqs.size(); ++i) {
        out << '>' << seqs.id(i) << '\n';
        const std::string& s = seqs.value(i);
        for (size_t p = 0; p < s.size(); p += line_width) {
            out << s.substr(p, line_width) << '\n';
        }
    }
}

TrnaPool read_trna_table(const std::string& path) {
    GzLines lines(path);
    TrnaPool pool;
    std::string line;
    size_t line_no = 0;
    bool first_row = true;

    while (lines.getline(line)) {
        ++line_no;
        if (is_comment_or_blank(line)) continue;
        const auto fields = split_fields(line);
        double copies = 0.0;
        const bool numeric = fields.size() >= 2 && parse_double(fields[1], copies);
        if (!numeric) {
            if (first_row) {  // header
                first_row = false;
                continue;
            }
            throw InputError(path + ":" + std::to_string(line_no) +
                             ": expected '<anticodon>\\t<copies>'");
        }
        first_row = false;
        pool.push_back(parse_trna_key(fields[0], copies));
    }

    if (pool.empty()) {
        throw InputError("No tRNA entries in " + path);
    }
    return pool;
}

TrnaPool trna_pool_from_gtrnadb(const std::string& fasta_path, size_t* skipped) {
    std::map<std::string, double> gene_counts;
    size_t n_skipped = 0;

    SequenceReader reader(fasta_path);
    reader.for_each([&](const SequenceRecord& rec) {
        std::string name = rec.id;
        size_t pos = name.find("tRNA-");
        if (pos == std::string::npos) {
            name = rec.description;
            pos = name.find("tRNA-");
        }
        if (pos == std::string::npos) {
            ++n_skipped;
            return;
        }

        std::istringstream parts(name.substr(pos + 5));
        std::string aa, anticodon;
        std::getline(parts, aa, '-');
        std::getline(parts, anticodon, '-');
        // SeC, Sup and Undet entries have no sense-codon amino acid
        const char code = trna_amino_acid_code(aa);
        if (code == 0 || code == '*' || codon_index(anticodon) < 0) {
            ++n_skipped;
            return;
        }
        gene_counts[std::string(amino_acid_name(code)) + "-" + anticodon] += 1.0;
    });

    if (skipped) *skipped = n_skipped;

    TrnaPool pool;
    for (const auto& [key, copies] : gene_counts) {
        pool.push_back(parse_trna_key(key, copies));
    }
    if (pool.empty()) {
        throw InputError("No usable tRNA genes in " + fasta_path);
    }
    return pool;
}

GeneMap<double> read_gene_scores(const std::string& path) {
    GzLines lines(path);
    GeneMap<double> scores;
    std::string line;
    size_t line_no = 0;
    bool first_row = true;

    while (lines.getline(line)) {
        ++line_no;
        if (is_comment_or_blank(line)) continue;
        const auto fields = split_fields(line);
        double v = 0.0;
        if (fields.size() >= 2 && fields[1] == "NA") {
            first_row = false;
            scores.insert(fields[0], NA);
            continue;
        }
        if (fields.size() < 2 || !parse_double(fields[1], v)) {
            if (first_row) {  // header
                first_row = false;
                continue;
            }
            throw InputError(path + ":" + std::to_string(line_no) +
                             ": expected '<gene id>\\t<score>'");
        }
        first_row = false;
        scores.insert(fields[0], v);
    }
    return scores;
}

std::vector<std::string> read_id_list(const std::string& path) {
    GzLines lines(path);
    std::vector<std::string> ids;
    std::string line;
    while (lines.getline(line)) {
        if (is_comment_or_blank(line)) continue;
        const auto fields = split_fields(line);
        ids.push_back(fields[0]);
    }
    return ids;
}

std::vector<int> read_codon_list(const std::string& path) {
    GzLines lines(path);
    std::vector<int> codons;
    std::string line;
    int optimal_col = -1;
    bool first_row = true;

    while (lines.getline(line)) {
        if (is_comment_or_blank(line)) continue;
        const auto fields = split_fields(line);
        if (first_row && fields[0] == "codon") {
            for (size_t i = 1; i < fields.size(); ++i) {
                if (fields[i] == "optimal") optimal_col = static_cast<int>(i);
            }
            first_row = false;
            continue;
        }
        first_row = false;

        if (optimal_col >= 0) {
            if (static_cast<int>(fields.size()) <= optimal_col) {
                throw InputError(path + ": row without 'optimal' column: " + line);
            }
            const std::string& flag = fields[optimal_col];
            if (flag != "1" && flag != "true" && flag != "TRUE") continue;
        }

        const int idx = codon_index(fields[0]);
        if (idx < 0) {
            throw InputError(path + ": invalid codon '" + fields[0] + "'");
        }
        codons.push_back(idx);
    }
    return codons;
}

void write_codon_table_tsv(std::ostream& out, const CodonTable& table) {
    out << "codon\taa_code\tamino_acid\tsubfam\tis_start\tis_stop\n";
    for (const auto& c : table.codons()) {
        out << c.codon
            << '\t' << c.aa_code
            << '\t' << c.amino_acid
            << '\t' << (c.subfam.empty() ? "NA" : c.subfam)
            << '\t' << (c.is_start ? 1 : 0)
            << '\t' << (c.is_stop ? 1 : 0)
            << '\n';
    }
}

void write_qc_report_tsv(std::ostream& out, const QcResult& qc) {
    out << "gene\treasons\n";
    for (const auto& ex : qc.excluded) {
        out << ex.id << '\t';
        for (size_t i = 0; i < ex.failures.size(); ++i) {
            if (i) out << ',';
            out << qc_failure_label(ex.failures[i]);
        }
        out << '\n';
    }
}

void write_counts_tsv(std::ostream& out, const CodonCountMatrix& counts) {
    out << "gene";
    for (size_t c = 0; c < NUM_CODONS; ++c) out << '\t' << codon_string(static_cast<int>(c));
    out << '\n';
    for (size_t i = 0; i < counts.size(); ++i) {
        out << counts.id(i);
        for (Count n : counts.value(i)) out << '\t' << n;
        out << '\n';
    }
}

void write_rscu_tsv(std::ostream& out, const std::vector<RscuEntry>& rscu) {
    out << "codon\tamino_acid\tsubfam\tcount\tprop\trscu\n";
    out << std::setprecision(6);
    for (const auto& e : rscu) {
        out << e.codon << '\t' << e.amino_acid << '\t' << e.subfam
            << '\t' << e.count << '\t';
        put_value(out, e.prop);
        out << '\t';
        put_value(out, e.rscu);
        out << '\n';
    }
}

void write_gene_values_tsv(std::ostream& out, const std::string& column,
                           const GeneMap<double>& values) {
    out << "gene\t" << column << '\n';
    out << std::setprecision(6);
    for (size_t i = 0; i < values.size(); ++i) {
        out << values.id(i) << '\t';
        put_value(out, values.value(i));
        out << '\n';
    }
}

void write_optimal_codons_tsv(std::ostream& out,
                              const std::vector<OptimalCodonRecord>& records) {
    out << "codon\tamino_acid\tsubfam\tcoefficient\tp_value\tq_value\tn_genes\toptimal\n";
    out << std::setprecision(6);
    for (const auto& r : records) {
        out << r.codon << '\t' << r.amino_acid << '\t' << r.subfam << '\t';
        put_value(out, r.coefficient);
        out << '\t';
        put_value(out, r.p_value);
        out << '\t';
        put_value(out, r.q_value);
        out << '\t' << r.n_genes << '\t' << (r.optimal ? 1 : 0) << '\n';
    }
}

void write_trna_weights_tsv(std::ostream& out,
                            const std::vector<TrnaWeightEntry>& weights) {
    out << "codon\tamino_acid\tsubfam\traw\tweight\tfloored\n";
    out << std::setprecision(6);
    for (const auto& w : weights) {
        out << w.codon << '\t' << w.amino_acid << '\t' << w.subfam << '\t'
            << w.raw << '\t';
        put_value(out, w.weight);
        out << '\t' << (w.floored ? 1 : 0) << '\n';
    }
}

} // namespace cubkit
