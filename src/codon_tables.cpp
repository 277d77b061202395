/**
 * Genetic code tables
 *
 * Encoding: T=0, C=1, A=2, G=3
 * Index = base1*16 + base2*4 + base3
 *
 * Amino acid and start strings follow the NCBI translation tables, in the
 * same TCAG codon order as the index. In the start string 'M' marks an
 * initiation codon and '*' a codon that can terminate translation.
 */

#include "cubkit/codon_tables.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace cubkit {

namespace {

struct NcbiCode {
    int id;
    const char* name;
    const char* aas;
    const char* starts;
};

constexpr NcbiCode NCBI_CODES[] = {
    {1, "Standard",
     "FFLLSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "---M------**--*----M---------------M----------------------------"},
    {2, "Vertebrate Mitochondrial",
     "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIMMTTTTNNKKSS**VVVVAAAADDEEGGGG",
     "----------**--------------------MMMM----------**---M------------"},
    {3, "Yeast Mitochondrial",
     "FFLLSSSSYY**CCWWTTTTPPPPHHQQRRRRIIMMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "----------**----------------------MM---------------M------------"},
    {4, "Mold, Protozoan, and Coelenterate Mitochondrial; Mycoplasma/Spiroplasma",
     "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "--MM------**-------M------------MMMM---------------M------------"},
    {5, "Invertebrate Mitochondrial",
     "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIMMTTTTNNKKSSSSVVVVAAAADDEEGGGG",
     "---M------**--------------------MMMM---------------M------------"},
    {6, "Ciliate, Dasycladacean and Hexamita Nuclear",
     "FFLLSSSSYYQQCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "--------------*--------------------M----------------------------"},
    {9, "Echinoderm and Flatworm Mitochondrial",
     "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNNKSSSSVVVVAAAADDEEGGGG",
     "----------**-----------------------M---------------M------------"},
    {10, "Euplotid Nuclear",
     "FFLLSSSSYY**CCCWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "----------**-----------------------M----------------------------"},
    {11, "Bacterial, Archaeal and Plant Plastid",
     "FFLLSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "---M------**--*----M------------MMMM---------------M------------"},
    {12, "Alternative Yeast Nuclear",
     "FFLLSSSSYY**CC*WLLLSPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "----------**--*----M---------------M----------------------------"},
    {13, "Ascidian Mitochondrial",
     "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIMMTTTTNNKKSSGGVVVVAAAADDEEGGGG",
     "---M------**----------------------MM---------------M------------"},
    {14, "Alternative Flatworm Mitochondrial",
     "FFLLSSSSYYY*CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNNKSSSSVVVVAAAADDEEGGGG",
     "-----------*-----------------------M----------------------------"},
    {15, "Blepharisma Nuclear",
     "FFLLSSSSYY*QCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "----------*---*--------------------M----------------------------"},
    {16, "Chlorophycean Mitochondrial",
     "FFLLSSSSYY*LCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "----------*---*--------------------M----------------------------"},
    {21, "Trematode Mitochondrial",
     "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIMMTTTTNNNKSSSSVVVVAAAADDEEGGGG",
     "----------**-----------------------M---------------M------------"},
    {22, "Scenedesmus obliquus Mitochondrial",
     "FFLLSS*SYY*LCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "------*---*---*--------------------M----------------------------"},
    {23, "Thraustochytrium Mitochondrial",
     "FF*LSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "--*-------**--*-----------------M--M---------------M------------"},
    {24, "Rhabdopleuridae Mitochondrial",
     "FFLLSSSSYY**CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSSKVVVVAAAADDEEGGGG",
     "---M------**-------M---------------M---------------M------------"},
    {25, "Candidate Division SR1 and Gracilibacteria",
     "FFLLSSSSYY**CCGWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "---M------**-----------------------M---------------M------------"},
    {26, "Pachysolen tannophilus Nuclear",
     "FFLLSSSSYY**CC*WLLLAPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "----------**--*----M---------------M----------------------------"},
    {27, "Karyorelict Nuclear",
     "FFLLSSSSYYQQCCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "--------------*--------------------M----------------------------"},
    {28, "Condylostoma Nuclear",
     "FFLLSSSSYYQQCCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "----------**--*--------------------M----------------------------"},
    {29, "Mesodinium Nuclear",
     "FFLLSSSSYYYYCC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "--------------*--------------------M----------------------------"},
    {30, "Peritrich Nuclear",
     "FFLLSSSSYYEECC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "--------------*--------------------M----------------------------"},
    {31, "Blastocrithidia Nuclear",
     "FFLLSSSSYYEECCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG",
     "----------**-----------------------M----------------------------"},
    {33, "Cephalodiscidae Mitochondrial UAA-Tyr",
     "FFLLSSSSYYY*CCWWLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSSKVVVVAAAADDEEGGGG",
     "---M-------*-------M---------------M---------------M------------"},
};

struct AminoAcidName {
    char code;
    const char* name;
};

constexpr AminoAcidName AMINO_ACIDS[] = {
    {'A', "Ala"}, {'R', "Arg"}, {'N', "Asn"}, {'D', "Asp"}, {'C', "Cys"},
    {'Q', "Gln"}, {'E', "Glu"}, {'G', "Gly"}, {'H', "His"}, {'I', "Ile"},
    {'L', "Leu"}, {'K', "Lys"}, {'M', "Met"}, {'F', "Phe"}, {'P', "Pro"},
    {'S', "Ser"}, {'T', "Thr"}, {'W', "Trp"}, {'Y', "Tyr"}, {'V', "Val"},
    {'*', "Stop"},
};

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

const char* amino_acid_name(char aa_code) {
    for (const auto& aa : AMINO_ACIDS) {
        if (aa.code == aa_code) return aa.name;
    }
    return "Xaa";
}

char amino_acid_code(const std::string& name) {
    if (name.size() != 3 && name.size() != 4) return 0;
    for (const auto& aa : AMINO_ACIDS) {
        const std::string ref = aa.name;
        if (ref.size() != name.size()) continue;
        bool same = true;
        for (size_t i = 0; i < ref.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(ref[i])) !=
                std::tolower(static_cast<unsigned char>(name[i]))) {
                same = false;
                break;
            }
        }
        if (same) return aa.code;
    }
    return 0;
}

CodonTable CodonTable::from_id(const std::string& code_id) {
    const std::string key = trim(code_id);
    const NcbiCode* code = nullptr;
    for (const auto& c : NCBI_CODES) {
        if (key == std::to_string(c.id)) {
            code = &c;
            break;
        }
    }
    if (!code) throw InvalidCodeId(code_id);

    CodonTable table;
    table.id_ = key;
    table.name_ = code->name;

    std::map<std::pair<char, std::string>, int> subfam_lookup;
    for (int i = 0; i < static_cast<int>(NUM_CODONS); ++i) {
        CodonInfo& info = table.codons_[i];
        info.codon = codon_string(i);
        info.aa_code = code->aas[i];
        info.amino_acid = amino_acid_name(info.aa_code);
        info.is_start = code->starts[i] == 'M';
        // Reassignable stops ('*' in the start string) keep their sense
        // meaning for counting but may still terminate a CDS.
        info.is_stop = info.aa_code == '*' || code->starts[i] == '*';

        if (info.aa_code == '*') {
            table.subfam_of_[i] = -1;
            continue;
        }

        const auto key2 = std::make_pair(info.aa_code, info.codon.substr(0, 2));
        auto it = subfam_lookup.find(key2);
        if (it == subfam_lookup.end()) {
            Subfamily sf;
            sf.aa_code = info.aa_code;
            sf.amino_acid = info.amino_acid;
            sf.label = info.amino_acid + "_" + key2.second;
            it = subfam_lookup.emplace(key2, static_cast<int>(table.subfams_.size())).first;
            table.subfams_.push_back(std::move(sf));
        }
        table.subfams_[it->second].codons.push_back(i);
        table.subfam_of_[i] = it->second;
        info.subfam = table.subfams_[it->second].label;
    }

    return table;
}

std::vector<int> CodonTable::start_codons() const {
    std::vector<int> out;
    for (int i = 0; i < static_cast<int>(NUM_CODONS); ++i) {
        if (codons_[i].is_start) out.push_back(i);
    }
    return out;
}

std::vector<int> CodonTable::stop_codons() const {
    std::vector<int> out;
    for (int i = 0; i < static_cast<int>(NUM_CODONS); ++i) {
        if (codons_[i].is_stop) out.push_back(i);
    }
    return out;
}

std::vector<int> CodonTable::codons_for(char aa_code) const {
    std::vector<int> out;
    for (int i = 0; i < static_cast<int>(NUM_CODONS); ++i) {
        if (codons_[i].aa_code == aa_code) out.push_back(i);
    }
    return out;
}

const CodonTable& get_codon_table(const std::string& code_id) {
    // Built once, on first use; read-only afterwards
    static const std::map<std::string, CodonTable> tables = []() {
        std::map<std::string, CodonTable> m;
        for (const auto& c : NCBI_CODES) {
            const std::string id = std::to_string(c.id);
            m.emplace(id, CodonTable::from_id(id));
        }
        return m;
    }();

    auto it = tables.find(trim(code_id));
    if (it == tables.end()) throw InvalidCodeId(code_id);
    return it->second;
}

std::vector<std::string> available_code_ids() {
    std::vector<std::string> ids;
    for (const auto& c : NCBI_CODES) ids.push_back(std::to_string(c.id));
    return ids;
}

} // namespace cubkit
