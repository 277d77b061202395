#include "cubkit/types.hpp"

namespace cubkit {

std::string normalize_sequence(std::string_view seq) {
    std::string out;
    out.reserve(seq.size());
    for (char c : seq) {
        // Uppercase offset: 'a'-'A' = 32
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 32);
        if (c == 'U') c = 'T';
        out += c;
    }
    return out;
}

} // namespace cubkit
