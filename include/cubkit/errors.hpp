#pragma once
// Exception hierarchy for cubkit.
//
// Undefined ratios (empty subfamilies, zero denominators) are not errors:
// they surface as the NA marker from types.hpp.

#include <stdexcept>
#include <string>

namespace cubkit {

class CubError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unknown genetic code identifier; no table can be built.
class InvalidCodeId : public CubError {
public:
    explicit InvalidCodeId(const std::string& code_id)
        : CubError("Unknown genetic code id: '" + code_id + "'")
        , code_id_(code_id) {}

    const std::string& code_id() const noexcept { return code_id_; }

private:
    std::string code_id_;
};

// Sequence that cannot be read as a series of codons.
class MalformedSequence : public CubError {
public:
    MalformedSequence(const std::string& gene_id, const std::string& what)
        : CubError("Malformed sequence '" + gene_id + "': " + what)
        , gene_id_(gene_id) {}

    const std::string& gene_id() const noexcept { return gene_id_; }

private:
    std::string gene_id_;
};

// Too few observations for a statistic or regression.
class InsufficientData : public CubError {
public:
    using CubError::CubError;
};

class DuplicateGeneId : public CubError {
public:
    explicit DuplicateGeneId(const std::string& gene_id)
        : CubError("Duplicate gene id: '" + gene_id + "'") {}
};

// Unreadable files, bad table rows, unknown option values.
class InputError : public CubError {
public:
    using CubError::CubError;
};

}  // namespace cubkit
