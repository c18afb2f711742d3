#pragma once

#include <stdexcept>
#include <string>

namespace warden {

// Lattice failures are always surfaced; coverage math never defaults.
class LatticeError : public std::runtime_error {
public:
    explicit LatticeError(
        const std::string& msg
    ) : std::runtime_error(msg) {}
};

// Raw value outside the declared universe of a dimension.
class NormalizeError : public LatticeError {
public:
    explicit NormalizeError(
        const std::string& msg
    ) : LatticeError(msg) {}
};

class UnknownContextError : public LatticeError {
public:
    explicit UnknownContextError(
        const std::string& context_id
    ) : LatticeError("Unknown context id '" + context_id + "'"),
        id_(context_id) {}

    const std::string& contextId() const { return id_; }

private:
    std::string id_;
};

}
