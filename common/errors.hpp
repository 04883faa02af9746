#ifndef TETRIS_COMMON_ERRORS_HPP
#define TETRIS_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tetris {

// Base of every error raised by the mesh model and its writers.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Degenerate or inconsistent geometry (zero-length edges, points that are
// not corners of a block, ...).
class GeometryError : public Error {
public:
    using Error::Error;
};

// Wrong arity or shape of a setting: vertex counts, grading lengths,
// non-positive cell counts, malformed input arrays.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// Misuse of the registry API, e.g. null handles.
class TypeContractError : public Error {
public:
    using Error::Error;
};

// Requested a feature that is deliberately not implemented.
class UnsupportedError : public Error {
public:
    using Error::Error;
};

// An element could not be written to the output document.
class RenderError : public Error {
public:
    using Error::Error;
};

}  // namespace tetris

#endif // TETRIS_COMMON_ERRORS_HPP
