#ifndef LATTICE_COMMON_ERROR_HPP
#define LATTICE_COMMON_ERROR_HPP

#include <stdexcept>

namespace Lattice {
    // Wrong argument kind (non-layer passed to add, Sequential where a graph model is expected).
    struct TypeError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct ConfigError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct ShapeError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct CardinalityError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct UnsupportedError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct EmptyError : std::out_of_range {
        using std::out_of_range::out_of_range;
    };

    // Operation requires a prior compile/build.
    struct PreconditionError : std::logic_error {
        using std::logic_error::logic_error;
    };

    // Internal invariant violated (unreachable output during clone).
    struct AssertionError : std::logic_error {
        using std::logic_error::logic_error;
    };

    struct DependencyError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Archive or config is missing a required record.
    struct ValidationError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct SerializationError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };
}

#endif // LATTICE_COMMON_ERROR_HPP
