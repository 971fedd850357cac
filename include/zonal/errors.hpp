#pragma once

/// @file include/zonal/errors.hpp
/// @brief Error taxonomy for zone detection and analysis.
///
/// ## Propagation
/// - `ConfigurationError`: bad detector parameters or missing configured
///   columns. Thrown before any scanning starts.
/// - `DataError`: unusable source data (empty table, non-monotonic
///   timestamps, a required column absent at call time). Fatal for a
///   detection run; converted to a null metric group by the feature
///   extractor when raised by an analytical strategy.
/// - `ComputationError`: a degenerate numeric result (zero variance, NaN
///   correlation). Numeric helpers report it as `std::nullopt`; strategies
///   degrade it to a null field and never let it escape.

#include <stdexcept>
#include <string>

namespace zonal {

/// Common base so callers can catch every library error in one place.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid or missing detector parameter, or a configured column that the
/// table does not contain.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/// Source data cannot be used as given.
class DataError : public Error {
public:
    using Error::Error;
};

/// A numeric computation produced no meaningful value.
class ComputationError : public Error {
public:
    using Error::Error;
};

}  // namespace zonal
