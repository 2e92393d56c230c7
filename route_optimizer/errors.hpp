#pragma once
#include <stdexcept>
#include <string>

// Rejected request; raised before any matrix is built.
struct ValidationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Fatal failure of an optimize call. No partial result is produced.
struct OptimizationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct AssemblyInvariantViolation : OptimizationError {
    using OptimizationError::OptimizationError;
};

// Thrown by traffic/weather providers. Never leaves the optimizer.
struct CollaboratorUnavailable : std::runtime_error {
    using std::runtime_error::runtime_error;
};
