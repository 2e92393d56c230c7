#pragma once
#include "models.hpp"
#include <vector>

// Walks sequence in order and reads every leg from the matrices.
// Throws AssemblyInvariantViolation when sequence is not a depot-first
// permutation of all nodes or sizes disagree.
Route assemble_route(const std::vector<int>& sequence,
                     const CostMatrix& matrices,
                     const Stop& depot,
                     const std::vector<Stop>& stops);
