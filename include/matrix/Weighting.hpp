#pragma once

#include "matrix/DenseMatrix.hpp"

namespace wordspace {

// Positive PMI of a square term-context matrix. Cells whose log-ratio is
// undefined, infinite or negative are 0. An all-zero input gives an all-zero output.
WeightMatrix ppmi(const CountMatrix& term_context);

// tf-idf with idf[w] = ln(|D| / (df[w] + epsilon)).
WeightMatrix tf_idf(const CountMatrix& term_document, double epsilon = 1e-10);

}  // namespace wordspace
