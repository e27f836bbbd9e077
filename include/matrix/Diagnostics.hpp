#pragma once
#include <cstddef>

#include "matrix/DenseMatrix.hpp"

namespace wordspace {

struct MatrixSummary {
    size_t rows = 0;
    size_t cols = 0;
    double total = 0.0;    // sum of all cells
    size_t nonzero = 0;
};

template <typename T>
MatrixSummary summarize(const DenseMatrix<T>& m) {
    MatrixSummary s;
    s.rows = m.rows();
    s.cols = m.cols();
    s.total = m.sum();
    s.nonzero = m.count_nonzero();
    return s;
}

// words occurring exactly once across the whole corpus
size_t count_hapax_legomena(const CountMatrix& term_document);

}  // namespace wordspace
