#include "matrix/Weighting.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

namespace wordspace {

WeightMatrix ppmi(const CountMatrix& term_context) {
    if (term_context.rows() != term_context.cols()) {
        throw std::invalid_argument("ppmi: term-context matrix must be square");
    }

    const size_t n = term_context.rows();
    WeightMatrix out(n, n, 0.0);

    const double total = term_context.sum();
    if (total <= 0.0) return out;

    const std::vector<double> row_sum = term_context.row_sums();
    const std::vector<double> col_sum = term_context.col_sums();

    for (size_t i = 0; i < n; ++i) {
        if (row_sum[i] == 0.0) continue;
        for (size_t j = 0; j < n; ++j) {
            const double observed = static_cast<double>(term_context(i, j));
            if (observed == 0.0) continue;  // log2(0) = -inf -> 0

            const double expected = row_sum[i] * col_sum[j] / total;
            if (!(expected > 0.0)) continue;

            const double v = std::log2((observed * total) / expected);
            if (std::isfinite(v) && v > 0.0) out(i, j) = v;
        }
    }

    return out;
}

WeightMatrix tf_idf(const CountMatrix& term_document, double epsilon) {
    if (!(epsilon > 0.0)) throw std::invalid_argument("tf_idf: epsilon must be positive");

    const size_t rows = term_document.rows();
    const size_t docs = term_document.cols();
    WeightMatrix out(rows, docs, 0.0);
    if (docs == 0) return out;

    for (size_t w = 0; w < rows; ++w) {
        size_t df = 0;
        for (size_t d = 0; d < docs; ++d) {
            if (term_document(w, d) > 0) ++df;
        }
        if (df == 0) continue;  // every tf is 0 anyway

        const double idf = std::log(static_cast<double>(docs) / (static_cast<double>(df) + epsilon));
        for (size_t d = 0; d < docs; ++d) {
            out(w, d) = static_cast<double>(term_document(w, d)) * idf;
        }
    }

    return out;
}

}  // namespace wordspace
