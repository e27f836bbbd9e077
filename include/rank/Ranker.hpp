#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "matrix/DenseMatrix.hpp"
#include "sim/Similarity.hpp"

namespace wordspace {

enum class Axis {
    Rows,     // word vectors
    Columns   // document vectors
};

struct RankedEntry {
    size_t index = 0;
    double score = 0.0;
};

// Scores every index along `axis` except `pivot` against the pivot's vector and
// returns them by descending score. Equal scores keep ascending index order.
template <typename T>
std::vector<RankedEntry> rank(const DenseMatrix<T>& matrix, Axis axis, size_t pivot, const SimilarityMetric& metric) {
    const size_t n = (axis == Axis::Rows) ? matrix.rows() : matrix.cols();
    if (pivot >= n) {
        throw std::out_of_range("rank: pivot " + std::to_string(pivot) + " out of range (" + std::to_string(n) + ")");
    }

    auto vec = [&](size_t i) { return (axis == Axis::Rows) ? matrix.row(i) : matrix.col(i); };

    const std::vector<double> target = vec(pivot);

    std::vector<RankedEntry> out;
    out.reserve(n - 1);
    for (size_t i = 0; i < n; ++i) {
        if (i == pivot) continue;
        out.push_back({i, metric.score(target, vec(i))});
    }

    std::stable_sort(out.begin(), out.end(), [](const RankedEntry& a, const RankedEntry& b) {
        return a.score > b.score;
    });
    return out;
}

template <typename T>
std::vector<RankedEntry> rank_documents(const DenseMatrix<T>& matrix, size_t doc, const SimilarityMetric& metric) {
    return rank(matrix, Axis::Columns, doc, metric);
}

template <typename T>
std::vector<RankedEntry> rank_words(const DenseMatrix<T>& matrix, size_t word, const SimilarityMetric& metric) {
    return rank(matrix, Axis::Rows, word, metric);
}

inline std::vector<size_t> ranked_indices(const std::vector<RankedEntry>& ranking) {
    std::vector<size_t> out;
    out.reserve(ranking.size());
    for (const auto& e : ranking) out.push_back(e.index);
    return out;
}

}  // namespace wordspace
