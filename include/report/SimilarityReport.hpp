#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config/PipelineConfig.hpp"
#include "index/EntityIndex.hpp"
#include "nlohmann/json.hpp"
#include "rank/Ranker.hpp"
#include "sim/Similarity.hpp"

namespace wordspace {

struct TableRow {
    std::string label;
    double score = 0.0;
};

struct MetricColumn {
    std::string metric;            // "Cosine", ...
    std::vector<TableRow> rows;    // best first, at most top_k
};

struct SimilarityTable {
    std::string pivot;             // label of the query entity
    std::string subject;           // "documents" | "words"
    std::string matrix_label;      // e.g. "TF-IDF"
    std::vector<MetricColumn> columns;
};

// Ranks against `pivot` once per metric and keeps the first top_k entries.
template <typename T>
SimilarityTable build_similarity_table(
    const DenseMatrix<T>& matrix,
    Axis axis,
    size_t pivot,
    const EntityIndex& labels,
    const std::string& matrix_label,
    const std::vector<std::unique_ptr<SimilarityMetric>>& metrics,
    size_t top_k
) {
    SimilarityTable t;
    t.pivot = labels.name_of(pivot);
    t.subject = (axis == Axis::Rows) ? "words" : "documents";
    t.matrix_label = matrix_label;

    for (const auto& m : metrics) {
        const auto ranking = rank(matrix, axis, pivot, *m);

        MetricColumn col;
        col.metric = m->name();
        const size_t n = std::min(top_k, ranking.size());
        col.rows.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            col.rows.push_back({labels.name_of(ranking[i].index), ranking[i].score});
        }
        t.columns.push_back(std::move(col));
    }
    return t;
}

// Fixed-width side-by-side text table, one column per metric.
std::string render_table(const SimilarityTable& table);

struct SimilarityReport {
    std::string corpus_path;
    std::string vocab_path;
    PipelineConfig cfg;
    std::vector<SimilarityTable> tables;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace wordspace
