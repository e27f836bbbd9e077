#pragma once

#include <fstream>
#include <iostream>
#include <string>

#include "config/PipelineConfig.hpp"
#include "corpus/Corpus.hpp"
#include "index/EntityIndex.hpp"
#include "matrix/DenseMatrix.hpp"
#include "rank/Ranker.hpp"
#include "report/SimilarityReport.hpp"

namespace cli {

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// throws std::runtime_error when the value is not a positive integer / number
size_t get_arg_size(int argc, char** argv, const std::string& key, size_t def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// --config file first, then --window / --epsilon / --topk overrides; validated
wordspace::PipelineConfig config_from_args(int argc, char** argv);

// writes to stdout and, when mirroring, to a file
struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
    Printer& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (a) manip(*a);
        if (b) manip(*b);
        return *this;
    }
};

// opens --out for mirroring; returns false if not requested
bool open_mirror(int argc, char** argv, std::ofstream& out);

struct Workspace {
    std::string corpus_path;
    std::string vocab_path;
    wordspace::Corpus corpus;
    wordspace::EntityIndex vocab;
    wordspace::EntityIndex docs;
};

// --corpus and --vocab are required
Workspace load_workspace(int argc, char** argv);

// "td" | "tfidf" | "tc" | "ppmi"
bool is_document_matrix(const std::string& key);
bool is_word_matrix(const std::string& key);
std::string matrix_label(const std::string& key);

struct MatrixSet {
    wordspace::CountMatrix td;
    wordspace::WeightMatrix tfidf;
    wordspace::CountMatrix tc;
    wordspace::WeightMatrix ppmi;
};

// document matrices (td, tfidf) and/or word matrices (tc, ppmi)
MatrixSet build_matrices(const Workspace& ws, const wordspace::PipelineConfig& cfg, bool documents, bool words);

// one ranking per metric against `pivot` on the named matrix
wordspace::SimilarityTable similarity_table(
    const Workspace& ws,
    const MatrixSet& matrices,
    const wordspace::PipelineConfig& cfg,
    const std::string& matrix_key,
    size_t pivot,
    const std::vector<std::unique_ptr<wordspace::SimilarityMetric>>& metrics
);

}  // namespace cli
