#include "commands/CliCommon.hpp"

#include "matrix/MatrixBuilder.hpp"
#include "matrix/Weighting.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace wordspace;

namespace cli {

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

size_t get_arg_size(int argc, char** argv, const std::string& key, size_t def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    long long v = 0;
    size_t used = 0;
    try {
        v = std::stoll(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects an integer, got: " + s);
    }
    if (used != s.size() || v <= 0) throw std::runtime_error(key + " expects a positive integer, got: " + s);
    return static_cast<size_t>(v);
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    try {
        size_t used = 0;
        const double v = std::stod(s, &used);
        if (used == s.size()) return v;
    } catch (const std::exception&) {
    }
    throw std::runtime_error(key + " expects a number, got: " + s);
}

PipelineConfig config_from_args(int argc, char** argv) {
    const std::string path = get_arg(argc, argv, "--config", "");
    PipelineConfig cfg = path.empty() ? PipelineConfig{} : load_pipeline_config(path);

    cfg.window_size = get_arg_size(argc, argv, "--window", cfg.window_size);
    cfg.epsilon = get_arg_double(argc, argv, "--epsilon", cfg.epsilon);
    cfg.top_k = get_arg_size(argc, argv, "--topk", cfg.top_k);

    validate(cfg);
    return cfg;
}

bool open_mirror(int argc, char** argv, std::ofstream& out) {
    const std::string out_path = get_arg(argc, argv, "--out", "");
    if (out_path.empty()) return false;

    fs::path p(out_path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    out.open(p, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + out_path);
    return true;
}

Workspace load_workspace(int argc, char** argv) {
    Workspace ws;
    ws.corpus_path = get_arg(argc, argv, "--corpus", "");
    ws.vocab_path = get_arg(argc, argv, "--vocab", "");
    if (ws.corpus_path.empty()) throw std::runtime_error("missing --corpus");
    if (ws.vocab_path.empty()) throw std::runtime_error("missing --vocab");

    ws.corpus = Corpus::load_from_csv(ws.corpus_path);
    ws.vocab = EntityIndex(load_vocabulary(ws.vocab_path), "word");
    ws.docs = EntityIndex(ws.corpus.document_names(), "document");
    return ws;
}

bool is_document_matrix(const std::string& key) {
    return key == "td" || key == "tfidf";
}

bool is_word_matrix(const std::string& key) {
    return key == "tc" || key == "ppmi";
}

std::string matrix_label(const std::string& key) {
    if (key == "td") return "Term-Document";
    if (key == "tfidf") return "TF-IDF";
    if (key == "tc") return "Term-Context";
    if (key == "ppmi") return "PPMI";
    throw std::runtime_error("unknown matrix: " + key + " (expected td, tfidf, tc or ppmi)");
}

MatrixSet build_matrices(const Workspace& ws, const PipelineConfig& cfg, bool documents, bool words) {
    MatrixSet m;
    if (documents) {
        m.td = build_term_document(ws.corpus, ws.vocab, ws.docs);
        m.tfidf = tf_idf(m.td, cfg.epsilon);
    }
    if (words) {
        m.tc = build_term_context(ws.corpus, ws.vocab, cfg.window_size);
        m.ppmi = ppmi(m.tc);
    }
    return m;
}

SimilarityTable similarity_table(
    const Workspace& ws,
    const MatrixSet& matrices,
    const PipelineConfig& cfg,
    const std::string& matrix_key,
    size_t pivot,
    const std::vector<std::unique_ptr<SimilarityMetric>>& metrics
) {
    const std::string label = matrix_label(matrix_key);
    const size_t k = cfg.top_k;

    if (matrix_key == "td") return build_similarity_table(matrices.td, Axis::Columns, pivot, ws.docs, label, metrics, k);
    if (matrix_key == "tfidf") return build_similarity_table(matrices.tfidf, Axis::Columns, pivot, ws.docs, label, metrics, k);
    if (matrix_key == "tc") return build_similarity_table(matrices.tc, Axis::Rows, pivot, ws.vocab, label, metrics, k);
    return build_similarity_table(matrices.ppmi, Axis::Rows, pivot, ws.vocab, label, metrics, k);
}

}  // namespace cli
