#include "commands/rank.hpp"
#include "commands/CliCommon.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace wordspace;

static std::vector<std::unique_ptr<SimilarityMetric>> metrics_from_arg(const std::string& metric) {
    if (metric == "all") return all_similarity_metrics();
    std::vector<std::unique_ptr<SimilarityMetric>> out;
    out.push_back(make_similarity(metric));
    return out;
}

int cmd_rank(int argc, char** argv) {
    try {
        const std::string doc = cli::get_arg(argc, argv, "--doc", "");
        const std::string word = cli::get_arg(argc, argv, "--word", "");
        if (doc.empty() == word.empty()) {
            throw std::runtime_error("exactly one of --doc or --word is required");
        }
        const bool by_document = !doc.empty();

        const std::string matrix_key = cli::get_arg(argc, argv, "--matrix", by_document ? "td" : "ppmi");
        if (!cli::is_document_matrix(matrix_key) && !cli::is_word_matrix(matrix_key)) {
            throw std::runtime_error("unknown matrix: " + matrix_key + " (expected td, tfidf, tc or ppmi)");
        }
        if (by_document && !cli::is_document_matrix(matrix_key)) {
            throw std::runtime_error("--doc ranks document columns; use --matrix td or tfidf");
        }
        if (!by_document && !cli::is_word_matrix(matrix_key)) {
            throw std::runtime_error("--word ranks word rows; use --matrix tc or ppmi");
        }

        const auto metrics = metrics_from_arg(cli::get_arg(argc, argv, "--metric", "all"));
        const PipelineConfig cfg = cli::config_from_args(argc, argv);
        const cli::Workspace ws = cli::load_workspace(argc, argv);

        // surfaces UnknownEntityError before any matrix work
        const size_t pivot = by_document ? ws.docs.position_of(doc) : ws.vocab.position_of(word);

        const cli::MatrixSet matrices = cli::build_matrices(ws, cfg, by_document, !by_document);
        const SimilarityTable table = cli::similarity_table(ws, matrices, cfg, matrix_key, pivot, metrics);

        std::ofstream mirror;
        cli::Printer pr{&std::cout, cli::open_mirror(argc, argv, mirror) ? &mirror : nullptr};
        pr << render_table(table);

        const std::string report_path = cli::get_arg(argc, argv, "--report", "");
        if (!report_path.empty()) {
            SimilarityReport report;
            report.corpus_path = ws.corpus_path;
            report.vocab_path = ws.vocab_path;
            report.cfg = cfg;
            report.tables.push_back(table);
            report.write_to(report_path);
            pr << "OUT_REPORT: " << report_path << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "rank failed: " << e.what() << "\n";
        return 1;
    }
}
