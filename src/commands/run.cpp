#include "commands/run.hpp"
#include "commands/CliCommon.hpp"

#include "matrix/Diagnostics.hpp"

#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

using namespace wordspace;

static std::mt19937::result_type parse_seed(const std::string& s) {
    try {
        size_t used = 0;
        const unsigned long v = std::stoul(s, &used);
        if (used == s.size()) return static_cast<std::mt19937::result_type>(v);
    } catch (const std::exception&) {
    }
    throw std::runtime_error("--seed expects a non-negative integer, got: " + s);
}

int cmd_run(int argc, char** argv) {
    try {
        const PipelineConfig cfg = cli::config_from_args(argc, argv);
        const std::string word = cli::get_arg(argc, argv, "--word", "gain");
        const std::string report_path = cli::get_arg(argc, argv, "--report", "");

        std::ofstream mirror;
        cli::Printer pr{&std::cout, cli::open_mirror(argc, argv, mirror) ? &mirror : nullptr};

        const cli::Workspace ws = cli::load_workspace(argc, argv);
        if (ws.docs.size() == 0) throw std::runtime_error("corpus has no documents: " + ws.corpus_path);

        pr << "Term-Document Matrix will be: " << ws.vocab.size() << "x" << ws.docs.size() << " (|V| x D)\n";

        pr << "Computing term document, tf-idf, term context and PPMI matrices...\n";
        const cli::MatrixSet matrices = cli::build_matrices(ws, cfg, true, true);
        pr << "Number of hapax legomena (singletons): " << count_hapax_legomena(matrices.td) << "\n";

        std::mt19937 rng;
        const std::string seed = cli::get_arg(argc, argv, "--seed", "");
        if (!seed.empty()) {
            rng.seed(parse_seed(seed));
        } else {
            rng.seed(std::random_device{}());
        }
        std::uniform_int_distribution<size_t> pick(0, ws.docs.size() - 1);
        const size_t doc = pick(rng);
        pr << "\nSelected document: " << ws.docs.name_of(doc) << "\n";

        const auto metrics = all_similarity_metrics();

        SimilarityReport report;
        report.corpus_path = ws.corpus_path;
        report.vocab_path = ws.vocab_path;
        report.cfg = cfg;

        if (ws.docs.size() - 1 < cfg.top_k) {
            pr << "Warning: only " << (ws.docs.size() - 1) << " similar documents found\n";
        }
        for (const char* key : {"td", "tfidf"}) {
            SimilarityTable t = cli::similarity_table(ws, matrices, cfg, key, doc, metrics);
            pr << render_table(t);
            report.tables.push_back(std::move(t));
        }

        size_t word_pos = 0;
        if (ws.vocab.try_position(word, word_pos)) {
            for (const char* key : {"tc", "ppmi"}) {
                SimilarityTable t = cli::similarity_table(ws, matrices, cfg, key, word_pos, metrics);
                pr << render_table(t);
                report.tables.push_back(std::move(t));
            }
        } else {
            pr << "\nError: Word \"" << word << "\" not in vocabulary\n";
        }

        if (!report_path.empty()) {
            report.write_to(report_path);
            pr << "OUT_REPORT: " << report_path << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "run failed: " << e.what() << "\n";
        return 1;
    }
}
