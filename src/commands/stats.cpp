#include "commands/stats.hpp"
#include "commands/CliCommon.hpp"

#include "matrix/Diagnostics.hpp"
#include "matrix/MatrixBuilder.hpp"

#include <iostream>
#include <string>

using namespace wordspace;

static void print_summary(cli::Printer& pr, const char* label, const MatrixSummary& s) {
    pr << label << ": " << s.rows << "x" << s.cols
       << " (total=" << static_cast<unsigned long long>(s.total)
       << ", nonzero=" << s.nonzero << ")\n";
}

int cmd_stats(int argc, char** argv) {
    try {
        const PipelineConfig cfg = cli::config_from_args(argc, argv);
        const cli::Workspace ws = cli::load_workspace(argc, argv);

        std::ofstream mirror;
        cli::Printer pr{&std::cout, cli::open_mirror(argc, argv, mirror) ? &mirror : nullptr};

        pr << "CORPUS: " << ws.corpus_path << "\n";
        pr << "VOCAB: " << ws.vocab_path << "\n";
        pr << "LINES: " << ws.corpus.size() << "\n";
        pr << "SKIPPED_ROWS: " << ws.corpus.skipped_rows() << "\n";
        pr << "TOKENS: " << ws.corpus.token_count() << "\n";
        pr << "DOCUMENTS: " << ws.docs.size() << "\n";
        pr << "VOCABULARY: " << ws.vocab.size() << "\n";
        pr << "WINDOW: " << cfg.window_size << "\n";

        const CountMatrix td = build_term_document(ws.corpus, ws.vocab, ws.docs);
        print_summary(pr, "TERM_DOCUMENT", summarize(td));
        pr << "HAPAX_LEGOMENA: " << count_hapax_legomena(td) << "\n";

        const CountMatrix tc = build_term_context(ws.corpus, ws.vocab, cfg.window_size);
        print_summary(pr, "TERM_CONTEXT", summarize(tc));

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "stats failed: " << e.what() << "\n";
        return 1;
    }
}
