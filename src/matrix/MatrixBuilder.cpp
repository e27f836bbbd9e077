#include "matrix/MatrixBuilder.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace wordspace {

static const size_t kUnresolved = static_cast<size_t>(-1);

CountMatrix build_term_document(const Corpus& corpus, const EntityIndex& vocab, const EntityIndex& docs) {
    CountMatrix td(vocab.size(), docs.size());

    for (const auto& line : corpus.lines()) {
        size_t doc_id = 0;
        if (!docs.try_position(line.document, doc_id)) continue;

        for (const auto& tok : line.tokens) {
            size_t word_id = 0;
            if (!vocab.try_position(tok, word_id)) continue;
            td(word_id, doc_id) += 1;
        }
    }

    return td;
}

CountMatrix build_term_context(const Corpus& corpus, const EntityIndex& vocab, size_t window_size) {
    if (window_size == 0) throw std::invalid_argument("context window size must be positive");

    const size_t n = vocab.size();
    CountMatrix tc(n, n);

    std::vector<size_t> ids;
    for (const auto& line : corpus.lines()) {
        const auto& toks = line.tokens;

        // resolve each position once; unresolved positions still occupy their slot
        ids.assign(toks.size(), kUnresolved);
        for (size_t i = 0; i < toks.size(); ++i) {
            size_t id = 0;
            if (vocab.try_position(toks[i], id)) ids[i] = id;
        }

        for (size_t i = 0; i < ids.size(); ++i) {
            const size_t target = ids[i];
            if (target == kUnresolved) continue;

            const size_t left = (i > window_size) ? i - window_size : 0;
            const size_t right = std::min(ids.size(), i + window_size + 1);

            for (size_t j = left; j < right; ++j) {
                if (j == i) continue;
                const size_t context = ids[j];
                if (context == kUnresolved) continue;
                tc(target, context) += 1;
            }
        }
    }

    return tc;
}

}  // namespace wordspace
