#pragma once
#include <cstddef>

#include "corpus/Corpus.hpp"
#include "index/EntityIndex.hpp"
#include "matrix/DenseMatrix.hpp"

namespace wordspace {

// |V| x |D|; cell (w, d) = occurrences of word w in lines of document d.
// Lines whose document is not indexed, and tokens outside the vocabulary, are skipped.
CountMatrix build_term_document(const Corpus& corpus, const EntityIndex& vocab, const EntityIndex& docs);

// |V| x |V|; cell (i, j) = times word j appears within window_size tokens
// (either side, same line) of an occurrence of word i. Symmetric.
CountMatrix build_term_context(const Corpus& corpus, const EntityIndex& vocab, size_t window_size);

}  // namespace wordspace
