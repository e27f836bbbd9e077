#include "corpus/Corpus.hpp"
#include "corpus/TextUtil.hpp"

#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace wordspace {

static const char kDelimiter = ';';
static const size_t kDocumentColumn = 1;
static const size_t kTextColumn = 5;

Corpus Corpus::load_from_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open: " + path);

    Corpus c;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;

        auto cols = textutil::split_csv_line(line, kDelimiter);
        if (cols.size() <= kTextColumn) {
            ++c.m_skipped;
            continue;
        }

        auto toks = textutil::tokenize(textutil::normalize(cols[kTextColumn]));
        c.add_line(textutil::trim(cols[kDocumentColumn]), std::move(toks));
    }

    return c;
}

void Corpus::add_line(std::string document, std::vector<std::string> tokens) {
    m_lines.push_back(CorpusLine{std::move(document), std::move(tokens)});
}

size_t Corpus::token_count() const {
    size_t n = 0;
    for (const auto& l : m_lines) n += l.tokens.size();
    return n;
}

std::vector<std::string> Corpus::document_names() const {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    seen.reserve(64);
    for (const auto& l : m_lines) {
        if (seen.insert(l.document).second) out.push_back(l.document);
    }
    return out;
}

std::vector<std::string> load_vocabulary(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open: " + path);

    std::vector<std::string> vocab;
    std::unordered_set<std::string> seen;
    std::string line;
    while (std::getline(in, line)) {
        std::string tok = textutil::trim(line);
        if (tok.empty()) continue;
        if (!seen.insert(tok).second) continue;
        vocab.push_back(std::move(tok));
    }
    return vocab;
}

}  // namespace wordspace
