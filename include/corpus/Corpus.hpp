#pragma once
#include <string>
#include <vector>

namespace wordspace {

struct CorpusLine {
    std::string document;              // e.g. "Hamlet"
    std::vector<std::string> tokens;   // lowercased, alphanumeric only
};

class Corpus {
public:
    // ';'-delimited records: column 1 = document name, column 5 = text line
    static Corpus load_from_csv(const std::string& path);

    void add_line(std::string document, std::vector<std::string> tokens);

    const std::vector<CorpusLine>& lines() const { return m_lines; }
    size_t size() const { return m_lines.size(); }

    // rows dropped during loading because they had too few columns
    size_t skipped_rows() const { return m_skipped; }

    size_t token_count() const;

    // unique document names in order of first appearance
    std::vector<std::string> document_names() const;

private:
    std::vector<CorpusLine> m_lines;
    size_t m_skipped = 0;
};

// one token per line; trimmed, blanks ignored, first occurrence wins on duplicates
std::vector<std::string> load_vocabulary(const std::string& path);

}  // namespace wordspace
