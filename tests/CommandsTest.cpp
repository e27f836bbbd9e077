#include "commands/rank.hpp"
#include "commands/run.hpp"
#include "commands/stats.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct CommandResult {
    int code = 0;
    std::string out;
    std::string err;
};

// args[0] is the subcommand name, the same slice main() hands to cmd_*
CommandResult invoke(int (*cmd)(int, char**), std::vector<std::string> args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& a : args) argv.push_back(a.data());

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    CommandResult r;
    r.code = cmd(static_cast<int>(argv.size()), argv.data());
    r.out = testing::internal::GetCapturedStdout();
    r.err = testing::internal::GetCapturedStderr();
    return r;
}

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

class CommandsTest : public ::testing::Test {
protected:
    fs::path dir;
    std::string corpus;
    std::string vocab;

    void SetUp() override {
        dir = fs::temp_directory_path() / "wordspace_commands";
        fs::create_directories(dir);
        corpus = (dir / "plays.csv").string();
        vocab = (dir / "vocab.txt").string();

        std::ofstream c(corpus);
        c << "1;A;1;1.1.1;X;The king is dead.\n"
          << "2;B;1;1.1.2;Y;Long live the king!\n"
          << "3;C;1;1.1.3;Z;The queen is dead.\n";

        std::ofstream v(vocab);
        v << "the\nking\nis\ndead\nlong\nlive\nqueen\n";
    }

    void TearDown() override { fs::remove_all(dir); }
};

}  // namespace

TEST_F(CommandsTest, RankDocumentPrintsTable) {
    const auto r = invoke(cmd_rank, {"rank", "--corpus", corpus, "--vocab", vocab, "--doc", "A"});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_NE(r.out.find("similar documents to \"A\" using Term-Document"), std::string::npos);
    EXPECT_NE(r.out.find("Cosine Similarity"), std::string::npos);
}

TEST_F(CommandsTest, RankUnknownWordFails) {
    const auto r = invoke(cmd_rank, {"rank", "--corpus", corpus, "--vocab", vocab, "--word", "gain"});
    EXPECT_EQ(r.code, 1);
    EXPECT_NE(r.err.find("rank failed: unknown word: \"gain\""), std::string::npos);
    EXPECT_TRUE(r.out.empty());
}

TEST_F(CommandsTest, RankUnknownDocumentFails) {
    const auto r = invoke(cmd_rank, {"rank", "--corpus", corpus, "--vocab", vocab, "--doc", "Hamlet"});
    EXPECT_EQ(r.code, 1);
    EXPECT_NE(r.err.find("unknown document: \"Hamlet\""), std::string::npos);
}

TEST_F(CommandsTest, RankRejectsMatrixForTheWrongAxis) {
    const auto doc_on_words = invoke(cmd_rank, {"rank", "--corpus", corpus, "--vocab", vocab, "--doc", "A", "--matrix", "ppmi"});
    EXPECT_EQ(doc_on_words.code, 1);
    EXPECT_NE(doc_on_words.err.find("use --matrix td or tfidf"), std::string::npos);

    const auto word_on_docs = invoke(cmd_rank, {"rank", "--corpus", corpus, "--vocab", vocab, "--word", "king", "--matrix", "td"});
    EXPECT_EQ(word_on_docs.code, 1);
    EXPECT_NE(word_on_docs.err.find("use --matrix tc or ppmi"), std::string::npos);

    const auto unknown = invoke(cmd_rank, {"rank", "--corpus", corpus, "--vocab", vocab, "--doc", "A", "--matrix", "svd"});
    EXPECT_EQ(unknown.code, 1);
    EXPECT_NE(unknown.err.find("unknown matrix: svd"), std::string::npos);
}

TEST_F(CommandsTest, RankRequiresExactlyOneQuery) {
    const auto none = invoke(cmd_rank, {"rank", "--corpus", corpus, "--vocab", vocab});
    EXPECT_EQ(none.code, 1);
    const auto both = invoke(cmd_rank, {"rank", "--corpus", corpus, "--vocab", vocab, "--doc", "A", "--word", "king"});
    EXPECT_EQ(both.code, 1);
}

TEST_F(CommandsTest, RunWithUnknownWordStillPrintsDocumentTables) {
    const auto r = invoke(cmd_run, {"run", "--corpus", corpus, "--vocab", vocab, "--word", "gain", "--seed", "7"});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_NE(r.out.find("Error: Word \"gain\" not in vocabulary"), std::string::npos);
    EXPECT_NE(r.out.find("using Term-Document"), std::string::npos);
    EXPECT_NE(r.out.find("using TF-IDF"), std::string::npos);
    EXPECT_EQ(r.out.find("using PPMI"), std::string::npos);

    // 3 documents, top_k 10: warned once, not once per document matrix
    EXPECT_EQ(count_occurrences(r.out, "Warning: only 2 similar documents found"), 1u);
}

TEST_F(CommandsTest, RunWithKnownWordPrintsWordTables) {
    const auto r = invoke(cmd_run, {"run", "--corpus", corpus, "--vocab", vocab, "--word", "king", "--seed", "0", "--topk", "2"});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_NE(r.out.find("similar words to \"king\" using Term-Context"), std::string::npos);
    EXPECT_NE(r.out.find("similar words to \"king\" using PPMI"), std::string::npos);
    EXPECT_EQ(r.out.find("Warning:"), std::string::npos);
}

TEST_F(CommandsTest, StatsOnCorpusWithoutDocuments) {
    {
        std::ofstream c(corpus, std::ios::out | std::ios::trunc);
        c << "too;short\n";
    }
    const auto r = invoke(cmd_stats, {"stats", "--corpus", corpus, "--vocab", vocab});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_NE(r.out.find("DOCUMENTS: 0"), std::string::npos);
    EXPECT_NE(r.out.find("SKIPPED_ROWS: 1"), std::string::npos);
    EXPECT_NE(r.out.find("TERM_DOCUMENT: 7x0"), std::string::npos);
    EXPECT_NE(r.out.find("HAPAX_LEGOMENA: 0"), std::string::npos);
}

TEST_F(CommandsTest, MissingInputsFail) {
    const auto r = invoke(cmd_stats, {"stats", "--vocab", vocab});
    EXPECT_EQ(r.code, 1);
    EXPECT_NE(r.err.find("stats failed: missing --corpus"), std::string::npos);
}
