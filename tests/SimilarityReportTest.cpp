#include "matrix/MatrixBuilder.hpp"
#include "report/SimilarityReport.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace wordspace;

namespace {

struct Fixture {
    EntityIndex vocab{{"a", "b", "c"}, "word"};
    EntityIndex docs{{"A", "B", "C"}, "document"};
    CountMatrix td;

    Fixture() {
        Corpus c;
        c.add_line("A", {"a", "b"});
        c.add_line("B", {"b", "c"});
        c.add_line("C", {"a", "b", "c"});
        td = build_term_document(c, vocab, docs);
    }
};

}  // namespace

TEST(SimilarityReportTest, TableHasOneColumnPerMetric) {
    Fixture f;
    const auto metrics = all_similarity_metrics();
    const SimilarityTable t = build_similarity_table(f.td, Axis::Columns, 0, f.docs, "Term-Document", metrics, 10);

    EXPECT_EQ(t.pivot, "A");
    EXPECT_EQ(t.subject, "documents");
    ASSERT_EQ(t.columns.size(), 3u);
    for (const auto& col : t.columns) {
        ASSERT_EQ(col.rows.size(), 2u);
        EXPECT_EQ(col.rows[0].label, "C");
        EXPECT_EQ(col.rows[1].label, "B");
    }
    EXPECT_DOUBLE_EQ(t.columns[1].rows[0].score, 2.0 / 3.0);  // Jaccard A vs C
}

TEST(SimilarityReportTest, TopKLimitsRows) {
    Fixture f;
    const auto metrics = all_similarity_metrics();
    const SimilarityTable t = build_similarity_table(f.td, Axis::Columns, 0, f.docs, "Term-Document", metrics, 1);
    for (const auto& col : t.columns) EXPECT_EQ(col.rows.size(), 1u);
}

TEST(SimilarityReportTest, RenderTableLaysOutFixedWidthColumns) {
    Fixture f;
    const auto metrics = all_similarity_metrics();
    const SimilarityTable t = build_similarity_table(f.td, Axis::Columns, 1, f.docs, "TF-IDF", metrics, 10);

    const std::string text = render_table(t);
    EXPECT_NE(text.find("similar documents to \"B\" using TF-IDF"), std::string::npos);
    EXPECT_NE(text.find("Rank  Cosine Similarity"), std::string::npos);
    EXPECT_NE(text.find(std::string(100, '-')), std::string::npos);
    EXPECT_NE(text.find("A (0.5000)"), std::string::npos);
    EXPECT_NE(text.find("\n1     C ("), std::string::npos);
}

TEST(SimilarityReportTest, WritesJsonArtifact) {
    Fixture f;
    const auto metrics = all_similarity_metrics();

    SimilarityReport report;
    report.corpus_path = "corpus.csv";
    report.vocab_path = "vocab.txt";
    report.tables.push_back(build_similarity_table(f.td, Axis::Columns, 0, f.docs, "Term-Document", metrics, 10));

    const fs::path p = fs::temp_directory_path() / "wordspace_report" / "report.json";
    report.write_to(p);

    std::ifstream in(p);
    ASSERT_TRUE(static_cast<bool>(in));
    nlohmann::json j;
    in >> j;

    EXPECT_EQ(j.at("corpus_path").get<std::string>(), "corpus.csv");
    EXPECT_EQ(j.at("config").at("window_size").get<int>(), 4);
    ASSERT_EQ(j.at("tables").size(), 1u);
    const auto& table = j.at("tables").at(0);
    EXPECT_EQ(table.at("pivot").get<std::string>(), "A");
    EXPECT_EQ(table.at("metrics").at(0).at("metric").get<std::string>(), "Cosine");
    EXPECT_EQ(table.at("metrics").at(0).at("ranking").at(0).at("label").get<std::string>(), "C");
    EXPECT_EQ(table.at("metrics").at(0).at("ranking").at(0).at("rank").get<int>(), 1);

    fs::remove_all(p.parent_path());
}
