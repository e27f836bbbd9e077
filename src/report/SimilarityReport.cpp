#include "report/SimilarityReport.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace wordspace {

static const int kRankWidth = 5;
static const int kCellWidth = 30;
static const size_t kRuleWidth = 100;

static std::string format_cell(const TableRow& r) {
    std::ostringstream oss;
    oss << r.label << " (" << std::fixed << std::setprecision(4) << r.score << ")";
    return oss.str();
}

std::string render_table(const SimilarityTable& table) {
    std::ostringstream out;
    out << "\n--- Top similar " << table.subject << " to \"" << table.pivot << "\" using "
        << table.matrix_label << " ---\n";

    out << std::left << std::setw(kRankWidth) << "Rank";
    for (const auto& c : table.columns) {
        out << " " << std::setw(kCellWidth) << (c.metric + " Similarity");
    }
    out << "\n" << std::string(kRuleWidth, '-') << "\n";

    size_t n = 0;
    for (const auto& c : table.columns) n = std::max(n, c.rows.size());

    for (size_t i = 0; i < n; ++i) {
        out << std::left << std::setw(kRankWidth) << (i + 1);
        for (const auto& c : table.columns) {
            const std::string cell = (i < c.rows.size()) ? format_cell(c.rows[i]) : "";
            out << " " << std::setw(kCellWidth) << cell;
        }
        out << "\n";
    }

    return out.str();
}

static nlohmann::json table_to_json(const SimilarityTable& t) {
    nlohmann::json j;
    j["pivot"] = t.pivot;
    j["subject"] = t.subject;
    j["matrix"] = t.matrix_label;

    nlohmann::json cols = nlohmann::json::array();
    for (const auto& c : t.columns) {
        nlohmann::json rows = nlohmann::json::array();
        for (size_t i = 0; i < c.rows.size(); ++i) {
            rows.push_back({
                {"rank", i + 1},
                {"label", c.rows[i].label},
                {"score", c.rows[i].score}
            });
        }
        cols.push_back({{"metric", c.metric}, {"ranking", rows}});
    }
    j["metrics"] = cols;
    return j;
}

nlohmann::json SimilarityReport::to_json() const {
    nlohmann::json j;
    j["corpus_path"] = corpus_path;
    j["vocab_path"] = vocab_path;
    j["config"] = wordspace::to_json(cfg);

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : tables) arr.push_back(table_to_json(t));
    j["tables"] = arr;

    return j;
}

void SimilarityReport::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace wordspace
