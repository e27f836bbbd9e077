#include "sim/Similarity.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace wordspace {

static void require_same_length(const std::vector<double>& a, const std::vector<double>& b, const char* who) {
    if (a.size() != b.size()) {
        throw std::invalid_argument(std::string(who) + ": vector length mismatch (" +
                                    std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")");
    }
}

struct PresenceCounts {
    size_t in_a = 0;
    size_t in_b = 0;
    size_t both = 0;
    size_t either = 0;
};

static PresenceCounts count_presence(const std::vector<double>& a, const std::vector<double>& b) {
    PresenceCounts c;
    for (size_t i = 0; i < a.size(); ++i) {
        const bool pa = a[i] > 0.0;
        const bool pb = b[i] > 0.0;
        if (pa) ++c.in_a;
        if (pb) ++c.in_b;
        if (pa && pb) ++c.both;
        if (pa || pb) ++c.either;
    }
    return c;
}

double CosineSimilarity::score(const std::vector<double>& a, const std::vector<double>& b) const {
    require_same_length(a, b, "cosine");

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

double JaccardSimilarity::score(const std::vector<double>& a, const std::vector<double>& b) const {
    require_same_length(a, b, "jaccard");

    const PresenceCounts c = count_presence(a, b);
    if (c.either == 0) return 0.0;
    return static_cast<double>(c.both) / static_cast<double>(c.either);
}

double DiceSimilarity::score(const std::vector<double>& a, const std::vector<double>& b) const {
    require_same_length(a, b, "dice");

    const PresenceCounts c = count_presence(a, b);
    const size_t denom = c.in_a + c.in_b;
    if (denom == 0) return 0.0;
    return 2.0 * static_cast<double>(c.both) / static_cast<double>(denom);
}

static std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::unique_ptr<SimilarityMetric> make_similarity(const std::string& name) {
    const std::string key = to_lower_copy(name);
    if (key == "cosine") return std::make_unique<CosineSimilarity>();
    if (key == "jaccard") return std::make_unique<JaccardSimilarity>();
    if (key == "dice") return std::make_unique<DiceSimilarity>();
    throw std::invalid_argument("unknown similarity metric: " + name);
}

std::vector<std::unique_ptr<SimilarityMetric>> all_similarity_metrics() {
    std::vector<std::unique_ptr<SimilarityMetric>> out;
    out.push_back(std::make_unique<CosineSimilarity>());
    out.push_back(std::make_unique<JaccardSimilarity>());
    out.push_back(std::make_unique<DiceSimilarity>());
    return out;
}

}  // namespace wordspace
