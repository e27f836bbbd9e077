#pragma once

#include <memory>
#include <string>
#include <vector>

namespace wordspace {

// Strategy for scoring two equal-length vectors. Implementations are total:
// zero vectors score 0, never NaN. Mismatched lengths throw std::invalid_argument.
class SimilarityMetric {
public:
    virtual ~SimilarityMetric() = default;
    virtual std::string name() const = 0;
    virtual double score(const std::vector<double>& a, const std::vector<double>& b) const = 0;
};

class CosineSimilarity final : public SimilarityMetric {
public:
    std::string name() const override { return "Cosine"; }
    double score(const std::vector<double>& a, const std::vector<double>& b) const override;
};

// binarized: a dimension is present iff its value is > 0
class JaccardSimilarity final : public SimilarityMetric {
public:
    std::string name() const override { return "Jaccard"; }
    double score(const std::vector<double>& a, const std::vector<double>& b) const override;
};

class DiceSimilarity final : public SimilarityMetric {
public:
    std::string name() const override { return "Dice"; }
    double score(const std::vector<double>& a, const std::vector<double>& b) const override;
};

// "cosine" | "jaccard" | "dice", case-insensitive
std::unique_ptr<SimilarityMetric> make_similarity(const std::string& name);

// Cosine, Jaccard, Dice in that order
std::vector<std::unique_ptr<SimilarityMetric>> all_similarity_metrics();

}  // namespace wordspace
