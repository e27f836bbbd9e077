#include "sim/Similarity.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace wordspace;

namespace {

const std::vector<double> kA{1, 1, 0};
const std::vector<double> kB{0, 1, 1};
const std::vector<double> kZero{0, 0, 0};

}  // namespace

TEST(SimilarityTest, Cosine) {
    CosineSimilarity cos;
    EXPECT_DOUBLE_EQ(cos.score(kA, kB), 0.5);
    EXPECT_DOUBLE_EQ(cos.score(kA, kA), 1.0);
    EXPECT_NEAR(cos.score({1, 2, 3}, {2, 4, 6}), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(cos.score({1, 0}, {0, 1}), 0.0);
}

TEST(SimilarityTest, JaccardUsesPresenceOnly) {
    JaccardSimilarity jac;
    EXPECT_DOUBLE_EQ(jac.score(kA, kB), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(jac.score({5, 1, 0}, {1, 9, 0}), 1.0);
    // negative values are not "present"
    EXPECT_DOUBLE_EQ(jac.score({-1, 1}, {1, 1}), 0.5);
}

TEST(SimilarityTest, DiceUsesPresenceOnly) {
    DiceSimilarity dice;
    EXPECT_DOUBLE_EQ(dice.score(kA, kB), 0.5);
    EXPECT_DOUBLE_EQ(dice.score({3, 0, 0}, {7, 0, 2}), 2.0 / 3.0);
}

TEST(SimilarityTest, ZeroVectorsScoreZero) {
    CosineSimilarity cos;
    JaccardSimilarity jac;
    DiceSimilarity dice;

    EXPECT_DOUBLE_EQ(cos.score(kA, kZero), 0.0);
    EXPECT_DOUBLE_EQ(cos.score(kZero, kZero), 0.0);
    EXPECT_DOUBLE_EQ(jac.score(kZero, kZero), 0.0);
    EXPECT_DOUBLE_EQ(dice.score(kZero, kZero), 0.0);
    EXPECT_DOUBLE_EQ(jac.score(kA, kZero), 0.0);
    EXPECT_DOUBLE_EQ(dice.score(kA, kZero), 0.0);

    const std::vector<double> empty;
    EXPECT_DOUBLE_EQ(cos.score(empty, empty), 0.0);
    EXPECT_DOUBLE_EQ(jac.score(empty, empty), 0.0);
    EXPECT_DOUBLE_EQ(dice.score(empty, empty), 0.0);
}

TEST(SimilarityTest, LengthMismatchThrows) {
    EXPECT_THROW(CosineSimilarity().score({1, 2}, {1}), std::invalid_argument);
    EXPECT_THROW(JaccardSimilarity().score({1}, {}), std::invalid_argument);
    EXPECT_THROW(DiceSimilarity().score({}, {0}), std::invalid_argument);
}

TEST(SimilarityTest, FactoryByName) {
    EXPECT_EQ(make_similarity("cosine")->name(), "Cosine");
    EXPECT_EQ(make_similarity("Jaccard")->name(), "Jaccard");
    EXPECT_EQ(make_similarity("DICE")->name(), "Dice");
    EXPECT_THROW(make_similarity("euclidean"), std::invalid_argument);

    const auto all = all_similarity_metrics();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->name(), "Cosine");
    EXPECT_EQ(all[1]->name(), "Jaccard");
    EXPECT_EQ(all[2]->name(), "Dice");
}
