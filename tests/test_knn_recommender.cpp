/**
 * @file test_knn_recommender.cpp
 * @brief Unit tests for rating prediction and the fit lifecycle
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "knn_recommender.h"
#include "recommender_config.h"
#include "recommender_errors.h"
#include "sample_data.h"
#include "test_fixtures.h"
#include "utils.h"

class KNNRecommenderTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_verbose(false); }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(KNNRecommenderTest, RejectsInvalidConfiguration) {
    EXPECT_THROW({ KNNRecommender r(5, "pearson", "user_based", 1); }, InvalidConfigurationError);
    EXPECT_THROW({ KNNRecommender r(5, "cosine", "hybrid", 1); }, InvalidConfigurationError);
    EXPECT_THROW({ KNNRecommender r(0, "cosine", "user_based", 1); }, InvalidConfigurationError);
    EXPECT_THROW({ KNNRecommender r(5, "cosine", "user_based", 0); }, InvalidConfigurationError);
}

TEST_F(KNNRecommenderTest, BuildsFromConfig) {
    RecommenderConfig cfg;
    cfg.approach = "item_based";
    cfg.metric = "manhattan";
    cfg.n_neighbors = 7;
    cfg.min_ratings = 2;
    KNNRecommender rec(cfg);
    EXPECT_EQ(rec.mode(), Mode::ItemBased);
    EXPECT_EQ(rec.metric(), Metric::Manhattan);
    EXPECT_EQ(rec.n_neighbors(), 7);
    EXPECT_EQ(rec.min_ratings(), 2);
}

// ============================================================================
// Not fitted
// ============================================================================

TEST_F(KNNRecommenderTest, QueriesBeforeFitThrowNotFitted) {
    KNNRecommender rec(3, "cosine", "user_based", 1);
    EXPECT_FALSE(rec.is_trained());
    EXPECT_THROW(rec.predict(1, 10), NotFittedError);
    EXPECT_THROW(rec.recommend(1, 5), NotFittedError);
    EXPECT_THROW(rec.recommend_popular(5), NotFittedError);
    EXPECT_THROW(rec.find_similar_users(1, 5), NotFittedError);
    EXPECT_FALSE(rec.has_user(1));
}

TEST_F(KNNRecommenderTest, ModelInfoBeforeFitReportsConfiguration) {
    KNNRecommender rec(4, "euclidean", "item_based", 3);
    ModelInfo info = rec.model_info();
    EXPECT_FALSE(info.trained);
    EXPECT_EQ(info.mode, Mode::ItemBased);
    EXPECT_EQ(info.metric, Metric::Euclidean);
    EXPECT_EQ(info.n_neighbors, 4);
    EXPECT_EQ(info.min_ratings, 3);
    EXPECT_EQ(info.n_users, 0);
}

// ============================================================================
// Fit
// ============================================================================

TEST_F(KNNRecommenderTest, FitReportsModelInfo) {
    KNNRecommender rec(1, "cosine", "user_based", 1);
    ModelInfo info = rec.fit(three_user_table());
    EXPECT_TRUE(rec.is_trained());
    EXPECT_TRUE(info.trained);
    EXPECT_EQ(info.n_users, 3);
    EXPECT_EQ(info.n_items, 2);
    EXPECT_EQ(info.n_ratings, 6u);
    EXPECT_DOUBLE_EQ(info.matrix_density, 1.0);
    EXPECT_NEAR(info.global_mean, 19.0 / 6.0, 1e-12);
    EXPECT_EQ(info.mode, Mode::UserBased);
    EXPECT_EQ(info.metric, Metric::Cosine);
}

TEST_F(KNNRecommenderTest, TooFewRatingsThrowInsufficientData) {
    std::vector<RatingRecord> ratings;
    for (int u = 1; u <= 4; ++u)
        for (int i = 1; i <= 3; ++i) ratings.emplace_back(u, 10 * i, 3.0);
    KNNRecommender rec(3, "cosine", "user_based", 10);
    EXPECT_THROW(rec.fit(ratings), InsufficientDataError);
    EXPECT_FALSE(rec.is_trained());
    EXPECT_THROW(rec.fit(std::vector<RatingRecord>()), InsufficientDataError);
}

TEST_F(KNNRecommenderTest, FailedRefitKeepsPreviousModel) {
    KNNRecommender rec(1, "cosine", "user_based", 2);
    rec.fit(three_user_table());
    double before = rec.predict(1, 20);
    ModelInfo info_before = rec.model_info();

    std::vector<RatingRecord> sparse = { {7, 70, 4.0} };
    EXPECT_THROW(rec.fit(sparse), InsufficientDataError);

    EXPECT_TRUE(rec.is_trained());
    EXPECT_DOUBLE_EQ(rec.predict(1, 20), before);
    EXPECT_EQ(rec.model_info().n_users, info_before.n_users);
}

TEST_F(KNNRecommenderTest, RefitIsDeterministic) {
    std::vector<RatingRecord> ratings = generate_sample_ratings(30, 40, 12, 7);
    KNNRecommender a(5, "cosine", "user_based", 3);
    KNNRecommender b(5, "cosine", "user_based", 3);
    ModelInfo ia = a.fit(ratings);
    ModelInfo ib = b.fit(ratings);
    ModelInfo ia2 = a.fit(ratings);

    EXPECT_EQ(ia.n_users, ib.n_users);
    EXPECT_EQ(ia.n_items, ib.n_items);
    EXPECT_DOUBLE_EQ(ia.matrix_density, ia2.matrix_density);
    EXPECT_DOUBLE_EQ(ia.global_mean, ib.global_mean);
    for (int u = 1; u <= 30; ++u)
        for (int i = 1; i <= 40; ++i)
            EXPECT_DOUBLE_EQ(a.predict(u, i), b.predict(u, i));
}

// ============================================================================
// Predict
// ============================================================================

TEST_F(KNNRecommenderTest, PredictionFollowsMostSimilarUser) {
    KNNRecommender rec(1, "cosine", "user_based", 1);
    rec.fit(three_user_table());
    // user 2 is user 1's neighbour: user 1 mean 3.0 + (2 - 3.5)
    EXPECT_NEAR(rec.predict(1, 20), 1.5, 1e-9);
}

TEST_F(KNNRecommenderTest, UnknownIdsReturnGlobalMean) {
    KNNRecommender rec(2, "cosine", "user_based", 1);
    ModelInfo info = rec.fit(three_user_table());
    EXPECT_DOUBLE_EQ(rec.predict(99, 10), info.global_mean);
    EXPECT_DOUBLE_EQ(rec.predict(1, 99), info.global_mean);
    EXPECT_DOUBLE_EQ(rec.predict(99, 99), info.global_mean);
}

TEST_F(KNNRecommenderTest, NoRatedNeighbourReturnsGlobalMean) {
    std::vector<RatingRecord> ratings = {
        {1, 10, 5.0}, {1, 20, 1.0},
        {2, 10, 5.0}, {2, 20, 2.0},
        {3, 30, 4.0}, {3, 10, 1.0},
    };
    KNNRecommender rec(1, "cosine", "user_based", 1);
    ModelInfo info = rec.fit(ratings);
    // the only neighbour of user 1 is user 2, who never rated item 30
    EXPECT_DOUBLE_EQ(rec.predict(1, 30), info.global_mean);
    EXPECT_DOUBLE_EQ(info.global_mean, 3.0);
}

TEST_F(KNNRecommenderTest, PredictionIsClippedToScale) {
    std::vector<RatingRecord> ratings = {
        {1, 10, 5.0}, {1, 20, 5.0}, {1, 40, 4.0}, {1, 50, 4.0},
        {2, 10, 5.0}, {2, 20, 5.0}, {2, 40, 1.0}, {2, 50, 1.0}, {2, 30, 5.0},
    };
    KNNRecommender rec(1, "cosine", "user_based", 1);
    rec.fit(ratings);
    // 4.5 + (5 - 3.4) = 6.1 before clipping
    EXPECT_DOUBLE_EQ(rec.predict(1, 30), 5.0);
}

TEST_F(KNNRecommenderTest, ItemBasedUsesUserRatingsOfSimilarItems) {
    std::vector<RatingRecord> ratings = {
        {1, 10, 5.0}, {1, 20, 5.0},
        {2, 10, 1.0}, {2, 20, 1.0},
        {3, 10, 4.0}, {3, 20, 3.0},
        {4, 10, 5.0}, {4, 30, 2.0},
    };
    KNNRecommender rec(1, "cosine", "item_based", 1);
    rec.fit(ratings);
    // item 10 is closest to item 20: item 20 mean 3.0 + (5 - 3.75)
    EXPECT_NEAR(rec.predict(4, 20), 4.25, 1e-9);
}

TEST_F(KNNRecommenderTest, AntiCorrelatedNeighbourKeepsSignedWeight) {
    KNNRecommender rec(1, "cosine", "item_based", 1);
    rec.fit(three_user_table());
    // item 10 is item 20's only neighbour with negative similarity w:
    // item 20 mean 8/3 + w * (5 - 11/3) / w
    EXPECT_NEAR(rec.predict(1, 20), 4.0, 1e-9);
}

TEST_F(KNNRecommenderTest, ZeroTotalWeightReturnsGlobalMean) {
    // user 1 rates everything alike: a zero centered row, cosine weight 0 to everyone
    std::vector<RatingRecord> ratings = {
        {1, 10, 3.0}, {1, 20, 3.0},
        {2, 10, 5.0}, {2, 20, 1.0}, {2, 30, 5.0},
        {3, 10, 1.0}, {3, 20, 4.0}, {3, 30, 2.0},
    };
    KNNRecommender rec(2, "cosine", "user_based", 1);
    ModelInfo info = rec.fit(ratings);
    EXPECT_DOUBLE_EQ(rec.predict(1, 30), info.global_mean);
}

TEST_F(KNNRecommenderTest, PredictionsStayWithinScale) {
    std::vector<RatingRecord> ratings = generate_sample_ratings(40, 30, 10, 3);
    const char* metrics[] = {"cosine", "euclidean", "manhattan"};
    const char* modes[] = {"user_based", "item_based"};
    for (const char* metric : metrics) {
        for (const char* mode : modes) {
            KNNRecommender rec(4, metric, mode, 2);
            rec.fit(ratings);
            for (int u = 0; u <= 45; ++u) {
                for (int i = 0; i <= 35; ++i) {
                    double p = rec.predict(u, i);
                    EXPECT_GE(p, 1.0);
                    EXPECT_LE(p, 5.0);
                }
            }
        }
    }
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(KNNRecommenderTest, ReadersDuringRetrainSeeCompleteModels) {
    std::vector<RatingRecord> small = generate_sample_ratings(20, 15, 8, 1);
    std::vector<RatingRecord> large = generate_sample_ratings(60, 40, 12, 2);
    KNNRecommender rec(5, "cosine", "user_based", 2);
    rec.fit(small);

    std::atomic<bool> stop(false);
    std::atomic<int> bad(0);
    std::vector<std::thread> readers;
    for (int t = 0; t < 3; ++t) {
        readers.emplace_back([&rec, &stop, &bad, t]() {
            while (!stop.load()) {
                try {
                    double p = rec.predict(1 + t, 3);
                    if (p < 1.0 || p > 5.0) ++bad;
                    std::vector<std::pair<int,double>> recs = rec.recommend(2 + t, 5);
                    if (recs.size() > 5) ++bad;
                } catch (const RecommenderError&) {
                    ++bad;
                }
            }
        });
    }
    for (int i = 0; i < 10; ++i) rec.fit(i % 2 ? small : large);
    stop.store(true);
    for (auto &th : readers) th.join();

    EXPECT_EQ(bad.load(), 0);
    EXPECT_TRUE(rec.is_trained());
}
