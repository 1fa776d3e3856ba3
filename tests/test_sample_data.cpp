/**
 * @file test_sample_data.cpp
 * @brief Unit tests for the synthetic rating generator
 */

#include <gtest/gtest.h>
#include <cmath>
#include <map>
#include <set>
#include <utility>

#include "sample_data.h"
#include "utils.h"

class SampleDataTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_verbose(false); }
};

TEST_F(SampleDataTest, SameSeedSameRatings) {
    std::vector<RatingRecord> a = generate_sample_ratings(25, 40, 10, 3);
    std::vector<RatingRecord> b = generate_sample_ratings(25, 40, 10, 3);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].user_id, b[i].user_id);
        EXPECT_EQ(a[i].item_id, b[i].item_id);
        EXPECT_DOUBLE_EQ(a[i].rating, b[i].rating);
    }
}

TEST_F(SampleDataTest, RatingsOnHalfStepScale) {
    for (const RatingRecord &r : generate_sample_ratings(25, 40, 10, 4)) {
        EXPECT_GE(r.rating, MIN_RATING);
        EXPECT_LE(r.rating, MAX_RATING);
        EXPECT_DOUBLE_EQ(r.rating * 2.0, std::round(r.rating * 2.0));
        EXPECT_GE(r.item_id, 1);
        EXPECT_LE(r.item_id, 40);
    }
}

TEST_F(SampleDataTest, EveryUserRatesDistinctItems) {
    std::vector<RatingRecord> ratings = generate_sample_ratings(25, 40, 3, 5);
    std::map<int,int> per_user;
    std::set<std::pair<int,int>> pairs;
    for (const RatingRecord &r : ratings) {
        per_user[r.user_id] += 1;
        EXPECT_TRUE(pairs.insert(std::make_pair(r.user_id, r.item_id)).second);
    }
    EXPECT_EQ(per_user.size(), 25u);
    for (auto &kv : per_user) EXPECT_GE(kv.second, 5);
}

TEST_F(SampleDataTest, SmallCatalogCapsRatingsPerUser) {
    std::vector<RatingRecord> ratings = generate_sample_ratings(4, 3, 10, 6);
    EXPECT_EQ(ratings.size(), 12u);
}

TEST_F(SampleDataTest, NonPositiveSizesGiveNothing) {
    EXPECT_TRUE(generate_sample_ratings(0, 10, 5, 1).empty());
    EXPECT_TRUE(generate_sample_ratings(10, 0, 5, 1).empty());
}
