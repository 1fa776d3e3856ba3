/**
 * @file test_data_explorer.cpp
 * @brief Unit tests for rating table statistics
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <string>

#include "data_explorer.h"
#include "utils.h"
#include "test_fixtures.h"

namespace fs = std::filesystem;

TEST(DataExplorerTest, StatsOfSmallTable) {
    RatingStats st = compute_rating_stats(popularity_table());
    EXPECT_EQ(st.n_ratings, 5u);
    EXPECT_EQ(st.n_users, 4u);
    EXPECT_EQ(st.n_items, 2u);
    EXPECT_NEAR(st.rating_mean, 4.2, 1e-9);
    ASSERT_EQ(st.rating_hist.size(), 2u);
    EXPECT_EQ(st.rating_hist.at(1.0), 1);
    EXPECT_EQ(st.rating_hist.at(5.0), 4);
    EXPECT_EQ(st.ratings_per_user, (std::vector<int>{1, 1, 1, 2}));
    EXPECT_DOUBLE_EQ(st.per_user_mean, 1.25);
    EXPECT_EQ(st.per_user_median, 1);
    EXPECT_EQ(st.ratings_per_item, (std::vector<int>{1, 4}));
    EXPECT_DOUBLE_EQ(st.per_item_mean, 2.5);
    EXPECT_EQ(st.per_item_median, 2);
    EXPECT_DOUBLE_EQ(st.density, 0.625);
}

TEST(DataExplorerTest, EmptyTable) {
    RatingStats st = compute_rating_stats({});
    EXPECT_EQ(st.n_ratings, 0u);
    EXPECT_EQ(st.n_users, 0u);
    EXPECT_TRUE(st.rating_hist.empty());
}

TEST(DataExplorerTest, AnalyzeWritesReports) {
    set_log_verbose(false);
    fs::path dir = fs::temp_directory_path() / ("knnrec_explore_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
    DataExplorer explorer;
    RatingStats st = explorer.analyze_ratings(three_user_table(), dir.string());
    EXPECT_EQ(st.n_ratings, 6u);
    EXPECT_TRUE(fs::exists(dir / "explore_stats.txt"));
    EXPECT_TRUE(fs::exists(dir / "rating_hist.csv"));
    EXPECT_TRUE(fs::exists(dir / "ratings_per_user.csv"));
    EXPECT_TRUE(fs::exists(dir / "ratings_per_item.csv"));
    std::error_code ec;
    fs::remove_all(dir, ec);
}
