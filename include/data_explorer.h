#ifndef DATA_EXPLORER_H
#define DATA_EXPLORER_H

#include <map>
#include <string>
#include <vector>
#include "rating_record.h"

struct RatingStats {
    size_t n_ratings = 0;
    size_t n_users = 0;
    size_t n_items = 0;
    double rating_mean = 0.0;
    double rating_std = 0.0;
    double per_user_mean = 0.0;
    int per_user_median = 0;
    double per_item_mean = 0.0;
    int per_item_median = 0;
    double density = 0.0; // distinct (user, item) pairs / (users * items)
    std::map<double,int> rating_hist; // rating rounded to 0.5 -> count
    std::vector<int> ratings_per_user;
    std::vector<int> ratings_per_item;
};

RatingStats compute_rating_stats(const std::vector<RatingRecord>& ratings);

struct DataExplorer {
    // writes explore_stats.txt and the histogram CSVs (and PNGs with matplot) to out_prefix
    RatingStats analyze_ratings(const std::vector<RatingRecord>& ratings, const std::string& out_prefix);
};

#endif
