#include "sample_data.h"
#include "rating_loader.h"
#include "recommender_config.h"
#include "utils.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <random>

using namespace std;

// base score per product category
static const array<double,10> CATEGORY_BASE = { 4.2, 3.8, 4.5, 4.0, 3.9, 3.7, 4.1, 4.3, 3.6, 4.0 };

vector<RatingRecord> generate_sample_ratings(int num_users, int num_items, int avg_ratings_per_user, unsigned int seed)
{
    vector<RatingRecord> out;
    if (num_users <= 0 || num_items <= 0) return out;
    mt19937 rng(seed);

    vector<int> item_category(num_items);
    uniform_int_distribution<int> cat_dist(0, (int)CATEGORY_BASE.size() - 1);
    for (int i = 0; i < num_items; ++i) item_category[i] = cat_dist(rng);

    poisson_distribution<int> count_dist(avg_ratings_per_user > 0 ? avg_ratings_per_user : 1);
    normal_distribution<double> noise(0.0, 0.5);
    normal_distribution<double> taste(0.0, 0.4);

    vector<int> items(num_items);
    for (int i = 0; i < num_items; ++i) items[i] = i;

    for (int u = 0; u < num_users; ++u) {
        int cnt = max(5, count_dist(rng));
        cnt = min(cnt, num_items);
        // every user likes one category a bit more than the others
        int favourite = cat_dist(rng);
        double offset = taste(rng);
        shuffle(items.begin(), items.end(), rng);
        for (int j = 0; j < cnt; ++j) {
            int item = items[j];
            double r = CATEGORY_BASE[item_category[item]] + offset + noise(rng);
            if (item_category[item] == favourite) r += 0.5;
            r = max(1.0, min(5.0, r));
            r = round(r * 2.0) / 2.0;
            out.emplace_back(u + 1, item + 1, r);
        }
    }
    if (log_verbose()) cout << "[sample] generated " << out.size() << " ratings for " << num_users << " users and " << num_items << " items\n";
    return out;
}

bool load_or_generate_ratings(const RecommenderConfig& cfg, vector<RatingRecord>& ratings)
{
    if (load_ratings_csv(cfg.ratings_csv, ratings)) return !ratings.empty();
    cerr << "[data] " << cfg.ratings_csv << " not found, generating sample data\n";
    ratings = generate_sample_ratings(cfg.sample_users, cfg.sample_items, cfg.sample_avg_ratings, cfg.seed);
    error_code ec;
    filesystem::path parent = filesystem::path(cfg.ratings_csv).parent_path();
    if (!parent.empty()) filesystem::create_directories(parent, ec);
    if (!ec && save_ratings_csv(cfg.ratings_csv, ratings))
        cerr << "[data] sample ratings saved to " << cfg.ratings_csv << "\n";
    else
        cerr << "[data] cannot save sample ratings to " << cfg.ratings_csv << "\n";
    return !ratings.empty();
}
