#include "data_explorer.h"
#include "evaluator.h"
#include "knn_recommender.h"
#include "rating_loader.h"
#include "recommender_config.h"
#include "recommender_errors.h"
#include "sample_data.h"

#include <iostream>
#include <string>
#include <vector>

using namespace std;

static void print_model_info(const ModelInfo& info)
{
    cout << "  approach=" << mode_name(info.mode) << " k=" << info.n_neighbors
         << " metric=" << metric_name(info.metric) << " min_ratings=" << info.min_ratings << "\n";
    cout << "  users=" << info.n_users << " items=" << info.n_items << " ratings=" << info.n_ratings
         << " density=" << info.matrix_density << " global_mean=" << info.global_mean << "\n";
}

static void run_approach(const RecommenderConfig& cfg, const string& approach,
                         const vector<RatingRecord>& train, const vector<RatingRecord>& test)
{
    cout << "\n=== " << approach << " ===\n";
    KNNRecommender rec(cfg.n_neighbors, cfg.metric, approach, cfg.min_ratings);
    ModelInfo info;
    try {
        info = rec.fit(train);
    } catch (const InsufficientDataError& e) {
        cout << "[main] " << approach << " model not trained: " << e.what() << "\n";
        return;
    }
    print_model_info(info);

    int test_uid = train.empty() ? 1 : train.front().user_id;
    cout << "Top recommendations for user " << test_uid << ":\n";
    for (auto &pr : rec.recommend(test_uid, cfg.n_recommendations))
        cout << "  item " << pr.first << " predicted=" << pr.second << "\n";

    if (rec.mode() == Mode::UserBased) {
        cout << "Users similar to " << test_uid << ":\n";
        for (auto &pr : rec.find_similar_users(test_uid, 5))
            cout << "  user " << pr.first << " similarity=" << pr.second << "\n";
    } else {
        int test_item = train.empty() ? 1 : train.front().item_id;
        cout << "Items similar to " << test_item << ":\n";
        for (auto &pr : rec.find_similar_items(test_item, 5))
            cout << "  item " << pr.first << " similarity=" << pr.second << "\n";
    }

    cout << "Popular items:\n";
    for (auto &pr : rec.recommend_popular(5))
        cout << "  item " << pr.first << " popularity=" << pr.second << "\n";

    AccuracyMetrics acc = evaluate_rating_accuracy(rec, test);
    cout << "[main] holdout accuracy: rmse=" << acc.rmse << " mae=" << acc.mae
         << " predictions=" << acc.n_predictions << " cold_users=" << acc.cold_users
         << " cold_items=" << acc.cold_items << "\n";
    TopNMetrics top = evaluate_topn_holdout(rec, test, cfg.n_recommendations);
    cout << "[main] holdout top-" << cfg.n_recommendations << ": hit_rate=" << top.hit_rate
         << " precision=" << top.precision_at_n << " recall=" << top.recall_at_n
         << " users=" << top.users_evaluated << "\n";
}

int main(int argc, char** argv) {
    const string config_path = argc > 1 ? argv[1] : "config/recommender.conf";
    RecommenderConfig cfg;
    try {
        if (load_recommender_config(config_path, cfg)) cout << "[main] config loaded from " << config_path << "\n";
        else cout << "[main] config " << config_path << " not found, using defaults\n";
        validate_recommender_config(cfg);
    } catch (const RecommenderError& e) {
        cerr << "[main] invalid configuration: " << e.what() << "\n";
        return 1;
    }

    vector<RatingRecord> ratings;
    try {
        if (!load_or_generate_ratings(cfg, ratings)) {
            cerr << "[main] no ratings available\n";
            return 1;
        }

        DataExplorer de;
        cout << "[main] running DataExplorer\n";
        de.analyze_ratings(ratings, cfg.explore_dir);

        vector<RatingRecord> train, test;
        split_holdout(ratings, cfg.test_fraction, cfg.seed, train, test);
        cout << "[main] holdout split: train=" << train.size() << " test=" << test.size() << "\n";

        run_approach(cfg, "user_based", train, test);
        run_approach(cfg, "item_based", train, test);
    } catch (const RecommenderError& e) {
        cerr << "[main] " << e.category() << ": " << e.what() << "\n";
        return 1;
    }
    return 0;
}
