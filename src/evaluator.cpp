#include "evaluator.h"
#include "knn_recommender.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <set>

using namespace std;

void split_holdout(const vector<RatingRecord>& ratings,
                   double test_fraction,
                   unsigned int seed,
                   vector<RatingRecord>& train,
                   vector<RatingRecord>& test)
{
    train.clear();
    test.clear();
    if (ratings.empty()) return;
    vector<size_t> idx(ratings.size());
    for (size_t i = 0; i < idx.size(); ++i) idx[i] = i;
    mt19937 rng(seed);
    shuffle(idx.begin(), idx.end(), rng);

    double frac = min(1.0, max(0.0, test_fraction));
    size_t n_test = (size_t)llround(frac * (double)ratings.size());
    // original order is kept inside each part so "last record wins" still holds
    vector<char> in_test(ratings.size(), 0);
    for (size_t i = 0; i < n_test; ++i) in_test[idx[i]] = 1;
    train.reserve(ratings.size() - n_test);
    test.reserve(n_test);
    for (size_t i = 0; i < ratings.size(); ++i) {
        if (in_test[i]) test.push_back(ratings[i]);
        else train.push_back(ratings[i]);
    }
}

AccuracyMetrics evaluate_rating_accuracy(const KNNRecommender& model, const vector<RatingRecord>& test)
{
    AccuracyMetrics res;
    double se = 0.0;
    double ae = 0.0;
    for (const RatingRecord &r : test) {
        if (!model.has_user(r.user_id)) ++res.cold_users;
        if (!model.has_item(r.item_id)) ++res.cold_items;
        double p = model.predict(r.user_id, r.item_id);
        double d = p - r.rating;
        se += d * d;
        ae += fabs(d);
        ++res.n_predictions;
    }
    if (res.n_predictions > 0) {
        res.rmse = sqrt(se / (double)res.n_predictions);
        res.mae = ae / (double)res.n_predictions;
    }
    return res;
}

TopNMetrics evaluate_topn_holdout(const KNNRecommender& model, const vector<RatingRecord>& test, int n, double like_threshold)
{
    TopNMetrics res;
    if (n <= 0) return res;
    map<int, set<int>> relevant;
    for (const RatingRecord &r : test) {
        if (r.rating < like_threshold) continue;
        if (!model.has_user(r.user_id)) continue;
        relevant[r.user_id].insert(r.item_id);
    }

    int hits = 0;
    double prec_sum = 0.0;
    double rec_sum = 0.0;
    for (auto &kv : relevant) {
        const set<int> &held = kv.second;
        vector<pair<int,double>> recs = model.recommend(kv.first, n, true);
        int found = 0;
        for (auto &p : recs) if (held.find(p.first) != held.end()) ++found;
        if (found > 0) ++hits;
        prec_sum += (double)found / (double)n;
        rec_sum += (double)found / (double)held.size();
        ++res.users_evaluated;
    }
    if (res.users_evaluated == 0) return res;
    res.hit_rate = (double)hits / (double)res.users_evaluated;
    res.precision_at_n = prec_sum / (double)res.users_evaluated;
    res.recall_at_n = rec_sum / (double)res.users_evaluated;
    return res;
}
