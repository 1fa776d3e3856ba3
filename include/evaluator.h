#ifndef EVALUATOR_H
#define EVALUATOR_H

#include <vector>
#include "rating_record.h"

class KNNRecommender;

struct AccuracyMetrics {
    double rmse = 0.0;
    double mae = 0.0;
    int n_predictions = 0;
    int cold_users = 0; // test records whose user the model does not know
    int cold_items = 0;
};

struct TopNMetrics {
    double hit_rate = 0.0;
    double precision_at_n = 0.0;
    double recall_at_n = 0.0;
    int users_evaluated = 0;
};

// Moves round(test_fraction * size) randomly chosen records into test, the rest into train.
void split_holdout(const std::vector<RatingRecord>& ratings,
                   double test_fraction,
                   unsigned int seed,
                   std::vector<RatingRecord>& train,
                   std::vector<RatingRecord>& test);

AccuracyMetrics evaluate_rating_accuracy(const KNNRecommender& model,
                                         const std::vector<RatingRecord>& test);

// Relevant items are a user's test items rated >= like_threshold. Only users known to
// the model with at least one relevant item are scored.
TopNMetrics evaluate_topn_holdout(const KNNRecommender& model,
                                  const std::vector<RatingRecord>& test,
                                  int n,
                                  double like_threshold = 4.0);

#endif
