#include "knn_recommender.h"
#include "recommender_config.h"
#include "recommender_errors.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace std;

// total neighbour weight below this is treated as zero
static const double SIMILARITY_SUM_EPS = 1e-12;

bool parse_mode(const string& name, Mode& out) {
    string s = to_lower_copy(trim_copy(name));
    if (s == "user_based") { out = Mode::UserBased; return true; }
    if (s == "item_based") { out = Mode::ItemBased; return true; }
    return false;
}

const char* mode_name(Mode m) {
    return m == Mode::UserBased ? "user_based" : "item_based";
}

KNNRecommender::KNNRecommender(int n_neighbors, const string& metric, const string& approach, int min_ratings)
    : k(n_neighbors), min_count(min_ratings)
{
    if (!parse_mode(approach, mode_kind))
        throw InvalidConfigurationError("approach must be 'user_based' or 'item_based', got '" + approach + "'");
    if (!parse_metric(metric, metric_kind))
        throw InvalidConfigurationError("metric must be 'cosine', 'euclidean' or 'manhattan', got '" + metric + "'");
    if (n_neighbors < 1) throw InvalidConfigurationError("n_neighbors must be >= 1, got " + to_string(n_neighbors));
    if (min_ratings < 1) throw InvalidConfigurationError("min_ratings must be >= 1, got " + to_string(min_ratings));
}

KNNRecommender::KNNRecommender(const RecommenderConfig& cfg)
    : KNNRecommender(cfg.n_neighbors, cfg.metric, cfg.approach, cfg.min_ratings)
{
}

shared_ptr<const KNNRecommender::FittedModel> KNNRecommender::snapshot() const {
    lock_guard<mutex> lk(state_mutex);
    return fitted;
}

shared_ptr<const KNNRecommender::FittedModel> KNNRecommender::require_fitted(const char* op) const {
    shared_ptr<const FittedModel> fm = snapshot();
    if (!fm) throw NotFittedError(string(op) + ": model is not fitted, call fit() first");
    return fm;
}

ModelInfo KNNRecommender::fit(const vector<RatingRecord>& ratings) {
    lock_guard<mutex> writer(fit_mutex);
    if (log_verbose()) cout << "[knn] preparing " << ratings.size() << " ratings for training\n";

    shared_ptr<FittedModel> fm = make_shared<FittedModel>(metric_kind, k);
    if (!build_interaction_matrix(ratings, min_count, fm->matrix)) {
        throw InsufficientDataError("no users or items with at least " + to_string(min_count) +
                                    " ratings among " + to_string(ratings.size()) + " records");
    }
    const InteractionMatrix &m = fm->matrix;

    if (log_verbose()) cout << "[knn] training " << mode_name(mode_kind) << " model with " << k << " neighbors\n";
    if (mode_kind == Mode::UserBased) fm->index.fit(centered_user_rows(m), m.n_rows, m.n_cols);
    else fm->index.fit(centered_item_rows(m), m.n_cols, m.n_rows);

    {
        lock_guard<mutex> lk(state_mutex);
        fitted = fm;
    }
    trained.store(true);
    if (log_verbose()) cout << "[knn] model trained\n";
    return model_info();
}

ModelInfo KNNRecommender::model_info() const {
    ModelInfo info;
    info.mode = mode_kind;
    info.n_neighbors = k;
    info.metric = metric_kind;
    info.min_ratings = min_count;
    shared_ptr<const FittedModel> fm = snapshot();
    if (!fm) return info;
    info.trained = true;
    info.n_users = fm->matrix.n_rows;
    info.n_items = fm->matrix.n_cols;
    info.n_ratings = fm->matrix.n_ratings;
    info.matrix_density = fm->matrix.density();
    info.global_mean = fm->matrix.global_mean;
    return info;
}

bool KNNRecommender::has_user(int user_id) const {
    shared_ptr<const FittedModel> fm = snapshot();
    return fm && fm->matrix.find_row(user_id) >= 0;
}

bool KNNRecommender::has_item(int item_id) const {
    shared_ptr<const FittedModel> fm = snapshot();
    return fm && fm->matrix.find_col(item_id) >= 0;
}

double KNNRecommender::predict(int user_id, int item_id) const {
    shared_ptr<const FittedModel> fm = require_fitted("predict");
    int urow = fm->matrix.find_row(user_id);
    int icol = fm->matrix.find_col(item_id);
    if (urow < 0 || icol < 0) return fm->matrix.global_mean;
    return predict_fitted(*fm, urow, icol);
}

double KNNRecommender::predict_fitted(const FittedModel& fm, int urow, int icol) const {
    int query_row = mode_kind == Mode::UserBased ? urow : icol;
    return predict_from_neighbors(fm, fm.index.kneighbors(query_row), urow, icol);
}

// nbrs is a kneighbors() result: index rows are users in user_based mode, items otherwise.
double KNNRecommender::predict_from_neighbors(const FittedModel& fm, const vector<Neighbor>& nbrs, int urow, int icol) const {
    const InteractionMatrix &m = fm.matrix;
    double sum_w = 0.0;
    double sum_wd = 0.0;
    int used = 0;
    // first entry is the query row itself
    for (size_t i = 1; i < nbrs.size(); ++i) {
        const Neighbor &nb = nbrs[i];
        double original;
        double neighbor_mean;
        if (mode_kind == Mode::UserBased) {
            original = m.at(nb.index, icol);
            neighbor_mean = m.row_means[nb.index];
        } else {
            original = m.at(urow, nb.index);
            neighbor_mean = m.col_means[nb.index];
        }
        if (original <= 0.0) continue; // neighbour has no rating here
        double w = distance_to_similarity(fm.index.metric(), nb.distance);
        sum_w += w;
        sum_wd += w * (original - neighbor_mean);
        ++used;
    }
    if (used == 0) return m.global_mean;
    // signed cosine weights can cancel out
    if (fabs(sum_w) < SIMILARITY_SUM_EPS) return m.global_mean;

    double base = mode_kind == Mode::UserBased ? m.row_means[urow] : m.col_means[icol];
    double predicted = base + sum_wd / sum_w;
    return min(MAX_RATING, max(MIN_RATING, predicted));
}
