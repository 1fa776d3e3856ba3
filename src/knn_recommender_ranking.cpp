#include "knn_recommender.h"
#include "recommender_errors.h"
#include <algorithm>
#include <cmath>

using namespace std;

void sort_by_score_desc(vector<pair<int,double>>& v) {
    sort(v.begin(), v.end(), [](const pair<int,double>& A, const pair<int,double>& B){ if (A.second == B.second) return A.first < B.first; return A.second > B.second; });
}

vector<pair<int,double>> KNNRecommender::recommend(int user_id, int n, bool exclude_rated) const
{
    shared_ptr<const FittedModel> fm = require_fitted("recommend");
    vector<pair<int,double>> out;
    if (n <= 0) return out;
    const InteractionMatrix &m = fm->matrix;
    int urow = m.find_row(user_id);
    if (urow < 0) return popular_fitted(*fm, n);

    // in user_based mode the neighbourhood does not depend on the item
    vector<Neighbor> user_nbrs;
    if (mode_kind == Mode::UserBased) user_nbrs = fm->index.kneighbors(urow);

    out.reserve(m.n_cols);
    for (int c = 0; c < m.n_cols; ++c) {
        // a non-zero cell is a rating the user already gave
        if (exclude_rated && m.at(urow, c) > 0.0) continue;
        double p;
        if (mode_kind == Mode::UserBased) p = predict_from_neighbors(*fm, user_nbrs, urow, c);
        else p = predict_fitted(*fm, urow, c);
        out.emplace_back(m.col_ids[c], p);
    }
    sort_by_score_desc(out);
    if ((int)out.size() > n) out.resize(n);
    return out;
}

vector<pair<int,double>> KNNRecommender::recommend_popular(int n) const
{
    shared_ptr<const FittedModel> fm = require_fitted("recommend_popular");
    return popular_fitted(*fm, n);
}

vector<pair<int,double>> KNNRecommender::popular_fitted(const FittedModel& fm, int n) const
{
    vector<pair<int,double>> out;
    if (n <= 0) return out;
    const InteractionMatrix &m = fm.matrix;
    out.reserve(m.n_cols);
    for (int c = 0; c < m.n_cols; ++c) {
        if (m.col_counts[c] <= 0) continue;
        // log-dampened volume so a lone 5-star item does not beat a broadly rated one
        double popularity = m.col_means[c] * log(1.0 + (double)m.col_counts[c]);
        out.emplace_back(m.col_ids[c], popularity);
    }
    sort_by_score_desc(out);
    if ((int)out.size() > n) out.resize(n);
    return out;
}

vector<pair<int,double>> KNNRecommender::find_similar_users(int user_id, int n) const
{
    shared_ptr<const FittedModel> fm = require_fitted("find_similar_users");
    if (mode_kind != Mode::UserBased)
        throw ModeMismatchError("find_similar_users needs a user_based model, this one is item_based");
    return similar_fitted(*fm, fm->matrix.find_row(user_id), fm->matrix.row_ids, n);
}

vector<pair<int,double>> KNNRecommender::find_similar_items(int item_id, int n) const
{
    shared_ptr<const FittedModel> fm = require_fitted("find_similar_items");
    if (mode_kind != Mode::ItemBased)
        throw ModeMismatchError("find_similar_items needs an item_based model, this one is user_based");
    return similar_fitted(*fm, fm->matrix.find_col(item_id), fm->matrix.col_ids, n);
}

vector<pair<int,double>> KNNRecommender::similar_fitted(const FittedModel& fm, int row, const vector<int>& ids, int n) const
{
    vector<pair<int,double>> out;
    if (row < 0 || n <= 0) return out;
    vector<Neighbor> nbrs = fm.index.kneighbors(row);
    // both similarity conversions are monotone in distance, so the order carries over
    for (size_t i = 1; i < nbrs.size() && (int)out.size() < n; ++i) {
        out.emplace_back(ids[nbrs[i].index], distance_to_similarity(fm.index.metric(), nbrs[i].distance));
    }
    return out;
}
