#include "interaction_matrix.h"
#include "recommender_errors.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

using namespace std;

double InteractionMatrix::density() const {
    if (empty()) return 0.0;
    return (double)n_ratings / ((double)n_rows * (double)n_cols);
}

int InteractionMatrix::find_row(int user_id) const {
    auto it = row_index.find(user_id);
    return it == row_index.end() ? -1 : it->second;
}

int InteractionMatrix::find_col(int item_id) const {
    auto it = col_index.find(item_id);
    return it == col_index.end() ? -1 : it->second;
}

static void validate_record(const RatingRecord& r, size_t pos) {
    if (!isfinite(r.rating) || r.rating < MIN_RATING || r.rating > MAX_RATING) {
        throw InvalidInputError("rating #" + to_string(pos) + " (user " + to_string(r.user_id) +
                                ", item " + to_string(r.item_id) + ") = " + to_string(r.rating) +
                                " is outside [1, 5]");
    }
}

bool build_interaction_matrix(const vector<RatingRecord>& ratings,
                              int min_ratings,
                              InteractionMatrix& out)
{
    out = InteractionMatrix();
    if (min_ratings < 1) throw InvalidConfigurationError("min_ratings must be >= 1, got " + to_string(min_ratings));

    unordered_map<int,int> user_counts;
    unordered_map<int,int> item_counts;
    for (size_t i = 0; i < ratings.size(); ++i) {
        validate_record(ratings[i], i);
        user_counts[ratings[i].user_id] += 1;
        item_counts[ratings[i].item_id] += 1;
    }

    // both filters run against the unfiltered counts, not iterated to a fixed point
    vector<size_t> kept;
    kept.reserve(ratings.size());
    for (size_t i = 0; i < ratings.size(); ++i) {
        const RatingRecord &r = ratings[i];
        if (user_counts[r.user_id] < min_ratings) continue;
        if (item_counts[r.item_id] < min_ratings) continue;
        kept.push_back(i);
    }

    if (log_verbose()) {
        int valid_users = 0, valid_items = 0;
        for (auto &kv : user_counts) if (kv.second >= min_ratings) ++valid_users;
        for (auto &kv : item_counts) if (kv.second >= min_ratings) ++valid_items;
        cout << "[matrix] filtered: " << kept.size() << " ratings from " << valid_users
             << " users for " << valid_items << " items (min_ratings=" << min_ratings << ")\n";
    }
    if (kept.empty()) return false;

    for (size_t i : kept) {
        out.row_ids.push_back(ratings[i].user_id);
        out.col_ids.push_back(ratings[i].item_id);
    }
    sort(out.row_ids.begin(), out.row_ids.end());
    out.row_ids.erase(unique(out.row_ids.begin(), out.row_ids.end()), out.row_ids.end());
    sort(out.col_ids.begin(), out.col_ids.end());
    out.col_ids.erase(unique(out.col_ids.begin(), out.col_ids.end()), out.col_ids.end());

    out.n_rows = (int)out.row_ids.size();
    out.n_cols = (int)out.col_ids.size();
    out.row_index.reserve(out.row_ids.size());
    for (int r = 0; r < out.n_rows; ++r) out.row_index[out.row_ids[r]] = r;
    out.col_index.reserve(out.col_ids.size());
    for (int c = 0; c < out.n_cols; ++c) out.col_index[out.col_ids[c]] = c;

    out.cells.assign((size_t)out.n_rows * (size_t)out.n_cols, 0.0);
    for (size_t i : kept) {
        const RatingRecord &r = ratings[i];
        int row = out.row_index[r.user_id];
        int col = out.col_index[r.item_id];
        out.cells[(size_t)row * (size_t)out.n_cols + (size_t)col] = r.rating;
    }

    out.row_means.assign(out.n_rows, 0.0);
    out.col_means.assign(out.n_cols, 0.0);
    out.row_counts.assign(out.n_rows, 0);
    out.col_counts.assign(out.n_cols, 0);
    double sum = 0.0;
    for (int r = 0; r < out.n_rows; ++r) {
        for (int c = 0; c < out.n_cols; ++c) {
            double v = out.at(r, c);
            if (v <= 0.0) continue;
            out.row_means[r] += v;
            out.col_means[c] += v;
            out.row_counts[r] += 1;
            out.col_counts[c] += 1;
            sum += v;
            ++out.n_ratings;
        }
    }
    out.global_mean = sum / (double)out.n_ratings;
    // every retained row and column holds at least one kept record
    for (int r = 0; r < out.n_rows; ++r) out.row_means[r] /= (double)out.row_counts[r];
    for (int c = 0; c < out.n_cols; ++c) out.col_means[c] /= (double)out.col_counts[c];

    if (log_verbose()) {
        cout << "[matrix] built " << out.n_rows << " x " << out.n_cols
             << " matrix, density=" << out.density() << ", global_mean=" << out.global_mean << "\n";
    }
    return true;
}

vector<double> centered_user_rows(const InteractionMatrix& m) {
    vector<double> out((size_t)m.n_rows * (size_t)m.n_cols, 0.0);
    for (int r = 0; r < m.n_rows; ++r) {
        for (int c = 0; c < m.n_cols; ++c) {
            double v = m.at(r, c);
            if (v > 0.0) out[(size_t)r * (size_t)m.n_cols + (size_t)c] = v - m.row_means[r];
        }
    }
    return out;
}

vector<double> centered_item_rows(const InteractionMatrix& m) {
    vector<double> out((size_t)m.n_cols * (size_t)m.n_rows, 0.0);
    for (int c = 0; c < m.n_cols; ++c) {
        for (int r = 0; r < m.n_rows; ++r) {
            double v = m.at(r, c);
            if (v > 0.0) out[(size_t)c * (size_t)m.n_rows + (size_t)r] = v - m.col_means[c];
        }
    }
    return out;
}
