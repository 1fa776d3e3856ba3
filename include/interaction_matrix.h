#ifndef INTERACTION_MATRIX_H
#define INTERACTION_MATRIX_H

#include <vector>
#include <unordered_map>
#include <cstddef>
#include "rating_record.h"

// Dense user x item rating matrix. Row r is user row_ids[r], column c is item col_ids[c].
// A cell value of 0 means "no rating"; this is only safe because ratings are >= MIN_RATING.
struct InteractionMatrix {
    int n_rows = 0;
    int n_cols = 0;
    std::vector<double> cells; // row-major, n_rows * n_cols

    std::vector<int> row_ids;
    std::vector<int> col_ids;
    std::unordered_map<int,int> row_index;
    std::unordered_map<int,int> col_index;

    // means over the rated (non-zero) cells of each row / column
    std::vector<double> row_means;
    std::vector<double> col_means;
    std::vector<int> row_counts;
    std::vector<int> col_counts;

    double global_mean = 0.0;
    size_t n_ratings = 0; // non-zero cells

    double at(int row, int col) const { return cells[(size_t)row * (size_t)n_cols + (size_t)col]; }
    bool empty() const { return n_rows == 0 || n_cols == 0; }
    double density() const;

    int find_row(int user_id) const;
    int find_col(int item_id) const;
};

// Pivots the rating table. Users and items are kept when they have at least min_ratings
// records in the unfiltered table (both counts taken before any filtering). Duplicate
// (user, item) records overwrite each other, the last one wins.
// Throws InvalidInputError for a rating outside [MIN_RATING, MAX_RATING] and
// InvalidConfigurationError for min_ratings < 1. Returns false (out left empty) when
// nothing survives the filters.
bool build_interaction_matrix(const std::vector<RatingRecord>& ratings,
                              int min_ratings,
                              InteractionMatrix& out);

// Rows minus their row mean, unrated cells stay 0. Shape n_rows x n_cols.
std::vector<double> centered_user_rows(const InteractionMatrix& m);
// Transposed: one row per item, minus the item mean, unrated cells stay 0. Shape n_cols x n_rows.
std::vector<double> centered_item_rows(const InteractionMatrix& m);

#endif
