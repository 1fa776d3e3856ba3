#ifndef KNN_RECOMMENDER_H
#define KNN_RECOMMENDER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "interaction_matrix.h"
#include "rating_record.h"
#include "similarity_index.h"

struct RecommenderConfig;

enum class Mode { UserBased, ItemBased };

bool parse_mode(const std::string& name, Mode& out);
const char* mode_name(Mode m);

struct ModelInfo {
    bool trained = false;
    Mode mode = Mode::UserBased;
    int n_neighbors = 0;
    Metric metric = Metric::Cosine;
    int min_ratings = 0;
    int n_users = 0;
    int n_items = 0;
    size_t n_ratings = 0;
    double matrix_density = 0.0;
    double global_mean = 0.0;
};

// k-nearest-neighbour collaborative filtering over a dense user x item matrix.
//
// fit() builds a complete FittedModel and publishes it with a pointer swap, so a failed
// fit leaves the previous model in place and readers never observe a half-built one.
// Query methods are const, take one snapshot per call and may run concurrently with
// each other and with fit().
class KNNRecommender {
public:
    KNNRecommender(int n_neighbors, const std::string& metric, const std::string& approach, int min_ratings);
    explicit KNNRecommender(const RecommenderConfig& cfg);

    KNNRecommender(const KNNRecommender&) = delete;
    KNNRecommender& operator=(const KNNRecommender&) = delete;

    // Throws InsufficientDataError when no user or no item survives min_ratings,
    // InvalidInputError on ratings outside [1, 5].
    ModelInfo fit(const std::vector<RatingRecord>& ratings);

    // Unknown user or item returns the global mean. Result is within [1, 5].
    double predict(int user_id, int item_id) const;

    // Top-n (item_id, predicted rating), rating descending, item_id ascending on ties.
    // Users the model does not know get the popularity ranking instead.
    std::vector<std::pair<int,double>> recommend(int user_id, int n, bool exclude_rated = true) const;

    // (item_id, mean * ln(1 + count)) over the retained items, best first.
    std::vector<std::pair<int,double>> recommend_popular(int n) const;

    // Require a model fitted in the matching mode, otherwise ModeMismatchError.
    // Unknown ids give an empty list.
    std::vector<std::pair<int,double>> find_similar_users(int user_id, int n) const;
    std::vector<std::pair<int,double>> find_similar_items(int item_id, int n) const;

    ModelInfo model_info() const;
    // false before the first fit
    bool has_user(int user_id) const;
    bool has_item(int item_id) const;
    bool is_trained() const { return trained.load(); }

    Mode mode() const { return mode_kind; }
    Metric metric() const { return metric_kind; }
    int n_neighbors() const { return k; }
    int min_ratings() const { return min_count; }

private:
    struct FittedModel {
        InteractionMatrix matrix;
        SimilarityIndex index;
        FittedModel(Metric m, int n_neighbors) : index(m, n_neighbors) {}
    };

    std::shared_ptr<const FittedModel> snapshot() const;
    std::shared_ptr<const FittedModel> require_fitted(const char* op) const;

    double predict_fitted(const FittedModel& fm, int urow, int icol) const;
    double predict_from_neighbors(const FittedModel& fm, const std::vector<Neighbor>& nbrs, int urow, int icol) const;
    std::vector<std::pair<int,double>> popular_fitted(const FittedModel& fm, int n) const;
    std::vector<std::pair<int,double>> similar_fitted(const FittedModel& fm, int row, const std::vector<int>& ids, int n) const;

    int k = 10;
    Metric metric_kind = Metric::Cosine;
    Mode mode_kind = Mode::UserBased;
    int min_count = 5;

    mutable std::mutex state_mutex;
    std::mutex fit_mutex; // one writer at a time
    std::shared_ptr<const FittedModel> fitted;
    std::atomic<bool> trained{false};
};

// rating descending, id ascending on equal ratings
void sort_by_score_desc(std::vector<std::pair<int,double>>& v);

#endif
