#ifndef RECOMMENDER_CONFIG_H
#define RECOMMENDER_CONFIG_H

#include <string>

struct RecommenderConfig {
    // model
    std::string approach = "user_based";
    int n_neighbors = 15;
    std::string metric = "cosine";
    int min_ratings = 5;

    // data
    std::string ratings_csv = "data/ratings.csv";
    std::string data_dir = "data";
    std::string explore_dir = "data/explore";

    // serving / evaluation
    int n_recommendations = 10;
    double test_fraction = 0.2;
    unsigned int seed = 42;

    // sample data used when ratings_csv is missing
    int sample_users = 50;
    int sample_items = 100;
    int sample_avg_ratings = 15;
};

// key = value lines, '#' starts a comment. Returns false when the file cannot be opened;
// cfg keeps whatever values it had. Unparsable numbers throw InvalidConfigurationError.
bool load_recommender_config(const std::string& path, RecommenderConfig& cfg);

// throws InvalidConfigurationError on the first bad field
void validate_recommender_config(const RecommenderConfig& cfg);

#endif
