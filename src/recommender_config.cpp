#include "recommender_config.h"
#include "recommender_errors.h"
#include "similarity_index.h"
#include "knn_recommender.h"
#include "utils.h"
#include <fstream>
#include <iostream>

using namespace std;

static int config_int(const string& key, const string& value) {
    int v = 0;
    if (!parse_int_field(value, v)) throw InvalidConfigurationError("config key '" + key + "' expects an integer, got '" + value + "'");
    return v;
}

static double config_double(const string& key, const string& value) {
    double v = 0.0;
    if (!parse_double_field(value, v)) throw InvalidConfigurationError("config key '" + key + "' expects a number, got '" + value + "'");
    return v;
}

bool load_recommender_config(const string& path, RecommenderConfig& cfg) {
    ifstream in(path);
    if (!in.is_open()) return false;
    string line;
    int lineno = 0;
    while (getline(in, line)) {
        ++lineno;
        size_t hash = line.find('#');
        if (hash != string::npos) line = line.substr(0, hash);
        line = trim_copy(line);
        if (line.empty()) continue;
        size_t eq = line.find('=');
        if (eq == string::npos) {
            cerr << "[config] " << path << ":" << lineno << " ignored, no '='\n";
            continue;
        }
        string key = to_lower_copy(trim_copy(line.substr(0, eq)));
        string value = trim_copy(line.substr(eq + 1));

        if (key == "approach") cfg.approach = to_lower_copy(value);
        else if (key == "n_neighbors") cfg.n_neighbors = config_int(key, value);
        else if (key == "metric") cfg.metric = to_lower_copy(value);
        else if (key == "min_ratings") cfg.min_ratings = config_int(key, value);
        else if (key == "ratings_csv") cfg.ratings_csv = value;
        else if (key == "data_dir") cfg.data_dir = value;
        else if (key == "explore_dir") cfg.explore_dir = value;
        else if (key == "n_recommendations") cfg.n_recommendations = config_int(key, value);
        else if (key == "test_fraction") cfg.test_fraction = config_double(key, value);
        else if (key == "seed") {
            int s = config_int(key, value);
            if (s < 0) throw InvalidConfigurationError("config key 'seed' must be >= 0");
            cfg.seed = (unsigned int)s;
        }
        else if (key == "sample_users") cfg.sample_users = config_int(key, value);
        else if (key == "sample_items") cfg.sample_items = config_int(key, value);
        else if (key == "sample_avg_ratings") cfg.sample_avg_ratings = config_int(key, value);
        else cerr << "[config] " << path << ":" << lineno << " unknown key '" << key << "' ignored\n";
    }
    in.close();
    return true;
}

void validate_recommender_config(const RecommenderConfig& cfg) {
    Mode mode;
    if (!parse_mode(cfg.approach, mode)) throw InvalidConfigurationError("approach must be 'user_based' or 'item_based', got '" + cfg.approach + "'");
    Metric metric;
    if (!parse_metric(cfg.metric, metric)) throw InvalidConfigurationError("metric must be 'cosine', 'euclidean' or 'manhattan', got '" + cfg.metric + "'");
    if (cfg.n_neighbors < 1) throw InvalidConfigurationError("n_neighbors must be >= 1");
    if (cfg.min_ratings < 1) throw InvalidConfigurationError("min_ratings must be >= 1");
    if (cfg.n_recommendations < 1) throw InvalidConfigurationError("n_recommendations must be >= 1");
    if (!(cfg.test_fraction > 0.0 && cfg.test_fraction < 1.0)) throw InvalidConfigurationError("test_fraction must be in (0, 1)");
    if (cfg.sample_users < 1 || cfg.sample_items < 1 || cfg.sample_avg_ratings < 1) throw InvalidConfigurationError("sample sizes must be >= 1");
}
