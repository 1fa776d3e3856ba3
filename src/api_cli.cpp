#include <iostream>
#include <string>

#include "api_commands.h"
#include "knn_recommender.h"
#include "recommender_config.h"
#include "recommender_errors.h"
#include "sample_data.h"
#include "utils.h"

using namespace std;

int main(int argc, char** argv) {
    ios::sync_with_stdio(true);
    cin.tie(nullptr);

    const string config_path = argc > 1 ? argv[1] : "config/recommender.conf";
    RecommenderConfig cfg;
    try {
        if (load_recommender_config(config_path, cfg)) cerr << "[api_cli] config loaded from " << config_path << "\n";
        else cerr << "[api_cli] config " << config_path << " not found, using defaults\n";
        validate_recommender_config(cfg);
    } catch (const RecommenderError& e) {
        cerr << "[api_cli] invalid configuration: " << e.what() << "\n";
        return 1;
    }
    // stdout carries the protocol, library progress lines would corrupt it
    set_log_verbose(false);

    KNNRecommender rec(cfg);
    ApiSession session(rec, cfg.n_recommendations);
    try {
        if (!load_or_generate_ratings(cfg, session.table)) {
            cerr << "[api_cli] no ratings available\n";
            return 1;
        }
        cerr << "[api_cli] loaded ratings: " << session.table.size() << "\n";
        rec.fit(session.table);
        ModelInfo info = rec.model_info();
        cerr << "[api_cli] model trained: users=" << info.n_users << " items=" << info.n_items << "\n";
    } catch (const InsufficientDataError& e) {
        // keep serving; queries answer not_fitted until a RETRAIN succeeds
        cerr << "[api_cli] model not trained: " << e.what() << "\n";
    } catch (const RecommenderError& e) {
        cerr << "[api_cli] " << e.category() << ": " << e.what() << "\n";
        return 1;
    }

    cout << "READY" << endl;
    cout.flush();

    string line;
    while (true) {
        if (! std::getline(cin, line)) break;
        bool exit_requested = false;
        cout << handle_api_command(session, line, exit_requested) << endl;
        cout.flush();
        if (exit_requested) break;
    }

    wait_for_retrain(session);
    return 0;
}
