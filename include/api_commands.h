#ifndef API_COMMANDS_H
#define API_COMMANDS_H

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rating_record.h"

class KNNRecommender;

// State behind the line protocol: the model, the rating table it is retrained from
// and the background retrain worker.
struct ApiSession {
    ApiSession(KNNRecommender& model, int default_count);
    ~ApiSession();

    ApiSession(const ApiSession&) = delete;
    ApiSession& operator=(const ApiSession&) = delete;

    KNNRecommender& rec;
    int default_n;

    std::mutex table_mutex;
    std::vector<RatingRecord> table;

    std::atomic<bool> running{false};
    std::thread worker;
    std::mutex error_mutex;
    std::string last_error;
};

// Runs one protocol line and returns its one-line JSON reply. Sets exit_requested on EXIT.
// Recommender errors are turned into {"error": category, "message": ...} replies.
std::string handle_api_command(ApiSession& s, const std::string& line, bool& exit_requested);

// Refits a copy of the table on the worker thread; the previous model keeps serving
// and stays in place if the fit fails.
void start_retrain(ApiSession& s);

// blocks until a running retrain has finished
void wait_for_retrain(ApiSession& s);

#endif
