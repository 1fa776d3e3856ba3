#include "api_commands.h"
#include "data_explorer.h"
#include "knn_recommender.h"
#include "recommender_errors.h"
#include "utils.h"
#include <cstdio>
#include <exception>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

using namespace std;

static string json_escape(const string &s) {
    string out;
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\"': out += "\\\""; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", (int)c);
                    out += buf;
                } else out += c;
        }
    }
    return out;
}

static void write_scored_list(const vector<pair<int,double>>& v, const char* score_key, ostream &os) {
    os << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) os << ",";
        os << "{\"id\":" << v[i].first << ",\"" << score_key << "\":" << fixed << setprecision(6) << v[i].second << "}";
    }
    os << "]";
}

static void write_model_info_json(const ModelInfo& info, ostream &os) {
    os << "{";
    os << "\"trained\":" << (info.trained ? "true" : "false") << ",";
    os << "\"approach\":\"" << mode_name(info.mode) << "\",";
    os << "\"n_neighbors\":" << info.n_neighbors << ",";
    os << "\"metric\":\"" << metric_name(info.metric) << "\",";
    os << "\"min_ratings\":" << info.min_ratings << ",";
    os << "\"n_users\":" << info.n_users << ",";
    os << "\"n_items\":" << info.n_items << ",";
    os << "\"n_ratings\":" << info.n_ratings << ",";
    os << "\"matrix_density\":" << fixed << setprecision(6) << info.matrix_density << ",";
    os << "\"global_mean_rating\":" << fixed << setprecision(6) << info.global_mean;
    os << "}";
}

static void write_rating_stats_json(const RatingStats& st, ostream &os) {
    os << "{";
    os << "\"ratings\":" << st.n_ratings << ",";
    os << "\"users\":" << st.n_users << ",";
    os << "\"items\":" << st.n_items << ",";
    os << "\"rating_mean\":" << fixed << setprecision(6) << st.rating_mean << ",";
    os << "\"rating_std\":" << fixed << setprecision(6) << st.rating_std << ",";
    os << "\"ratings_per_user_mean\":" << fixed << setprecision(6) << st.per_user_mean << ",";
    os << "\"ratings_per_user_median\":" << st.per_user_median << ",";
    os << "\"ratings_per_item_mean\":" << fixed << setprecision(6) << st.per_item_mean << ",";
    os << "\"ratings_per_item_median\":" << st.per_item_median << ",";
    os << "\"density\":" << fixed << setprecision(6) << st.density << ",";
    os << "\"rating_hist\":{";
    bool first = true;
    for (auto &p : st.rating_hist) {
        if (!first) os << ",";
        first = false;
        os << "\"" << fixed << setprecision(1) << p.first << "\":" << p.second;
    }
    os << "}}";
}

static string error_reply(const string& category, const string& msg) {
    return "{\"error\":\"" + json_escape(category) + "\",\"message\":\"" + json_escape(msg) + "\"}";
}

static vector<string> rest_tokens(istringstream& iss) {
    vector<string> out;
    string t;
    while (iss >> t) out.push_back(t);
    return out;
}

// [n] as the only trailing argument; false when it is present but not an integer
static bool optional_count(const vector<string>& args, int def, int& n) {
    n = def;
    if (args.empty()) return true;
    if (args.size() > 1) return false;
    return parse_int_field(args[0], n);
}

ApiSession::ApiSession(KNNRecommender& model, int default_count)
    : rec(model), default_n(default_count)
{
}

ApiSession::~ApiSession() {
    if (worker.joinable()) worker.join();
}

void start_retrain(ApiSession& s) {
    if (s.worker.joinable()) s.worker.join();
    vector<RatingRecord> copy;
    {
        lock_guard<mutex> lk(s.table_mutex);
        copy = s.table;
    }
    s.running.store(true);
    s.worker = thread([&s, copy]() {
        string err;
        try {
            s.rec.fit(copy);
        } catch (const RecommenderError& e) {
            err = e.category() + string(": ") + e.what();
        } catch (const exception& e) {
            err = e.what();
        }
        if (!err.empty()) cerr << "[api_cli] retrain failed, previous model kept: " << err << "\n";
        {
            lock_guard<mutex> lk(s.error_mutex);
            s.last_error = err;
        }
        s.running.store(false);
    });
}

void wait_for_retrain(ApiSession& s) {
    if (s.worker.joinable()) s.worker.join();
}

static string run_command(ApiSession& s, const string& cmd, istringstream& iss, bool& exit_requested) {
    KNNRecommender &rec = s.rec;
    ostringstream os;
    if (cmd == "PING") {
        return "{\"ok\":true}";
    } else if (cmd == "EXIT") {
        exit_requested = true;
        return "{\"ok\":true, \"exiting\":true}";
    } else if (cmd == "INFO") {
        write_model_info_json(rec.model_info(), os);
    } else if (cmd == "STATUS") {
        size_t table_size;
        {
            lock_guard<mutex> lk(s.table_mutex);
            table_size = s.table.size();
        }
        string err;
        {
            lock_guard<mutex> lk(s.error_mutex);
            err = s.last_error;
        }
        os << "{\"trained\":" << (rec.is_trained() ? "true" : "false")
           << ",\"retraining\":" << (s.running.load() ? "true" : "false")
           << ",\"ratings\":" << table_size;
        if (!err.empty()) os << ",\"last_error\":\"" << json_escape(err) << "\"";
        os << "}";
    } else if (cmd == "STATS") {
        vector<RatingRecord> copy;
        {
            lock_guard<mutex> lk(s.table_mutex);
            copy = s.table;
        }
        os << "{\"data\":";
        write_rating_stats_json(compute_rating_stats(copy), os);
        os << ",\"model\":";
        write_model_info_json(rec.model_info(), os);
        os << ",\"retraining\":" << (s.running.load() ? "true" : "false") << "}";
    } else if (cmd == "PREDICT") {
        int uid, iid;
        if (!(iss >> uid >> iid)) return error_reply("bad_command", "usage: PREDICT <user> <item>");
        double p = rec.predict(uid, iid);
        os << "{\"user_id\":" << uid << ",\"product_id\":" << iid << ",\"predicted_rating\":" << fixed << setprecision(6) << p << "}";
    } else if (cmd == "RECOMMEND") {
        const char* usage = "usage: RECOMMEND <user> [n] [all]";
        int uid;
        if (!(iss >> uid)) return error_reply("bad_command", usage);
        int n = s.default_n;
        bool have_n = false;
        bool exclude_rated = true;
        for (const string &t : rest_tokens(iss)) {
            int v;
            if (!have_n && parse_int_field(t, v)) { n = v; have_n = true; }
            else if (to_lower_copy(t) == "all") exclude_rated = false;
            else return error_reply("bad_command", usage);
        }
        os << "{\"user_id\":" << uid << ",\"known_user\":" << (rec.has_user(uid) ? "true" : "false") << ",\"recommendations\":";
        write_scored_list(rec.recommend(uid, n, exclude_rated), "predicted_rating", os);
        os << "}";
    } else if (cmd == "POPULAR") {
        int n;
        if (!optional_count(rest_tokens(iss), s.default_n, n)) return error_reply("bad_command", "usage: POPULAR [n]");
        os << "{\"popular\":";
        write_scored_list(rec.recommend_popular(n), "popularity", os);
        os << "}";
    } else if (cmd == "SIMILAR_USERS" || cmd == "SIMILAR_ITEMS") {
        int id, n;
        if (!(iss >> id) || !optional_count(rest_tokens(iss), s.default_n, n))
            return error_reply("bad_command", "usage: " + cmd + " <id> [n]");
        bool users = cmd == "SIMILAR_USERS";
        vector<pair<int,double>> sim = users ? rec.find_similar_users(id, n) : rec.find_similar_items(id, n);
        os << "{\"" << (users ? "user_id" : "product_id") << "\":" << id << ",\"similar\":";
        write_scored_list(sim, "similarity", os);
        os << "}";
    } else if (cmd == "PROFILE") {
        int uid;
        if (!(iss >> uid)) return error_reply("bad_command", "usage: PROFILE <user>");
        // same resolution as fit: the last rating of an item wins
        map<int,double> rated;
        {
            lock_guard<mutex> lk(s.table_mutex);
            for (const RatingRecord &r : s.table) if (r.user_id == uid) rated[r.item_id] = r.rating;
        }
        if (rated.empty()) throw InvalidInputError("user " + to_string(uid) + " has no ratings");
        vector<pair<int,double>> items(rated.begin(), rated.end());
        double sum = 0.0;
        for (auto &p : items) sum += p.second;
        os << "{\"user_id\":" << uid << ",\"known_user\":" << (rec.has_user(uid) ? "true" : "false")
           << ",\"n_ratings\":" << items.size()
           << ",\"mean_rating\":" << fixed << setprecision(6) << sum / (double)items.size()
           << ",\"ratings\":";
        write_scored_list(items, "rating", os);
        os << "}";
    } else if (cmd == "RATE") {
        int uid, iid;
        double r;
        if (!(iss >> uid >> iid >> r)) return error_reply("bad_command", "usage: RATE <user> <item> <rating>");
        if (!(r >= MIN_RATING && r <= MAX_RATING)) return error_reply("invalid_input", "rating must be between 1 and 5");
        size_t table_size;
        {
            lock_guard<mutex> lk(s.table_mutex);
            s.table.emplace_back(uid, iid, r);
            table_size = s.table.size();
        }
        os << "{\"ok\":true,\"ratings\":" << table_size << ",\"retrain_required\":true}";
    } else if (cmd == "RETRAIN") {
        if (s.running.load()) return "{\"ok\":false,\"retraining\":true}";
        start_retrain(s);
        return "{\"ok\":true,\"retraining\":true}";
    } else {
        return error_reply("bad_command", "unknown command");
    }
    return os.str();
}

string handle_api_command(ApiSession& s, const string& line, bool& exit_requested) {
    exit_requested = false;
    if (trim_copy(line).empty()) return "{}";
    istringstream iss(line);
    string cmd;
    iss >> cmd;
    try {
        return run_command(s, cmd, iss, exit_requested);
    } catch (const RecommenderError& e) {
        return error_reply(e.category(), e.what());
    }
}
