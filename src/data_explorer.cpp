#include "data_explorer.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <unordered_map>
#include <utility>

#ifdef USE_MATPLOT
#include <matplot/matplot.h>
#endif

using namespace std;

static double mean_double(const vector<double>& v)
{
    if (v.empty()) return 0.0;
    double s = 0.0;
    for (double x : v) s += x;
    return s / (double) v.size();
}

static double stddev_double(const vector<double>& v, double mu)
{
    if (v.size() < 2) return 0.0;
    double s = 0.0;
    for (double x : v) { double d = x - mu; s += d * d; }
    return sqrt(s / (double) (v.size() - 1));
}

static int median_int(vector<int> v)
{
    if (v.empty()) return 0;
    sort(v.begin(), v.end());
    size_t n = v.size();
    if (n % 2) return v[n/2];
    return (v[n/2 - 1] + v[n/2]) / 2;
}

static double mean_int(const vector<int>& v)
{
    if (v.empty()) return 0.0;
    double s = 0.0;
    for (int x : v) s += x;
    return s / (double) v.size();
}

RatingStats compute_rating_stats(const vector<RatingRecord>& ratings)
{
    RatingStats st;
    st.n_ratings = ratings.size();
    if (ratings.empty()) return st;

    vector<double> values;
    values.reserve(ratings.size());
    unordered_map<int,int> user_counts;
    unordered_map<int,int> item_counts;
    set<pair<int,int>> cells;
    for (const RatingRecord &r : ratings) {
        values.push_back(r.rating);
        user_counts[r.user_id] += 1;
        item_counts[r.item_id] += 1;
        cells.insert(make_pair(r.user_id, r.item_id));
        st.rating_hist[round(r.rating * 2.0) / 2.0] += 1;
    }
    st.rating_mean = mean_double(values);
    st.rating_std = stddev_double(values, st.rating_mean);
    st.n_users = user_counts.size();
    st.n_items = item_counts.size();
    for (auto &kv : user_counts) st.ratings_per_user.push_back(kv.second);
    for (auto &kv : item_counts) st.ratings_per_item.push_back(kv.second);
    sort(st.ratings_per_user.begin(), st.ratings_per_user.end());
    sort(st.ratings_per_item.begin(), st.ratings_per_item.end());
    st.per_user_mean = mean_int(st.ratings_per_user);
    st.per_user_median = median_int(st.ratings_per_user);
    st.per_item_mean = mean_int(st.ratings_per_item);
    st.per_item_median = median_int(st.ratings_per_item);
    st.density = (double)cells.size() / ((double)st.n_users * (double)st.n_items);
    return st;
}

static void write_stats_file(const string& path, const RatingStats& st)
{
    ofstream out(path);
    out << "ratings: " << st.n_ratings << "\n";
    out << "users: " << st.n_users << "\n";
    out << "items: " << st.n_items << "\n";
    out << "rating: mean=" << st.rating_mean << " std=" << st.rating_std << "\n";
    out << "ratings per user: mean=" << st.per_user_mean << " median=" << st.per_user_median << "\n";
    out << "ratings per item: mean=" << st.per_item_mean << " median=" << st.per_item_median << "\n";
    out << "density: " << st.density << "\n";
    out.close();
}

#ifdef USE_MATPLOT
static void plot_histogram_matplot(const vector<int>& data, const string& stitle, const string& sxlabel, const string& outpath)
{
    if (data.empty()) return;
    vector<double> vec;
    vec.reserve(data.size());
    for (int v : data) vec.push_back((double)v);
    matplot::figure();
    matplot::hist(vec);
    matplot::title(stitle);
    matplot::xlabel(sxlabel);
    matplot::ylabel("count");
    matplot::save(outpath);
}

static void plot_rating_bars_matplot(const map<double,int>& hist, const string& stitle, const string& outpath)
{
    if (hist.empty()) return;
    vector<double> values;
    for (const auto &p : hist) values.push_back((double)p.second);
    matplot::figure();
    matplot::bar(values);
    matplot::title(stitle);
    matplot::ylabel("count");
    matplot::save(outpath);
}
#endif

RatingStats DataExplorer::analyze_ratings(const vector<RatingRecord>& ratings, const string& out_prefix)
{
    RatingStats st = compute_rating_stats(ratings);

    error_code ec;
    filesystem::create_directories(out_prefix, ec);
    if (ec) {
        cerr << "[explore] cannot create " << out_prefix << ": " << ec.message() << "\n";
        return st;
    }

    write_stats_file(out_prefix + "/explore_stats.txt", st);
    {
        ofstream out_hist(out_prefix + "/rating_hist.csv");
        for (auto &p : st.rating_hist) out_hist << p.first << "," << p.second << "\n";
    }
    {
        ofstream out_users(out_prefix + "/ratings_per_user.csv");
        for (int c : st.ratings_per_user) out_users << c << "\n";
    }
    {
        ofstream out_items(out_prefix + "/ratings_per_item.csv");
        for (int c : st.ratings_per_item) out_items << c << "\n";
    }

#ifdef USE_MATPLOT
    try {
        plot_rating_bars_matplot(st.rating_hist, "Rating distribution", out_prefix + "/rating_hist.png");
        plot_histogram_matplot(st.ratings_per_user, "Ratings per user", "ratings", out_prefix + "/ratings_per_user.png");
        plot_histogram_matplot(st.ratings_per_item, "Ratings per item", "ratings", out_prefix + "/ratings_per_item.png");
    } catch (const exception& e) {
        cerr << "[explore] plotting failed: " << e.what() << "\n";
    }
#endif

    if (log_verbose()) {
        cout << "[explore] " << st.n_ratings << " ratings, " << st.n_users << " users, " << st.n_items
             << " items, mean rating=" << st.rating_mean << ", written to " << out_prefix << "\n";
    }
    return st;
}
