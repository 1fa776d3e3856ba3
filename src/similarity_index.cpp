#include "similarity_index.h"
#include "recommender_errors.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace std;

bool parse_metric(const string& name, Metric& out) {
    string s = to_lower_copy(trim_copy(name));
    if (s == "cosine") { out = Metric::Cosine; return true; }
    if (s == "euclidean") { out = Metric::Euclidean; return true; }
    if (s == "manhattan") { out = Metric::Manhattan; return true; }
    return false;
}

const char* metric_name(Metric m) {
    switch (m) {
        case Metric::Cosine: return "cosine";
        case Metric::Euclidean: return "euclidean";
        case Metric::Manhattan: return "manhattan";
    }
    return "unknown";
}

static double l2_norm(const double* a, int dim) {
    double s = 0.0;
    for (int i = 0; i < dim; ++i) s += a[i] * a[i];
    return sqrt(s);
}

static double cosine_distance_normed(const double* a, double na, const double* b, double nb, int dim) {
    if (na <= 0.0 || nb <= 0.0) return 1.0;
    double dot = 0.0;
    for (int i = 0; i < dim; ++i) dot += a[i] * b[i];
    double cs = dot / (na * nb);
    if (cs > 1.0) cs = 1.0;
    if (cs < -1.0) cs = -1.0;
    return 1.0 - cs;
}

double metric_distance(Metric m, const double* a, const double* b, int dim) {
    switch (m) {
        case Metric::Cosine:
            return cosine_distance_normed(a, l2_norm(a, dim), b, l2_norm(b, dim), dim);
        case Metric::Euclidean: {
            double s = 0.0;
            for (int i = 0; i < dim; ++i) { double d = a[i] - b[i]; s += d * d; }
            return sqrt(s);
        }
        case Metric::Manhattan: {
            double s = 0.0;
            for (int i = 0; i < dim; ++i) s += fabs(a[i] - b[i]);
            return s;
        }
    }
    return 0.0;
}

double distance_to_similarity(Metric m, double distance) {
    if (m == Metric::Cosine) return 1.0 - distance;
    return 1.0 / (1.0 + distance);
}

SimilarityIndex::SimilarityIndex(Metric metric, int n_neighbors)
    : metric_kind(metric), k(n_neighbors)
{
    if (n_neighbors < 1) throw InvalidConfigurationError("n_neighbors must be >= 1, got " + to_string(n_neighbors));
}

void SimilarityIndex::fit(vector<double> rows, int n_rows, int dim) {
    if (n_rows <= 0 || dim <= 0) throw InsufficientDataError("cannot build a neighbour index over an empty matrix");
    if (rows.size() != (size_t)n_rows * (size_t)dim) throw InvalidInputError("row buffer does not match the declared shape");
    data = std::move(rows);
    rows_count = n_rows;
    dims = dim;
    norms.clear();
    if (metric_kind == Metric::Cosine) {
        norms.resize(rows_count);
        for (int r = 0; r < rows_count; ++r) norms[r] = l2_norm(row(r), dims);
    }
    if (log_verbose()) {
        cout << "[index] fitted " << rows_count << " rows of dim " << dims
             << " (metric=" << metric_name(metric_kind) << ", neighbors=" << effective_neighbors() << ")\n";
    }
}

int SimilarityIndex::effective_neighbors() const {
    return min(k + 1, rows_count);
}

vector<Neighbor> SimilarityIndex::kneighbors(int row_idx) const {
    vector<Neighbor> out;
    if (row_idx < 0 || row_idx >= rows_count) return out;
    const double* q = row(row_idx);

    vector<Neighbor> cand;
    cand.reserve(rows_count > 0 ? rows_count - 1 : 0);
    for (int r = 0; r < rows_count; ++r) {
        if (r == row_idx) continue;
        Neighbor nb;
        nb.index = r;
        if (metric_kind == Metric::Cosine) nb.distance = cosine_distance_normed(q, norms[row_idx], row(r), norms[r], dims);
        else nb.distance = metric_distance(metric_kind, q, row(r), dims);
        cand.push_back(nb);
    }

    size_t take = (size_t)(effective_neighbors() - 1);
    if (take > cand.size()) take = cand.size();
    auto closer = [](const Neighbor& A, const Neighbor& B){ if (A.distance == B.distance) return A.index < B.index; return A.distance < B.distance; };
    partial_sort(cand.begin(), cand.begin() + take, cand.end(), closer);

    out.reserve(take + 1);
    Neighbor self;
    self.index = row_idx;
    self.distance = 0.0;
    out.push_back(self);
    for (size_t i = 0; i < take; ++i) out.push_back(cand[i]);
    return out;
}
