#ifndef SIMILARITY_INDEX_H
#define SIMILARITY_INDEX_H

#include <string>
#include <vector>

enum class Metric { Cosine, Euclidean, Manhattan };

bool parse_metric(const std::string& name, Metric& out);
const char* metric_name(Metric m);

// Distance between two dense vectors of length dim. Cosine distance is
// 1 - cos(a, b); a zero vector has cosine similarity 0 with everything.
double metric_distance(Metric m, const double* a, const double* b, int dim);

// Weight used by the predictor: 1 - d for cosine (in [-1, 1], negative for opposed
// profiles), 1 / (1 + d) otherwise.
// Kept next to metric_distance so every metric carries both halves.
double distance_to_similarity(Metric m, double distance);

struct Neighbor {
    int index = 0;
    double distance = 0.0;
};

// Brute-force nearest-neighbour search over the rows of a dense matrix.
class SimilarityIndex {
public:
    SimilarityIndex(Metric metric, int n_neighbors);

    // takes ownership of the row-major n_rows x dim matrix
    void fit(std::vector<double> rows, int n_rows, int dim);

    // Up to effective_neighbors() rows nearest to fitted row `row`, ascending by distance,
    // ties by row index. The row itself comes first at distance 0.
    std::vector<Neighbor> kneighbors(int row) const;

    int n_rows() const { return rows_count; }
    int dim() const { return dims; }
    Metric metric() const { return metric_kind; }
    // min(k + 1, n_rows): k neighbours plus the query row itself
    int effective_neighbors() const;
    const double* row(int r) const { return data.data() + (size_t)r * (size_t)dims; }

private:
    Metric metric_kind;
    int k = 1;
    int rows_count = 0;
    int dims = 0;
    std::vector<double> data;
    std::vector<double> norms; // L2 norms, only filled for cosine
};

#endif
