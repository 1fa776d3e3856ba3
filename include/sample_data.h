#ifndef SAMPLE_DATA_H
#define SAMPLE_DATA_H

#include <vector>
#include "rating_record.h"

struct RecommenderConfig;

// Synthetic e-commerce ratings, deterministic for a given seed. Each user rates
// max(5, poisson(avg_ratings_per_user)) distinct items (at most num_items); ratings are
// a per-category base score plus a per-user taste offset and noise, clipped to [1, 5]
// and rounded to 0.5. Ids start at 1.
std::vector<RatingRecord> generate_sample_ratings(int num_users,
                                                  int num_items,
                                                  int avg_ratings_per_user,
                                                  unsigned int seed);

// Loads cfg.ratings_csv; when it does not exist, generates sample ratings from the
// cfg.sample_* sizes and saves them there. Returns false if no ratings are available.
bool load_or_generate_ratings(const RecommenderConfig& cfg, std::vector<RatingRecord>& ratings);

#endif
