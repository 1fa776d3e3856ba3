#ifndef RATING_LOADER_H
#define RATING_LOADER_H

#include <string>
#include <vector>
#include "rating_record.h"

// Reads a CSV with a header naming user_id, product_id (or item_id) and rating; other
// columns are ignored. Returns false if the file cannot be opened or has no header.
// A header without the required columns throws InvalidInputError. Rows that do not
// parse are skipped. max_rows = 0 reads everything.
bool load_ratings_csv(const std::string& path,
                      std::vector<RatingRecord>& out,
                      size_t max_rows = 0);

bool save_ratings_csv(const std::string& path, const std::vector<RatingRecord>& ratings);

#endif
