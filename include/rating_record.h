#ifndef RATING_RECORD_H
#define RATING_RECORD_H

struct RatingRecord {
    int user_id = 0;
    int item_id = 0;
    double rating = 0.0;

    RatingRecord() = default;
    RatingRecord(int u, int i, double r) : user_id(u), item_id(i), rating(r) {}
};

// ratings live on a 1..5 scale; 0 is reserved as the "no rating" cell value
constexpr double MIN_RATING = 1.0;
constexpr double MAX_RATING = 5.0;

#endif
