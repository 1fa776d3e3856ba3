#include "rating_loader.h"
#include "recommender_errors.h"
#include "utils.h"
#include <algorithm>
#include <fstream>
#include <iostream>

using namespace std;

struct RatingHeaderIdx {
    int user_id = -1;
    int item_id = -1;
    int rating = -1;
};

static RatingHeaderIdx parse_rating_header(const vector<string>& header_cols)
{
    RatingHeaderIdx hi;
    for (size_t i = 0; i < header_cols.size(); ++i) {
        string h = to_lower_copy(trim_copy(header_cols[i]));
        if (h == "user_id") hi.user_id = (int)i;
        else if (h == "product_id" || h == "item_id") { if (hi.item_id < 0) hi.item_id = (int)i; }
        else if (h == "rating") hi.rating = (int)i;
    }
    return hi;
}

bool load_ratings_csv(const string& path, vector<RatingRecord>& out, size_t max_rows)
{
    out.clear();
    ifstream in(path);
    if (! in.is_open()) return false;
    string header;
    if (! getline(in, header)) return false;
    // a UTF-8 BOM would otherwise stick to the first column name
    if (header.size() >= 3 && (unsigned char)header[0] == 0xEF && (unsigned char)header[1] == 0xBB && (unsigned char)header[2] == 0xBF)
        header = header.substr(3);

    RatingHeaderIdx hi = parse_rating_header(split_csv_line(header));
    if (hi.user_id < 0 || hi.item_id < 0 || hi.rating < 0)
        throw InvalidInputError(path + ": header must contain user_id, product_id (or item_id) and rating columns");
    int need = max(hi.user_id, max(hi.item_id, hi.rating));

    string line;
    size_t skipped = 0;
    while (getline(in, line)) {
        if (max_rows > 0 && out.size() >= max_rows) break;
        if (trim_copy(line).empty()) continue;
        vector<string> parts = split_csv_line(line);
        if ((int)parts.size() <= need) { ++skipped; continue; }
        RatingRecord r;
        if (!parse_int_field(parts[hi.user_id], r.user_id) ||
            !parse_int_field(parts[hi.item_id], r.item_id) ||
            !parse_double_field(parts[hi.rating], r.rating)) {
            ++skipped;
            continue;
        }
        out.push_back(r);
    }
    in.close();
    if (log_verbose()) {
        cout << "[ratings] loaded " << out.size() << " ratings from " << path;
        if (skipped > 0) cout << " (skipped " << skipped << " malformed rows)";
        cout << "\n";
    }
    return true;
}

bool save_ratings_csv(const string& path, const vector<RatingRecord>& ratings)
{
    ofstream out(path);
    if (! out.is_open()) return false;
    out << "user_id,product_id,rating\n";
    for (const RatingRecord &r : ratings) out << r.user_id << "," << r.item_id << "," << r.rating << "\n";
    out.close();
    return true;
}
