#ifndef UTILS_H
#define UTILS_H

#include <string>
#include <vector>

std::vector<std::string> split_csv_line(const std::string& line);
std::string trim_copy(const std::string& s);
std::string to_lower_copy(const std::string& s);

bool parse_int_field(const std::string& field, int& out);
bool parse_double_field(const std::string& field, double& out);

// library progress lines ([matrix], [knn], ...) are printed only when verbose
void set_log_verbose(bool verbose);
bool log_verbose();

#endif
