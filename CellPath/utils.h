#ifndef _CellPath_utils_h_
#define _CellPath_utils_h_

// String utilities
std::string trim_copy(const std::string& s);
std::string lower_copy(const std::string& s);
std::string upper_copy(const std::string& s);
std::string join_strings(const std::vector<std::string>& parts, const std::string& sep);

// Number parsing, throws CellPathError(BadInput) naming ctx
long long parse_int_arg(const std::string& s, const char* ctx);
size_t parse_size_arg(const std::string& s, const char* ctx);
double parse_double_arg(const std::string& s, const char* ctx);

// Shortest round-trippable decimal, always with a fractional part ("100.0", "2.75")
std::string format_number(double v);

// Floor division for lattice midpoints (rounds toward negative infinity)
int64_t floor_div(int64_t a, int64_t b);

// Product of two non-negative counts, clamped to INT64_MAX
int64_t saturating_mul(int64_t a, int64_t b);

#endif
