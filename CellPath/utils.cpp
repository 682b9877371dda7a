#include "CellPath.h"

// String utilities
std::string trim_copy(const std::string& s){
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

std::string lower_copy(const std::string& s){
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string upper_copy(const std::string& s){
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string join_strings(const std::vector<std::string>& parts, const std::string& sep){
    std::string out;
    for(size_t i = 0; i < parts.size(); ++i){
        if(i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

long long parse_int_arg(const std::string& raw, const char* ctx){
    std::string s = trim_copy(raw);
    if(s.empty()) throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be integer");
    size_t idx = 0;
    if(s[0] == '+' || s[0] == '-'){
        idx = 1;
        if(idx == s.size()) throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be integer");
    }
    while(idx < s.size()){
        if(!std::isdigit(static_cast<unsigned char>(s[idx])))
            throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be integer");
        ++idx;
    }
    try{
        return std::stoll(s);
    } catch(const std::exception&){
        throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " out of range");
    }
}

size_t parse_size_arg(const std::string& raw, const char* ctx){
    std::string s = trim_copy(raw);
    if(s.empty()) throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be non-negative integer");
    for(char c : s){
        if(!std::isdigit(static_cast<unsigned char>(c)))
            throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be non-negative integer");
    }
    try{
        return static_cast<size_t>(std::stoull(s));
    } catch(const std::exception&){
        throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " out of range");
    }
}

double parse_double_arg(const std::string& raw, const char* ctx){
    std::string s = trim_copy(raw);
    if(s.empty()) throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be a number");
    size_t used = 0;
    double v = 0.0;
    try{
        v = std::stod(s, &used);
    } catch(const std::exception&){
        throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be a number");
    }
    if(used != s.size() || !std::isfinite(v))
        throw CellPathError(CellPathError::Kind::BadInput, std::string(ctx) + " must be a number");
    return v;
}

std::string format_number(double v){
    if(!std::isfinite(v)){
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
    // exponent notation only outside [1e-4, 1e16)
    double mag = std::fabs(v);
    bool plain = mag == 0.0 || (mag >= 1e-4 && mag < 1e16);
    std::string out;
    for(int precision = 1; precision <= 17; ++precision){
        std::ostringstream oss;
        oss << std::setprecision(precision) << v;
        out = oss.str();
        if(plain && out.find('e') != std::string::npos) continue;
        if(std::stod(out) == v) break;
    }
    if(out.find_first_of(".eEn") == std::string::npos) out += ".0";
    return out;
}

int64_t floor_div(int64_t a, int64_t b){
    int64_t q = a / b;
    if((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

int64_t saturating_mul(int64_t a, int64_t b){
    if(a == 0 || b == 0) return 0;
    if(a > std::numeric_limits<int64_t>::max() / b) return std::numeric_limits<int64_t>::max();
    return a * b;
}
