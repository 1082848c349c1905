#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace nlpq {

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long getenv_long(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v) return def;
    return parse_long(v).value_or(def);
}

std::optional<long> parse_long(const std::string& value) {
    if (value.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (errno == ERANGE || end != value.c_str() + value.size()) return std::nullopt;
    return parsed;
}

std::string read_stream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string arg_or_stdin(const std::string& arg) {
    return arg == "-" ? read_stream(std::cin) : arg;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_truthy(const std::string& value) {
    return value == "1" || value == "Y" || value == "True" || value == "true";
}

} // namespace nlpq
