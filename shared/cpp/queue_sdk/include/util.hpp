#pragma once
#include <istream>
#include <optional>
#include <string>

namespace nlpq {

std::string getenv_or(const char* key, const std::string& def);
long getenv_long(const char* key, long def);
// Whole-string base-10 integer, empty if anything else is present.
std::optional<long> parse_long(const std::string& value);

std::string read_stream(std::istream& in);
// "-" reads standard input, anything else is returned as is.
std::string arg_or_stdin(const std::string& arg);

std::string to_lower(std::string value);
bool is_truthy(const std::string& value);

} // namespace nlpq
