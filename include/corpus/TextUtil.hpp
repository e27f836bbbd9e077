#pragma once
#include <string>
#include <vector>

namespace wordspace {
namespace textutil {

// lowercase, keep ASCII letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text on spaces
std::vector<std::string> tokenize(const std::string& normalized);

std::string trim(const std::string& s);

// one CSV record; double quotes group fields and "" is a literal quote
std::vector<std::string> split_csv_line(const std::string& line, char delim);

}  // namespace textutil
}  // namespace wordspace
