#include "corpus/TextUtil.hpp"

#include <cctype>

namespace wordspace {
namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::vector<std::string> split_csv_line(const std::string& line, char delim) {
    std::vector<std::string> cols;
    std::string cur;
    bool inq = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (inq && i + 1 < line.size() && line[i + 1] == '"') {
                cur.push_back('"');
                ++i;
            } else {
                inq = !inq;
            }
        } else if (c == delim && !inq) {
            cols.push_back(cur);
            cur.clear();
        } else if ((c == '\r' || c == '\n') && !inq) {
            continue;
        } else {
            cur.push_back(c);
        }
    }
    cols.push_back(cur);
    return cols;
}

}  // namespace textutil
}  // namespace wordspace
