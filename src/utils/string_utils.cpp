#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace quantgate {
namespace utils {

std::string to_lower_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string to_upper_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

std::string strip_whitespace(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(c);
    }
    return out;
}

std::string strip_char(std::string_view input, char c) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        if (ch == c) continue;
        out.push_back(ch);
    }
    return out;
}

bool is_blank(std::string_view input) {
    return std::all_of(input.begin(), input.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace utils
} // namespace quantgate
