#pragma once

#include <string>
#include <string_view>

namespace quantgate {
namespace utils {

/**
 * @brief Convert string to lowercase ASCII
 */
std::string to_lower_ascii(std::string_view input);

/**
 * @brief Convert string to uppercase ASCII
 */
std::string to_upper_ascii(std::string_view input);

/**
 * @brief Remove every ASCII whitespace character
 */
std::string strip_whitespace(std::string_view input);

/**
 * @brief Remove every occurrence of a character
 */
std::string strip_char(std::string_view input, char c);

/**
 * @brief True if input is empty or contains only ASCII whitespace
 */
bool is_blank(std::string_view input);

bool ends_with(std::string_view s, std::string_view suffix);

/**
 * @brief Join items with a separator
 */
template <typename Container>
std::string join(const Container& items, std::string_view sep) {
    std::string out;
    bool first = true;
    for (const auto& item : items) {
        if (!first) out.append(sep);
        out.append(item);
        first = false;
    }
    return out;
}

} // namespace utils
} // namespace quantgate
