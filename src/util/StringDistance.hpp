/**
 * @file StringDistance.hpp
 * @brief Edit distance helpers used for search matching
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

namespace util {

/**
 * @brief Decode UTF-8 into code points
 *
 * A malformed or truncated sequence yields one U+FFFD per offending byte.
 */
[[nodiscard]] inline auto decode_utf8(std::string_view text) -> std::u32string {
    constexpr char32_t REPLACEMENT = 0xFFFD;
    std::u32string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        char32_t code = 0;
        if (lead < 0x80) {
            length = 1;
            code = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code = lead & 0x07;
        }

        bool valid = length > 0 && i + length <= text.size();
        for (size_t k = 1; valid && k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
            } else {
                code = (code << 6) | (next & 0x3F);
            }
        }

        if (!valid) {
            result.push_back(REPLACEMENT);
            ++i;
            continue;
        }
        result.push_back(code);
        i += length;
    }
    return result;
}

/**
 * @brief Levenshtein distance (insert, delete, substitute; unit cost) over code points
 * @param a_text First UTF-8 string
 * @param b_text Second UTF-8 string
 * @return Minimum number of character edits turning a into b
 */
[[nodiscard]] inline auto levenshtein(std::string_view a_text, std::string_view b_text)
    -> size_t {
    auto a = decode_utf8(a_text);
    auto b = decode_utf8(b_text);
    if (a.size() < b.size()) {
        std::swap(a, b);
    }
    if (b.empty()) {
        return a.size();
    }

    // Single row over the shorter string
    std::vector<size_t> row(b.size() + 1);
    std::iota(row.begin(), row.end(), size_t{0});

    for (size_t i = 1; i <= a.size(); ++i) {
        size_t diagonal = row[0];
        row[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t above = row[j];
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            row[j] = std::min({row[j] + 1, row[j - 1] + 1, diagonal + cost});
            diagonal = above;
        }
    }
    return row[b.size()];
}

/**
 * @brief ASCII lower-case copy
 */
[[nodiscard]] inline auto to_lower(std::string_view s) -> std::string {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

/**
 * @brief Loose match used by `list --search`
 *
 * Matches when the query is a case-insensitive substring of the candidate, or when the
 * two are within `max_distance` character edits of each other. Case folding is ASCII only.
 */
[[nodiscard]] inline auto fuzzy_matches(std::string_view candidate, std::string_view query,
                                        size_t max_distance = 2) -> bool {
    if (query.empty()) {
        return true;
    }
    auto lower_candidate = to_lower(candidate);
    auto lower_query = to_lower(query);
    if (lower_candidate.find(lower_query) != std::string::npos) {
        return true;
    }
    return levenshtein(lower_candidate, lower_query) <= max_distance;
}

}  // namespace util
