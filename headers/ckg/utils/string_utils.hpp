#ifndef CKG_STRING_UTILS_HPP
#define CKG_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String manipulation utilities.
 *
 * Trimming, splitting and case conversion, plus the two tokenizers the
 * graph relies on: word tokenization for vectorization and identifier
 * splitting (camelCase, PascalCase, snake_case) for domain terms.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ckg::string_utils {

    inline bool is_alnum(const char c) noexcept {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }

    inline bool is_identifier_char(const char c) noexcept {
        return is_alnum(c) || c == '_' || c == '$';
    }

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string by a delimiter. Empty parts are kept.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Case-insensitive containment. The needle must already be lower-case.
     */
    inline bool contains_lower(const std::string_view s, const std::string_view lower_needle) {
        return to_lower(s).find(lower_needle) != std::string::npos;
    }

    /**
     * Splits text into lower-case words on non-alphanumeric boundaries and
     * drops words shorter than min_length.
     *
     * "parseHTTP_request(v2)" with min_length 3 yields {"parsehttp", "request"}.
     */
    inline std::vector<std::string> tokenize_words(const std::string_view text, const std::size_t min_length) {
        std::vector<std::string> words;
        std::string current;

        auto flush = [&] {
            if (current.size() >= min_length && !current.empty()) {
                words.push_back(current);
            }
            current.clear();
        };

        for (const char c : text) {
            if (is_alnum(c)) {
                current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            } else {
                flush();
            }
        }
        flush();

        return words;
    }

    /**
     * Splits an identifier on separators and case boundaries, keeping the
     * original case of each term. Acronyms stay together.
     *
     * "UserAccountService" -> {"User", "Account", "Service"}
     * "HTTPServer"         -> {"HTTP", "Server"}
     * "order_item-list.ts" -> {"order", "item", "list", "ts"}
     */
    inline std::vector<std::string> split_identifier(const std::string_view name) {
        std::vector<std::string> terms;
        std::string current;

        auto flush = [&] {
            if (!current.empty()) {
                terms.push_back(current);
                current.clear();
            }
        };

        for (std::size_t i = 0; i < name.size(); ++i) {
            const char c = name[i];
            if (!is_alnum(c)) {
                flush();
                continue;
            }

            const auto uc = static_cast<unsigned char>(c);
            if (std::isupper(uc) && !current.empty()) {
                const auto prev = static_cast<unsigned char>(current.back());
                const bool next_is_lower = i + 1 < name.size() &&
                    std::islower(static_cast<unsigned char>(name[i + 1]));
                if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && next_is_lower)) {
                    flush();
                }
            }
            current += c;
        }
        flush();

        return terms;
    }

    inline std::size_t count_occurrences(const std::string_view s, const std::string_view needle) noexcept {
        if (needle.empty()) {
            return 0;
        }
        std::size_t count = 0;
        std::size_t pos = s.find(needle);
        while (pos != std::string_view::npos) {
            ++count;
            pos = s.find(needle, pos + needle.size());
        }
        return count;
    }

}  // namespace ckg::string_utils

#endif //CKG_STRING_UTILS_HPP
