//
// text_utils.hpp
//

#ifndef DOCSCRUB_TEXT_UTILS_HPP
#define DOCSCRUB_TEXT_UTILS_HPP

#include <algorithm>
#include <string>
#include <string_view>

namespace docscrub {

    /**
     * @brief ASCII-only lowercase. Bytes >= 0x80 are left alone, so UTF-8
     * sequences survive untouched.
     */
    inline std::string ascii_lower(const std::string_view s) {
        std::string out(s);
        std::ranges::transform(out, out.begin(), [](const char c) {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        });
        return out;
    }

    /**
     * @brief Case-insensitive (ASCII) substring test. An empty needle matches.
     */
    inline bool icontains(const std::string_view haystack, const std::string_view needle) {
        if (needle.empty()) return true;
        return ascii_lower(haystack).find(ascii_lower(needle)) != std::string::npos;
    }

} // namespace docscrub

#endif // DOCSCRUB_TEXT_UTILS_HPP
