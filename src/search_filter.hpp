#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace pnav {

inline std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Case-insensitive substring match
inline bool matches_query(const std::string& text, const std::string& query) {
    if (query.empty()) return true;
    return to_lower(text).find(to_lower(query)) != std::string::npos;
}

// Keep the items whose key contains query, in their original order.
// An empty query returns items unchanged.
template <typename T, typename KeyFn>
[[nodiscard]] std::vector<T> filter(const std::vector<T>& items, const std::string& query, KeyFn key_fn) {
    if (query.empty()) return items;

    const std::string needle = to_lower(query);
    std::vector<T> result;
    for (const auto& item : items) {
        if (to_lower(key_fn(item)).find(needle) != std::string::npos) {
            result.push_back(item);
        }
    }
    return result;
}

} // namespace pnav
