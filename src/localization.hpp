#pragma once

#include <cstdio>
#include <string>
#include <type_traits>
#include <vector>

void init_localization();
const std::string& get_string(const std::string& key);

namespace l10n_detail {
    inline const char* format_arg(const std::string& s) { return s.c_str(); }
    inline const char* format_arg(const char* s) { return s; }

    template<typename T>
        requires std::is_arithmetic_v<T>
    T format_arg(T value) { return value; }
}

// printf-style formatting of a localized template. std::string arguments
// are passed through as C strings, so templates use %s for them.
template<typename... Args>
std::string string_format(const std::string& key, const Args&... args) {
    const std::string& format = get_string(key);
    if constexpr (sizeof...(Args) == 0) {
        return format;
    } else {
        int size = std::snprintf(nullptr, 0, format.c_str(), l10n_detail::format_arg(args)...);
        if (size <= 0) { return format; }
        std::vector<char> buf(static_cast<size_t>(size) + 1);
        std::snprintf(buf.data(), buf.size(), format.c_str(), l10n_detail::format_arg(args)...);
        return std::string(buf.data(), static_cast<size_t>(size));
    }
}
