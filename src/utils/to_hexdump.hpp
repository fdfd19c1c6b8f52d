#pragma once
#include <algorithm>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "hexdump.hpp"

std::string hexdump_to_string(Hexdump hd, int indent = 0, const std::string& prefix = "");

inline Hexdump to_hexdump(const void *ptr, size_t buflen){
    return hexdump_iter(ptr, buflen);
}

inline Hexdump to_hexdump(const std::vector<uint8_t>& buf){
    return to_hexdump(buf.data(), buf.size());
}

inline Hexdump to_hexdump(const std::string& str, size_t max_size=0){
    max_size = max_size ? std::min(max_size, str.size()) : str.size();
    return to_hexdump(str.data(), max_size);
}

// fmt::formatter specializations, so lines and whole dumps go straight into spdlog calls
namespace fmt {
    template <>
    struct formatter<Line> : formatter<string_view> {
        template <typename FormatContext>
        auto format(const Line& line, FormatContext& ctx) const {
            return formatter<string_view>::format(string_view(line.data(), line.size()), ctx);
        }
    };

    // formats a copy, the passed sequence is not consumed
    template <>
    struct formatter<Hexdump> : formatter<std::string> {
        template <typename FormatContext>
        auto format(const Hexdump& hd, FormatContext& ctx) const {
            return formatter<std::string>::format(hexdump_to_string(hd, 4, "\n"), ctx);
        }
    };
}
