#include "docqa/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace docqa::utils {

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

namespace {

auto is_space(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

auto trim(std::string_view s) -> std::string {
    auto start = std::ranges::find_if_not(s, is_space);
    if (start == s.end()) return "";
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return std::string(start, end);
}

auto split_whitespace(std::string_view s) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) {
            ++i;
        }
        if (i >= s.size()) break;

        size_t start = i;
        while (i < s.size() && !is_space(s[i])) {
            ++i;
        }
        tokens.emplace_back(s.substr(start, i - start));
    }
    return tokens;
}

auto utf8_prefix(std::string_view s, std::size_t max_chars) -> std::string_view {
    size_t pos = 0;
    size_t count = 0;
    while (pos < s.size() && count < max_chars) {
        auto lead = static_cast<unsigned char>(s[pos]);
        size_t len = 1;
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;

        // A truncated or malformed sequence consumes only its lead byte.
        if (len > 1) {
            if (pos + len > s.size()) {
                len = 1;
            } else {
                for (size_t k = 1; k < len; ++k) {
                    if ((static_cast<unsigned char>(s[pos + k]) & 0xC0) != 0x80) {
                        len = 1;
                        break;
                    }
                }
            }
        }
        pos += len;
        ++count;
    }
    return s.substr(0, pos);
}

auto utf8_truncate(std::string_view s, std::size_t max_bytes) -> std::string_view {
    if (s.size() <= max_bytes) return s;
    size_t pos = max_bytes;
    // Back off to the lead byte of a sequence straddling the cut.
    while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return s.substr(0, pos);
}

auto url_encode(std::string_view s) -> std::string {
    std::ostringstream oss;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::hex << std::uppercase << std::setfill('0')
                << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }
    return oss.str();
}

} // namespace docqa::utils
