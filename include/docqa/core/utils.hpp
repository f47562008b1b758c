#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docqa::utils {

auto generate_id(std::size_t length = 16) -> std::string;
/// Strips leading and trailing whitespace as classified by std::isspace,
/// the same set split_whitespace() splits on.
auto trim(std::string_view s) -> std::string;

/// Splits on runs of ASCII whitespace; leading/trailing whitespace yields
/// no empty tokens.
auto split_whitespace(std::string_view s) -> std::vector<std::string>;

/// Returns the first `max_chars` UTF-8 code points of `s`. Bytes that do not
/// start a valid sequence count as one character each.
auto utf8_prefix(std::string_view s, std::size_t max_chars) -> std::string_view;

/// Returns the longest prefix of `s` that fits in `max_bytes` without
/// splitting a UTF-8 sequence.
auto utf8_truncate(std::string_view s, std::size_t max_bytes) -> std::string_view;

auto url_encode(std::string_view s) -> std::string;

} // namespace docqa::utils
