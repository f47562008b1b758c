#pragma once

#include <vector>

#include "docqa/retrieval/types.hpp"

namespace docqa::retrieval {

/// Number of characters of chunk text that take part in the dedup key.
constexpr size_t kDedupPrefixChars = 64;

/// Upper bound on the merged candidate count for a request asking for `k`.
[[nodiscard]] constexpr auto fusion_limit(size_t k) noexcept -> size_t {
    return k * 2 > 10 ? k * 2 : 10;
}

/// Concatenates vector then lexical candidates and drops every candidate
/// whose (text prefix, url) key was already seen. The first occurrence wins
/// regardless of source or score; scores are carried through untouched.
/// The result holds at most fusion_limit(k) candidates.
auto merge_candidates(const std::vector<Candidate>& vector_hits,
                      const std::vector<Candidate>& lexical_hits,
                      size_t k) -> std::vector<Candidate>;

} // namespace docqa::retrieval
