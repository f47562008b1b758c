#include "docqa/retrieval/fusion.hpp"
#include "docqa/core/utils.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <string_view>
#include <utility>

namespace docqa::retrieval {

namespace {

// An absent url must not collide with an empty one.
using DedupKey = std::pair<std::string_view, std::optional<std::string_view>>;

auto dedup_key(const Candidate& c) -> DedupKey {
    std::optional<std::string_view> url;
    if (c.chunk.url) url = *c.chunk.url;
    return {utils::utf8_prefix(c.chunk.text, kDedupPrefixChars), url};
}

} // anonymous namespace

auto merge_candidates(const std::vector<Candidate>& vector_hits,
                      const std::vector<Candidate>& lexical_hits,
                      size_t k) -> std::vector<Candidate> {
    const auto limit = fusion_limit(k);

    std::vector<Candidate> merged;
    merged.reserve(std::min(limit, vector_hits.size() + lexical_hits.size()));

    // Keys view into the input vectors, which outlive this call.
    std::set<DedupKey> seen;

    auto take = [&](const std::vector<Candidate>& hits) {
        for (const auto& c : hits) {
            if (merged.size() >= limit) return;
            if (seen.insert(dedup_key(c)).second) {
                merged.push_back(c);
            }
        }
    };

    take(vector_hits);
    take(lexical_hits);
    return merged;
}

} // namespace docqa::retrieval
