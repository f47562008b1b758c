#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "docqa/core/error.hpp"
#include "docqa/retrieval/types.hpp"

namespace docqa::retrieval {

/// BM25 scoring parameters.
struct BM25Params {
    double k1 = 1.5;   // term frequency saturation
    double b = 0.75;   // document length normalization
};

/// Whitespace tokenizer shared by indexing and querying. No stemming, no
/// stop words, case preserved.
auto tokenize(std::string_view text) -> std::vector<std::string>;

/// In-memory Okapi BM25 index over a static corpus.
///
/// Built once and never mutated afterwards, so concurrent search() calls
/// need no synchronization.
///
///   score(D, Q) = sum_{t in Q} IDF(t) * f(t,D) * (k1 + 1)
///                 / (f(t,D) + k1 * (1 - b + b * |D| / avgdl))
///   IDF(t)      = ln((N - n(t) + 0.5) / (n(t) + 0.5) + 1)
class LexicalIndex {
public:
    /// Tokenizes and indexes `corpus`. Fails with IndexUnavailable when the
    /// corpus is empty.
    static auto build(std::vector<Chunk> corpus, BM25Params params = {})
        -> Result<LexicalIndex>;

    /// Top-k documents by descending BM25 score. Ties keep corpus order.
    /// An empty token list scores every document 0.
    [[nodiscard]] auto search(const std::vector<std::string>& query_tokens,
                              size_t k) const -> std::vector<Candidate>;

    /// One score per document, in corpus order.
    [[nodiscard]] auto score_all(const std::vector<std::string>& query_tokens) const
        -> std::vector<double>;

    [[nodiscard]] auto idf(const std::string& term) const -> double;

    [[nodiscard]] auto size() const noexcept -> size_t { return chunks_.size(); }
    [[nodiscard]] auto average_length() const noexcept -> double { return avgdl_; }
    [[nodiscard]] auto vocabulary_size() const noexcept -> size_t { return postings_.size(); }
    [[nodiscard]] auto chunks() const noexcept -> const std::vector<Chunk>& { return chunks_; }
    [[nodiscard]] auto params() const noexcept -> const BM25Params& { return params_; }

private:
    LexicalIndex() = default;

    struct Posting {
        uint32_t doc;
        uint32_t tf;
    };

    std::vector<Chunk> chunks_;
    std::vector<uint32_t> doc_lengths_;
    std::vector<double> length_norms_;  // k1 * (1 - b + b * |D| / avgdl)
    std::unordered_map<std::string, std::vector<Posting>> postings_;
    double avgdl_ = 0.0;
    BM25Params params_;
};

} // namespace docqa::retrieval
