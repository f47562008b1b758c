#include "docqa/retrieval/lexical_index.hpp"
#include "docqa/core/logger.hpp"
#include "docqa/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace docqa::retrieval {

auto tokenize(std::string_view text) -> std::vector<std::string> {
    return utils::split_whitespace(text);
}

auto LexicalIndex::build(std::vector<Chunk> corpus, BM25Params params)
    -> Result<LexicalIndex> {
    if (corpus.empty()) {
        return std::unexpected(make_error(ErrorCode::IndexUnavailable,
            "Cannot build lexical index from an empty corpus"));
    }

    LexicalIndex index;
    index.params_ = params;
    index.doc_lengths_.reserve(corpus.size());

    uint64_t total_length = 0;
    for (size_t d = 0; d < corpus.size(); ++d) {
        auto tokens = tokenize(corpus[d].text);

        std::unordered_map<std::string, uint32_t> tf;
        for (auto& token : tokens) {
            ++tf[std::move(token)];
        }
        for (auto& [term, count] : tf) {
            index.postings_[term].push_back(Posting{static_cast<uint32_t>(d), count});
        }

        index.doc_lengths_.push_back(static_cast<uint32_t>(tokens.size()));
        total_length += tokens.size();
    }

    index.avgdl_ = static_cast<double>(total_length) / static_cast<double>(corpus.size());
    index.length_norms_.reserve(corpus.size());
    for (auto len : index.doc_lengths_) {
        double relative = index.avgdl_ > 0.0 ? static_cast<double>(len) / index.avgdl_ : 0.0;
        index.length_norms_.push_back(params.k1 * (1.0 - params.b + params.b * relative));
    }

    index.chunks_ = std::move(corpus);

    LOG_INFO("Lexical index built: {} documents, {} terms, avgdl={:.1f}",
             index.chunks_.size(), index.postings_.size(), index.avgdl_);
    return index;
}

auto LexicalIndex::idf(const std::string& term) const -> double {
    auto n = static_cast<double>(chunks_.size());
    double df = 0.0;
    if (auto it = postings_.find(term); it != postings_.end()) {
        df = static_cast<double>(it->second.size());
    }
    return std::log((n - df + 0.5) / (df + 0.5) + 1.0);
}

auto LexicalIndex::score_all(const std::vector<std::string>& query_tokens) const
    -> std::vector<double> {
    std::vector<double> scores(chunks_.size(), 0.0);

    // Repeated query tokens contribute once per occurrence.
    for (const auto& token : query_tokens) {
        auto it = postings_.find(token);
        if (it == postings_.end()) continue;

        double term_idf = idf(token);
        for (const auto& posting : it->second) {
            double f = static_cast<double>(posting.tf);
            scores[posting.doc] += term_idf * (f * (params_.k1 + 1.0)) /
                                   (f + length_norms_[posting.doc]);
        }
    }
    return scores;
}

auto LexicalIndex::search(const std::vector<std::string>& query_tokens,
                          size_t k) const -> std::vector<Candidate> {
    if (k == 0) return {};

    auto scores = score_all(query_tokens);

    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), size_t{0});

    auto limit = std::min(k, order.size());
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(limit),
                      order.end(), [&scores](size_t a, size_t b) {
                          if (scores[a] != scores[b]) return scores[a] > scores[b];
                          return a < b;
                      });

    std::vector<Candidate> results;
    results.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        auto doc = order[i];
        results.push_back(Candidate{
            .chunk = chunks_[doc],
            .score = scores[doc],
            .source = CandidateSource::Lexical,
        });
    }

    LOG_DEBUG("Lexical search: {} tokens, {} results, top score {:.4f}",
              query_tokens.size(), results.size(),
              results.empty() ? 0.0 : results.front().score);
    return results;
}

} // namespace docqa::retrieval
