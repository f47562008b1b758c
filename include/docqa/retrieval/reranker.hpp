#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "docqa/core/config.hpp"
#include "docqa/core/error.hpp"
#include "docqa/retrieval/types.hpp"

namespace docqa::retrieval {

using boost::asio::awaitable;

/// Pairwise relevance model. Scores every (query, text) pair in one batched
/// call and returns one score per text, in input order.
class RerankModel {
public:
    virtual ~RerankModel() = default;

    virtual auto score(std::string_view query, const std::vector<std::string>& texts)
        -> awaitable<Result<std::vector<double>>> = 0;
};

/// Cross-encoder served by a text-embeddings-inference `/rerank` endpoint.
class TeiRerankModel : public RerankModel {
public:
    TeiRerankModel(boost::asio::any_io_executor blocking_executor,
                   const RerankerConfig& config);
    ~TeiRerankModel() override;

    TeiRerankModel(const TeiRerankModel&) = delete;
    TeiRerankModel& operator=(const TeiRerankModel&) = delete;

    auto score(std::string_view query, const std::vector<std::string>& texts)
        -> awaitable<Result<std::vector<double>>> override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parses a `/rerank` response (`[{"index": i, "score": s}, ...]` in any
/// order) into `count` scores in input order. Missing, duplicate or
/// out-of-range indices and non-finite scores are RerankModelError.
auto parse_tei_rerank_response(std::string_view body, size_t count)
    -> Result<std::vector<double>>;

/// Orders candidates by model relevance and keeps the best `top_n`.
class Reranker {
public:
    explicit Reranker(std::shared_ptr<RerankModel> model);

    /// Empty input yields an empty result without calling the model.
    /// Equal scores keep their input order.
    auto rerank(std::string_view query,
                const std::vector<Candidate>& candidates,
                size_t top_n) -> awaitable<Result<std::vector<RankedContext>>>;

private:
    std::shared_ptr<RerankModel> model_;
};

/// Orders candidates by their source score (stable) and keeps the best
/// `top_n`, leaving rerank_score unset. Used when the model is unavailable.
auto fallback_rank(const std::vector<Candidate>& candidates, size_t top_n)
    -> std::vector<RankedContext>;

} // namespace docqa::retrieval
