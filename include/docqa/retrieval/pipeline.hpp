#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "docqa/core/config.hpp"
#include "docqa/core/error.hpp"
#include "docqa/retrieval/embeddings.hpp"
#include "docqa/retrieval/lexical_index.hpp"
#include "docqa/retrieval/reranker.hpp"
#include "docqa/retrieval/types.hpp"
#include "docqa/retrieval/vector_store.hpp"

namespace docqa::retrieval {

using boost::asio::awaitable;

struct PipelineOptions {
    size_t default_k = 8;
    size_t max_k = 100;
    size_t top_n = 6;
    bool allow_lexical_fallback = true;
    bool drop_zero_lexical = false;

    static auto from_config(const RetrievalConfig& config) -> PipelineOptions;
};

/// Everything a retrieval needs, built once at startup and shared by all
/// requests. Leaving `embedder` or
/// `vector_store` null disables the vector branch; leaving `reranker` null
/// orders results by source score.
struct PipelineContext {
    std::shared_ptr<const LexicalIndex> lexical;
    std::shared_ptr<EmbeddingProvider> embedder;
    std::shared_ptr<VectorIndexClient> vector_store;
    std::shared_ptr<Reranker> reranker;
    PipelineOptions options;
};

/// Hybrid retrieval: vector and lexical search run concurrently, their
/// candidates are merged and deduplicated, and the merged set is reranked
/// down to `options.top_n` contexts.
class RetrievalPipeline {
public:
    explicit RetrievalPipeline(PipelineContext context);

    /// Retrieves contexts for `query`. `k` defaults to options.default_k and
    /// is clamped to options.max_k. Fails with InvalidArgument for a blank
    /// query or k == 0, and with BackendUnavailable when the vector branch
    /// fails and lexical results cannot stand in for it.
    auto retrieve(std::string query, std::optional<size_t> k = std::nullopt)
        -> awaitable<Result<RetrievalResponse>>;

    [[nodiscard]] auto context() const noexcept -> const PipelineContext& { return ctx_; }

private:
    auto vector_branch(std::string query, size_t k)
        -> awaitable<Result<std::vector<Candidate>>>;
    auto lexical_branch(std::string query, size_t k)
        -> awaitable<std::vector<Candidate>>;

    PipelineContext ctx_;
};

} // namespace docqa::retrieval
