#include "docqa/retrieval/pipeline.hpp"
#include "docqa/core/logger.hpp"
#include "docqa/core/utils.hpp"
#include "docqa/retrieval/fusion.hpp"

#include <algorithm>
#include <chrono>

#include <boost/asio/experimental/awaitable_operators.hpp>

namespace docqa::retrieval {

using namespace boost::asio::experimental::awaitable_operators;

auto PipelineOptions::from_config(const RetrievalConfig& config) -> PipelineOptions {
    return PipelineOptions{
        .default_k = config.default_k,
        .max_k = config.max_k,
        .top_n = config.top_n,
        .allow_lexical_fallback = config.allow_lexical_fallback,
        .drop_zero_lexical = config.drop_zero_lexical,
    };
}

RetrievalPipeline::RetrievalPipeline(PipelineContext context)
    : ctx_(std::move(context)) {}

auto RetrievalPipeline::vector_branch(std::string query, size_t k)
    -> awaitable<Result<std::vector<Candidate>>> {
    if (!ctx_.embedder || !ctx_.vector_store) {
        co_return std::vector<Candidate>{};
    }

    auto embedding = co_await ctx_.embedder->embed(query);
    if (!embedding) {
        co_return make_fail(embedding.error());
    }
    co_return co_await ctx_.vector_store->search(*embedding, k);
}

auto RetrievalPipeline::lexical_branch(std::string query, size_t k)
    -> awaitable<std::vector<Candidate>> {
    if (!ctx_.lexical) co_return std::vector<Candidate>{};

    auto hits = ctx_.lexical->search(tokenize(query), k);
    if (ctx_.options.drop_zero_lexical) {
        std::erase_if(hits, [](const Candidate& c) { return c.score == 0.0; });
    }
    co_return hits;
}

auto RetrievalPipeline::retrieve(std::string query, std::optional<size_t> k)
    -> awaitable<Result<RetrievalResponse>> {
    const auto started = std::chrono::steady_clock::now();
    const auto& opts = ctx_.options;

    if (utils::trim(query).empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Query must not be empty"));
    }
    size_t effective_k = k.value_or(opts.default_k);
    if (effective_k == 0) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "k must be at least 1"));
    }
    if (effective_k > opts.max_k) {
        LOG_DEBUG("Clamping k={} to max_k={}", effective_k, opts.max_k);
        effective_k = opts.max_k;
    }

    auto [vector_result, lexical_hits] = co_await (
        vector_branch(query, effective_k) && lexical_branch(query, effective_k));

    RetrievalResponse response;
    std::vector<Candidate> vector_hits;
    if (vector_result) {
        vector_hits = std::move(*vector_result);
    } else if (opts.allow_lexical_fallback && !lexical_hits.empty()) {
        LOG_WARN("Vector retrieval failed, continuing lexical-only: {}",
                 vector_result.error().what());
        response.vector_degraded = true;
    } else {
        LOG_ERROR("Vector retrieval failed: {}", vector_result.error().what());
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Vector retrieval failed", vector_result.error().what()));
    }

    auto merged = merge_candidates(vector_hits, lexical_hits, effective_k);

    if (!merged.empty()) {
        if (ctx_.reranker) {
            auto ranked = co_await ctx_.reranker->rerank(query, merged, opts.top_n);
            if (ranked) {
                response.contexts = std::move(*ranked);
            } else {
                LOG_WARN("Reranking failed, ordering by source score: {}",
                         ranked.error().what());
                response.contexts = fallback_rank(merged, opts.top_n);
                response.rerank_degraded = true;
            }
        } else {
            response.contexts = fallback_rank(merged, opts.top_n);
        }
    }

    response.sources = collect_sources(response.contexts);
    response.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    LOG_INFO("Retrieved {} contexts (vector={}, lexical={}, merged={}) in {}ms{}{}",
             response.contexts.size(), vector_hits.size(), lexical_hits.size(),
             merged.size(), response.elapsed_ms,
             response.vector_degraded ? " [vector degraded]" : "",
             response.rerank_degraded ? " [rerank degraded]" : "");
    co_return response;
}

} // namespace docqa::retrieval
