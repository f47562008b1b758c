#include "docqa/retrieval/reranker.hpp"
#include "docqa/core/logger.hpp"
#include "docqa/infra/http_client.hpp"

#include <algorithm>
#include <cmath>

#include <nlohmann/json.hpp>

namespace docqa::retrieval {

namespace {

auto rerank_error(std::string message, std::string detail = {}) -> Error {
    return make_error(ErrorCode::RerankModelError, std::move(message), std::move(detail));
}

template <typename Key>
auto ranked_top_n(const std::vector<Candidate>& candidates,
                  std::vector<std::optional<double>> scores,
                  size_t top_n, Key key) -> std::vector<RankedContext> {
    std::vector<RankedContext> ranked;
    ranked.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        ranked.push_back(RankedContext{candidates[i], scores[i]});
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [&key](const RankedContext& a, const RankedContext& b) {
                         return key(a) > key(b);
                     });

    if (ranked.size() > top_n) {
        ranked.erase(ranked.begin() + static_cast<std::ptrdiff_t>(top_n), ranked.end());
    }
    return ranked;
}

} // anonymous namespace

auto parse_tei_rerank_response(std::string_view body, size_t count)
    -> Result<std::vector<double>> {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(rerank_error("Malformed rerank response", e.what()));
    }

    if (!parsed.is_array()) {
        return std::unexpected(rerank_error("Malformed rerank response", "expected an array"));
    }
    if (parsed.size() != count) {
        return std::unexpected(rerank_error("Rerank score count mismatch",
            "expected " + std::to_string(count) + ", got " + std::to_string(parsed.size())));
    }

    std::vector<std::optional<double>> slots(count);
    for (const auto& item : parsed) {
        if (!item.is_object() || !item.contains("index") || !item.contains("score") ||
            !item["index"].is_number_unsigned() || !item["score"].is_number()) {
            return std::unexpected(rerank_error("Malformed rerank response",
                "entry without index/score: " + item.dump()));
        }
        auto index = item["index"].get<size_t>();
        auto score = item["score"].get<double>();
        if (index >= count) {
            return std::unexpected(rerank_error("Rerank index out of range",
                std::to_string(index)));
        }
        if (slots[index]) {
            return std::unexpected(rerank_error("Duplicate rerank index",
                std::to_string(index)));
        }
        if (!std::isfinite(score)) {
            return std::unexpected(rerank_error("Non-finite rerank score",
                "index " + std::to_string(index)));
        }
        slots[index] = score;
    }

    std::vector<double> scores;
    scores.reserve(count);
    for (const auto& s : slots) scores.push_back(*s);
    return scores;
}

// ---------------------------------------------------------------------------
// TeiRerankModel
// ---------------------------------------------------------------------------

struct TeiRerankModel::Impl {
    infra::HttpClient http;
    bool raw_scores;

    Impl(boost::asio::any_io_executor executor, const RerankerConfig& config)
        : http(std::move(executor), infra::HttpClientConfig{
                   .base_url = config.base_url,
                   .timeout_seconds = config.timeout_seconds,
                   .verify_ssl = true,
                   .default_headers = {},
               }),
          raw_scores(config.raw_scores) {}
};

TeiRerankModel::TeiRerankModel(boost::asio::any_io_executor blocking_executor,
                               const RerankerConfig& config)
    : impl_(std::make_unique<Impl>(std::move(blocking_executor), config)) {}

TeiRerankModel::~TeiRerankModel() = default;

auto TeiRerankModel::score(std::string_view query, const std::vector<std::string>& texts)
    -> awaitable<Result<std::vector<double>>> {
    json request_body = {
        {"query", std::string(query)},
        {"texts", texts},
        {"raw_scores", impl_->raw_scores},
        {"truncate", true},
    };

    auto response = co_await impl_->http.post("/rerank",
        request_body.dump(-1, ' ', false, json::error_handler_t::replace));
    if (!response) {
        co_return make_fail(rerank_error("Rerank request failed", response.error().what()));
    }
    if (!response->is_success()) {
        LOG_ERROR("Rerank server returned status {}: {}", response->status, response->body);
        co_return make_fail(rerank_error("Rerank API error",
            "HTTP " + std::to_string(response->status) + ": " + response->body));
    }

    co_return parse_tei_rerank_response(response->body, texts.size());
}

// ---------------------------------------------------------------------------
// Reranker
// ---------------------------------------------------------------------------

Reranker::Reranker(std::shared_ptr<RerankModel> model)
    : model_(std::move(model)) {}

auto Reranker::rerank(std::string_view query,
                      const std::vector<Candidate>& candidates,
                      size_t top_n) -> awaitable<Result<std::vector<RankedContext>>> {
    if (candidates.empty()) {
        co_return std::vector<RankedContext>{};
    }

    std::vector<std::string> texts;
    texts.reserve(candidates.size());
    for (const auto& c : candidates) texts.push_back(c.chunk.text);

    auto scores = co_await model_->score(query, texts);
    if (!scores) {
        co_return make_fail(scores.error());
    }
    if (scores->size() != candidates.size()) {
        co_return make_fail(rerank_error("Rerank score count mismatch",
            "expected " + std::to_string(candidates.size()) +
                ", got " + std::to_string(scores->size())));
    }
    for (double s : *scores) {
        if (!std::isfinite(s)) {
            co_return make_fail(rerank_error("Non-finite rerank score"));
        }
    }

    std::vector<std::optional<double>> slots(scores->begin(), scores->end());
    auto ranked = ranked_top_n(candidates, std::move(slots), top_n,
                               [](const RankedContext& r) { return *r.rerank_score; });

    LOG_DEBUG("Reranked {} candidates, kept {}", candidates.size(), ranked.size());
    co_return ranked;
}

auto fallback_rank(const std::vector<Candidate>& candidates, size_t top_n)
    -> std::vector<RankedContext> {
    return ranked_top_n(candidates,
                        std::vector<std::optional<double>>(candidates.size()),
                        top_n,
                        [](const RankedContext& r) { return r.candidate.score; });
}

} // namespace docqa::retrieval
