#include "docqa/retrieval/qdrant_store.hpp"
#include "docqa/core/logger.hpp"
#include "docqa/core/utils.hpp"
#include "docqa/infra/http_client.hpp"

#include <cmath>

#include <nlohmann/json.hpp>

namespace docqa::retrieval {

namespace {

auto optional_string(const json& payload, const char* key) -> std::optional<std::string> {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

auto point_id(const json& hit) -> std::string {
    if (!hit.contains("id")) return "point:?";
    const auto& id = hit["id"];
    if (id.is_string()) return "point:" + id.get<std::string>();
    return "point:" + id.dump();
}

auto status_error(std::string_view what, const infra::HttpResponse& response) -> Error {
    std::string message;
    switch (response.status) {
        case 401:
        case 403:
            message = "Vector store rejected credentials";
            break;
        case 404:
            message = "Vector collection not found";
            break;
        default:
            message = "Vector store error";
            break;
    }
    return make_error(ErrorCode::BackendUnavailable, std::move(message),
        std::string(what) + ": HTTP " + std::to_string(response.status) +
            ": " + response.body);
}

} // anonymous namespace

auto parse_search_response(std::string_view body, double score_threshold)
    -> Result<std::vector<Candidate>> {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::BackendUnavailable,
            "Malformed vector search response", e.what()));
    }

    if (!parsed.is_object() || !parsed.contains("result") || !parsed["result"].is_array()) {
        return std::unexpected(make_error(ErrorCode::BackendUnavailable,
            "Malformed vector search response", "missing result array"));
    }

    std::vector<Candidate> candidates;
    candidates.reserve(parsed["result"].size());

    for (const auto& hit : parsed["result"]) {
        if (!hit.is_object() || !hit.contains("score") || !hit["score"].is_number()) {
            return std::unexpected(make_error(ErrorCode::BackendUnavailable,
                "Malformed vector search response", "hit without numeric score"));
        }

        auto score = hit["score"].get<double>();
        if (!std::isfinite(score)) {
            LOG_WARN("Dropping vector hit {} with non-finite score", point_id(hit));
            continue;
        }
        if (score < score_threshold) continue;

        const json empty = json::object();
        const auto& payload =
            (hit.contains("payload") && hit["payload"].is_object()) ? hit["payload"] : empty;

        Candidate candidate;
        candidate.chunk.id = point_id(hit);
        candidate.chunk.text = optional_string(payload, "text").value_or("");
        candidate.chunk.url = optional_string(payload, "url");
        candidate.chunk.title = optional_string(payload, "title");
        candidate.score = score;
        candidate.source = CandidateSource::Vector;
        candidates.push_back(std::move(candidate));
    }

    return candidates;
}

auto parse_collection_info(std::string_view body) -> Result<CollectionInfo> {
    try {
        auto parsed = json::parse(body);
        const auto& result = parsed.at("result");

        CollectionInfo info;
        if (result.contains("points_count") && result["points_count"].is_number_unsigned()) {
            info.points = result["points_count"].get<uint64_t>();
        }

        const auto& vectors = result.at("config").at("params").at("vectors");
        if (vectors.contains("size")) {
            info.dimension = vectors["size"].get<size_t>();
        } else if (vectors.is_object() && !vectors.empty()) {
            // Named vectors: report the first one.
            info.dimension = vectors.begin()->at("size").get<size_t>();
        }
        return info;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::BackendUnavailable,
            "Malformed collection info response", e.what()));
    }
}

struct QdrantVectorStore::Impl {
    infra::HttpClient http;
    std::string collection;
    double score_threshold;

    Impl(boost::asio::any_io_executor executor, const VectorStoreConfig& config)
        : http(std::move(executor), infra::HttpClientConfig{
                   .base_url = config.url,
                   .timeout_seconds = config.timeout_seconds,
                   .verify_ssl = true,
                   .default_headers = {},
               }),
          collection(config.collection),
          score_threshold(config.score_threshold) {
        if (config.api_key && !config.api_key->empty()) {
            http.set_default_header("api-key", *config.api_key);
        }
    }

    [[nodiscard]] auto collection_path() const -> std::string {
        return "/collections/" + utils::url_encode(collection);
    }
};

QdrantVectorStore::QdrantVectorStore(boost::asio::any_io_executor blocking_executor,
                                     const VectorStoreConfig& config)
    : impl_(std::make_unique<Impl>(std::move(blocking_executor), config)) {}

QdrantVectorStore::~QdrantVectorStore() = default;

auto QdrantVectorStore::search(const std::vector<float>& query, size_t limit)
    -> awaitable<Result<std::vector<Candidate>>> {
    if (limit == 0) co_return std::vector<Candidate>{};

    json request_body = {
        {"vector", query},
        {"limit", limit},
        {"with_payload", true},
        {"score_threshold", impl_->score_threshold},
    };

    auto response = co_await impl_->http.post(
        impl_->collection_path() + "/points/search", request_body.dump());
    if (!response) {
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Vector store unreachable", response.error().what()));
    }
    if (!response->is_success()) {
        co_return make_fail(status_error("search", *response));
    }

    auto candidates = parse_search_response(response->body, impl_->score_threshold);
    if (candidates) {
        LOG_DEBUG("Vector search on '{}': {} hits", impl_->collection, candidates->size());
    }
    co_return candidates;
}

auto QdrantVectorStore::describe_collection() -> awaitable<Result<CollectionInfo>> {
    auto response = co_await impl_->http.get(impl_->collection_path());
    if (!response) {
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Vector store unreachable",
            impl_->http.base_url() + ": " + response.error().what()));
    }
    if (!response->is_success()) {
        co_return make_fail(status_error("collection info", *response));
    }
    co_return parse_collection_info(response->body);
}

} // namespace docqa::retrieval
