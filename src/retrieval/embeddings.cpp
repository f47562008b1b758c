#include "docqa/retrieval/embeddings.hpp"
#include "docqa/core/logger.hpp"
#include "docqa/core/utils.hpp"
#include "docqa/infra/http_client.hpp"

#include <cmath>

#include <nlohmann/json.hpp>

namespace docqa::retrieval {

using json = nlohmann::json;

namespace {

// Hard-cap input to ~8000 tokens (32000 bytes, cut on a character boundary)
constexpr size_t kMaxEmbedBytes = 32000;

auto capped_input(std::string_view text) -> std::string {
    return std::string(utils::utf8_truncate(text, kMaxEmbedBytes));
}

// Invalid UTF-8 in the query is replaced rather than allowed to throw out of
// the coroutine.
auto encode_request(const json& body) -> Result<std::string> {
    try {
        return body.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::BackendUnavailable,
            "Failed to encode embedding request", e.what()));
    }
}

auto to_float_vector(const json& arr) -> Result<std::vector<float>> {
    if (!arr.is_array() || arr.empty()) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Embedding is not a non-empty array"));
    }
    std::vector<float> embedding;
    embedding.reserve(arr.size());
    for (const auto& val : arr) {
        if (!val.is_number()) {
            return std::unexpected(make_error(ErrorCode::SerializationError,
                "Embedding contains a non-numeric value"));
        }
        auto f = val.get<float>();
        if (!std::isfinite(f)) {
            return std::unexpected(make_error(ErrorCode::SerializationError,
                "Embedding contains a non-finite value"));
        }
        embedding.push_back(f);
    }
    return embedding;
}

auto backend_error(std::string message, const Error& cause) -> Error {
    return make_error(ErrorCode::BackendUnavailable, std::move(message), cause.what());
}

auto check_dimensions(std::vector<float> embedding, size_t expected)
    -> Result<std::vector<float>> {
    if (expected != 0 && embedding.size() != expected) {
        return std::unexpected(make_error(ErrorCode::BackendUnavailable,
            "Embedding dimension mismatch",
            "expected " + std::to_string(expected) + ", got " +
                std::to_string(embedding.size())));
    }
    return embedding;
}

} // anonymous namespace

auto parse_tei_embedding(std::string_view body) -> Result<std::vector<float>> {
    try {
        auto parsed = json::parse(body);
        // TEI returns one vector per input even for a single string.
        if (parsed.is_array() && !parsed.empty() && parsed[0].is_array()) {
            return to_float_vector(parsed[0]);
        }
        return to_float_vector(parsed);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Failed to parse embedding response", e.what()));
    }
}

auto parse_openai_embedding(std::string_view body) -> Result<std::vector<float>> {
    try {
        auto parsed = json::parse(body);
        if (!parsed.contains("data") || !parsed["data"].is_array() || parsed["data"].empty()) {
            return std::unexpected(make_error(ErrorCode::SerializationError,
                "Embedding response missing data"));
        }
        return to_float_vector(parsed["data"][0].value("embedding", json::array()));
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Failed to parse embedding response", e.what()));
    }
}

// ---------------------------------------------------------------------------
// TeiEmbeddings
// ---------------------------------------------------------------------------

struct TeiEmbeddings::Impl {
    infra::HttpClient http;
    size_t dims;

    Impl(boost::asio::any_io_executor executor, const EmbeddingConfig& config)
        : http(std::move(executor), infra::HttpClientConfig{
                   .base_url = config.base_url,
                   .timeout_seconds = config.timeout_seconds,
                   .verify_ssl = true,
                   .default_headers = {},
               }),
          dims(config.dimensions) {
        if (config.api_key && !config.api_key->empty()) {
            http.set_default_header("Authorization", "Bearer " + *config.api_key);
        }
    }
};

TeiEmbeddings::TeiEmbeddings(boost::asio::any_io_executor blocking_executor,
                             const EmbeddingConfig& config)
    : impl_(std::make_unique<Impl>(std::move(blocking_executor), config)) {}

TeiEmbeddings::~TeiEmbeddings() = default;

auto TeiEmbeddings::embed(std::string_view text)
    -> awaitable<Result<std::vector<float>>> {
    json request_body = {
        {"inputs", capped_input(text)},
        {"truncate", true},
    };

    auto encoded = encode_request(request_body);
    if (!encoded) {
        co_return make_fail(encoded.error());
    }

    auto response = co_await impl_->http.post("/embed", *encoded);
    if (!response) {
        co_return make_fail(backend_error("Embedding request failed", response.error()));
    }

    if (!response->is_success()) {
        LOG_ERROR("Embedding server returned status {}: {}",
                  response->status, response->body);
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Embedding API error",
            "HTTP " + std::to_string(response->status) + ": " + response->body));
    }

    auto embedding = parse_tei_embedding(response->body);
    if (!embedding) {
        co_return make_fail(backend_error("Invalid embedding response", embedding.error()));
    }

    LOG_DEBUG("Generated embedding with {} dimensions", embedding->size());
    co_return check_dimensions(std::move(*embedding), impl_->dims);
}

auto TeiEmbeddings::dimensions() const -> size_t {
    return impl_->dims;
}

// ---------------------------------------------------------------------------
// OpenAIEmbeddings
// ---------------------------------------------------------------------------

struct OpenAIEmbeddings::Impl {
    infra::HttpClient http;
    std::string model;
    size_t dims;

    Impl(boost::asio::any_io_executor executor, const EmbeddingConfig& config)
        : http(std::move(executor), infra::HttpClientConfig{
                   .base_url = config.base_url,
                   .timeout_seconds = config.timeout_seconds,
                   .verify_ssl = true,
                   .default_headers = {},
               }),
          model(config.model),
          dims(config.dimensions) {
        if (config.api_key && !config.api_key->empty()) {
            http.set_default_header("Authorization", "Bearer " + *config.api_key);
        }
    }
};

OpenAIEmbeddings::OpenAIEmbeddings(boost::asio::any_io_executor blocking_executor,
                                   const EmbeddingConfig& config)
    : impl_(std::make_unique<Impl>(std::move(blocking_executor), config)) {}

OpenAIEmbeddings::~OpenAIEmbeddings() = default;

auto OpenAIEmbeddings::embed(std::string_view text)
    -> awaitable<Result<std::vector<float>>> {
    json request_body = {
        {"model", impl_->model},
        {"input", capped_input(text)},
        {"encoding_format", "float"},
    };

    auto encoded = encode_request(request_body);
    if (!encoded) {
        co_return make_fail(encoded.error());
    }

    auto response = co_await impl_->http.post("/v1/embeddings", *encoded);
    if (!response) {
        co_return make_fail(backend_error("Embedding request failed", response.error()));
    }

    if (!response->is_success()) {
        LOG_ERROR("OpenAI embeddings API returned status {}: {}",
                  response->status, response->body);
        co_return make_fail(make_error(ErrorCode::BackendUnavailable,
            "Embedding API error",
            "HTTP " + std::to_string(response->status) + ": " + response->body));
    }

    auto embedding = parse_openai_embedding(response->body);
    if (!embedding) {
        co_return make_fail(backend_error("Invalid embedding response", embedding.error()));
    }

    LOG_DEBUG("Generated embedding with {} dimensions", embedding->size());
    co_return check_dimensions(std::move(*embedding), impl_->dims);
}

auto OpenAIEmbeddings::dimensions() const -> size_t {
    return impl_->dims;
}

auto make_embedding_provider(boost::asio::any_io_executor blocking_executor,
                             const EmbeddingConfig& config)
    -> Result<std::shared_ptr<EmbeddingProvider>> {
    if (config.provider == "tei") {
        return std::make_shared<TeiEmbeddings>(std::move(blocking_executor), config);
    }
    if (config.provider == "openai") {
        return std::make_shared<OpenAIEmbeddings>(std::move(blocking_executor), config);
    }
    return std::unexpected(make_error(ErrorCode::InvalidConfig,
        "Unknown embedding provider", config.provider));
}

} // namespace docqa::retrieval
