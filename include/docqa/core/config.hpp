#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa/core/error.hpp"

// std::optional serializer for nlohmann/json, needed by the NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace docqa {

using json = nlohmann::json;

enum class BindMode {
    Loopback,
    All,
};

NLOHMANN_JSON_SERIALIZE_ENUM(BindMode, {
    {BindMode::Loopback, "loopback"},
    {BindMode::All, "all"},
})

struct ServerConfig {
    uint16_t port = 8000;
    BindMode bind = BindMode::Loopback;
    size_t max_connections = 100;
    size_t max_body_bytes = 64 * 1024;
    std::string cors_allow_origin = "*";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfig, port, bind, max_connections, max_body_bytes, cors_allow_origin)

struct CorpusConfig {
    std::string snapshot_path = "data/index/bm25_corpus.jsonl";
    double bm25_k1 = 1.5;
    double bm25_b = 0.75;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CorpusConfig, snapshot_path, bm25_k1, bm25_b)

struct VectorStoreConfig {
    std::string url = "http://localhost:6333";
    std::optional<std::string> api_key;
    std::string collection = "capillary_docs";
    double score_threshold = 0.15;
    int timeout_seconds = 10;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(VectorStoreConfig, url, api_key, collection, score_threshold, timeout_seconds)

struct EmbeddingConfig {
    std::string provider = "tei";  // "tei", "openai"
    std::string base_url = "http://localhost:8080";
    std::string model = "sentence-transformers/all-MiniLM-L6-v2";
    std::optional<std::string> api_key;
    size_t dimensions = 384;
    int timeout_seconds = 10;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(EmbeddingConfig, provider, base_url, model, api_key, dimensions, timeout_seconds)

struct RerankerConfig {
    bool enabled = true;
    std::string provider = "tei";
    std::string base_url = "http://localhost:8081";
    std::string model = "cross-encoder/ms-marco-MiniLM-L-6-v2";
    bool raw_scores = false;
    int timeout_seconds = 30;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RerankerConfig, enabled, provider, base_url, model, raw_scores, timeout_seconds)

struct RetrievalConfig {
    size_t default_k = 8;
    size_t max_k = 100;
    size_t top_n = 6;
    bool allow_lexical_fallback = true;
    bool drop_zero_lexical = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RetrievalConfig, default_k, max_k, top_n, allow_lexical_fallback, drop_zero_lexical)

struct Config {
    ServerConfig server;
    CorpusConfig corpus;
    VectorStoreConfig vector_store;
    EmbeddingConfig embedding;
    RerankerConfig reranker;
    RetrievalConfig retrieval;
    std::string log_level = "info";
    std::optional<std::string> env_file;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, server, corpus, vector_store, embedding, reranker, retrieval, log_level, env_file)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Applies environment variable overrides on top of an existing config.
/// Variables that are unset leave the corresponding field untouched.
void apply_env_overrides(Config& config);

/// Checks values that would make the service unusable.
auto validate_config(const Config& config) -> Result<void>;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace docqa
