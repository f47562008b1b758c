#include "docqa/core/config.hpp"
#include "docqa/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace docqa {

namespace {

void resolve_env_refs_in(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& child : j) {
            resolve_env_refs_in(child);
        }
    }
}

auto env_int(const char* name) -> std::optional<int> {
    auto* val = std::getenv(name);
    if (!val) return std::nullopt;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN("Config: ignoring non-numeric {}='{}'", name, val);
        return std::nullopt;
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        resolve_env_refs_in(j);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

void apply_env_overrides(Config& config) {
    // Qdrant variable names are shared with the indexer.
    if (auto* val = std::getenv("QDRANT_URL")) {
        config.vector_store.url = val;
    }
    if (auto* val = std::getenv("QDRANT_API_KEY")) {
        config.vector_store.api_key = val;
    }
    if (auto* val = std::getenv("QDRANT_COLLECTION")) {
        config.vector_store.collection = val;
    }
    if (auto* val = std::getenv("DOCQA_CORPUS_PATH")) {
        config.corpus.snapshot_path = val;
    }
    if (auto* val = std::getenv("DOCQA_EMBEDDING_URL")) {
        config.embedding.base_url = val;
    }
    if (auto* val = std::getenv("DOCQA_EMBEDDING_PROVIDER")) {
        config.embedding.provider = val;
    }
    if (auto* val = std::getenv("DOCQA_RERANKER_URL")) {
        config.reranker.base_url = val;
    }
    if (auto* val = std::getenv("OPENAI_API_KEY")) {
        if (config.embedding.provider == "openai" && !config.embedding.api_key) {
            config.embedding.api_key = val;
        }
    }
    if (auto port = env_int("DOCQA_PORT")) {
        config.server.port = static_cast<uint16_t>(*port);
    }
    if (auto* val = std::getenv("DOCQA_BIND")) {
        config.server.bind = (std::string(val) == "all") ? BindMode::All : BindMode::Loopback;
    }
    if (auto* val = std::getenv("DOCQA_LOG_LEVEL")) {
        config.log_level = val;
    }
}

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const Config& config) -> Result<void> {
    if (!Logger::parse_level(config.log_level)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Unknown log level", config.log_level));
    }
    if (config.retrieval.top_n == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "retrieval.top_n must be at least 1"));
    }
    if (config.retrieval.default_k == 0 || config.retrieval.max_k == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "retrieval.default_k and retrieval.max_k must be at least 1"));
    }
    if (config.retrieval.default_k > config.retrieval.max_k) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "retrieval.default_k exceeds retrieval.max_k"));
    }
    if (config.vector_store.score_threshold < -1.0 ||
        config.vector_store.score_threshold > 1.0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "vector_store.score_threshold must lie in [-1, 1]",
            std::to_string(config.vector_store.score_threshold)));
    }
    if (config.vector_store.collection.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "vector_store.collection is empty"));
    }
    if (config.embedding.provider != "tei" && config.embedding.provider != "openai") {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Unknown embedding provider", config.embedding.provider));
    }
    if (config.reranker.provider != "tei") {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Unknown reranker provider", config.reranker.provider));
    }
    if (config.corpus.bm25_k1 < 0.0 || config.corpus.bm25_b < 0.0 ||
        config.corpus.bm25_b > 1.0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "BM25 parameters out of range (k1 >= 0, 0 <= b <= 1)"));
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // Escaped: $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        // Check for ${VAR} pattern
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace docqa
