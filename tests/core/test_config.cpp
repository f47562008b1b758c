#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "docqa/core/config.hpp"

using namespace docqa;

namespace {

// Sets an environment variable for the lifetime of the guard.
struct ScopedEnv {
    std::string name;
    ScopedEnv(std::string n, const char* value) : name(std::move(n)) {
        setenv(name.c_str(), value, 1);
    }
    ~ScopedEnv() { unsetenv(name.c_str()); }
};

} // anonymous namespace

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = default_config();

    SECTION("server defaults") {
        CHECK(cfg.server.port == 8000);
        CHECK(cfg.server.bind == BindMode::Loopback);
        CHECK(cfg.server.max_connections == 100);
        CHECK(cfg.server.cors_allow_origin == "*");
    }

    SECTION("retrieval defaults") {
        CHECK(cfg.retrieval.default_k == 8);
        CHECK(cfg.retrieval.top_n == 6);
        CHECK(cfg.retrieval.allow_lexical_fallback);
        CHECK_FALSE(cfg.retrieval.drop_zero_lexical);
    }

    SECTION("collaborator defaults") {
        CHECK(cfg.vector_store.collection == "capillary_docs");
        CHECK(cfg.vector_store.score_threshold == 0.15);
        CHECK_FALSE(cfg.vector_store.api_key.has_value());
        CHECK(cfg.embedding.provider == "tei");
        CHECK(cfg.reranker.enabled);
    }

    SECTION("BM25 defaults") {
        CHECK(cfg.corpus.bm25_k1 == 1.5);
        CHECK(cfg.corpus.bm25_b == 0.75);
    }

    SECTION("defaults validate") {
        CHECK(validate_config(cfg).has_value());
    }
}

TEST_CASE("load_config parses JSON file correctly", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "docqa_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "server": { "port": 9999, "max_connections": 50 },
            "vector_store": { "collection": "product_docs", "api_key": "k-123" },
            "retrieval": { "top_n": 4 },
            "log_level": "debug"
        })";
    }

    auto cfg = load_config(tmp);
    CHECK(cfg.server.port == 9999);
    CHECK(cfg.server.max_connections == 50);
    CHECK(cfg.vector_store.collection == "product_docs");
    REQUIRE(cfg.vector_store.api_key.has_value());
    CHECK(*cfg.vector_store.api_key == "k-123");
    CHECK(cfg.retrieval.top_n == 4);
    CHECK(cfg.log_level == "debug");

    // Fields absent from the file keep their defaults.
    CHECK(cfg.retrieval.default_k == 8);
    CHECK(cfg.vector_store.url == "http://localhost:6333");

    fs::remove(tmp);
}

TEST_CASE("load_config falls back to defaults", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = load_config("/nonexistent/docqa/config.json");
        CHECK(cfg.server.port == 8000);
    }

    SECTION("malformed JSON") {
        auto tmp = fs::temp_directory_path() / "docqa_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = load_config(tmp);
        CHECK(cfg.server.port == 8000);
        fs::remove(tmp);
    }
}

TEST_CASE("load_config resolves ${VAR} references", "[config]") {
    namespace fs = std::filesystem;
    ScopedEnv key("DOCQA_TEST_QDRANT_KEY", "from-env");

    auto tmp = fs::temp_directory_path() / "docqa_env_ref_config.json";
    {
        std::ofstream out(tmp);
        out << R"({ "vector_store": { "api_key": "${DOCQA_TEST_QDRANT_KEY}" } })";
    }
    auto cfg = load_config(tmp);
    REQUIRE(cfg.vector_store.api_key.has_value());
    CHECK(*cfg.vector_store.api_key == "from-env");
    fs::remove(tmp);
}

TEST_CASE("apply_env_overrides reads the service variables", "[config]") {
    ScopedEnv url("QDRANT_URL", "http://qdrant:6333");
    ScopedEnv collection("QDRANT_COLLECTION", "other_docs");
    ScopedEnv corpus("DOCQA_CORPUS_PATH", "/srv/corpus.jsonl");
    ScopedEnv port("DOCQA_PORT", "9001");
    ScopedEnv level("DOCQA_LOG_LEVEL", "warn");

    auto cfg = load_config_from_env();
    CHECK(cfg.vector_store.url == "http://qdrant:6333");
    CHECK(cfg.vector_store.collection == "other_docs");
    CHECK(cfg.corpus.snapshot_path == "/srv/corpus.jsonl");
    CHECK(cfg.server.port == 9001);
    CHECK(cfg.log_level == "warn");
}

TEST_CASE("OPENAI_API_KEY only applies to the openai provider", "[config]") {
    ScopedEnv key("OPENAI_API_KEY", "sk-test");

    auto cfg = default_config();
    apply_env_overrides(cfg);
    CHECK_FALSE(cfg.embedding.api_key.has_value());

    cfg.embedding.provider = "openai";
    apply_env_overrides(cfg);
    REQUIRE(cfg.embedding.api_key.has_value());
    CHECK(*cfg.embedding.api_key == "sk-test");
}

TEST_CASE("validate_config rejects unusable values", "[config]") {
    auto cfg = default_config();

    SECTION("top_n of zero") {
        cfg.retrieval.top_n = 0;
        auto r = validate_config(cfg);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidConfig);
    }

    SECTION("default_k above max_k") {
        cfg.retrieval.default_k = 200;
        CHECK_FALSE(validate_config(cfg).has_value());
    }

    SECTION("threshold outside cosine range") {
        cfg.vector_store.score_threshold = 1.5;
        CHECK_FALSE(validate_config(cfg).has_value());
    }

    SECTION("unknown embedding provider") {
        cfg.embedding.provider = "word2vec";
        CHECK_FALSE(validate_config(cfg).has_value());
    }

    SECTION("BM25 b outside [0, 1]") {
        cfg.corpus.bm25_b = 1.2;
        CHECK_FALSE(validate_config(cfg).has_value());
    }

    SECTION("unknown log level") {
        cfg.log_level = "verbose";
        CHECK_FALSE(validate_config(cfg).has_value());
    }

    SECTION("warning is accepted as an alias") {
        cfg.log_level = "warning";
        CHECK(validate_config(cfg).has_value());
    }
}

TEST_CASE("resolve_env_refs", "[config]") {
    SECTION("resolves existing env var") {
        ScopedEnv var("DOCQA_TEST_VAR", "hello_world");
        CHECK(resolve_env_refs("prefix_${DOCQA_TEST_VAR}_suffix") == "prefix_hello_world_suffix");
    }

    SECTION("preserves unresolved vars") {
        CHECK(resolve_env_refs("value=${DOCQA_NONEXISTENT_12345}") ==
              "value=${DOCQA_NONEXISTENT_12345}");
    }

    SECTION("double dollar escapes to literal") {
        CHECK(resolve_env_refs("value=$${LITERAL}") == "value=${LITERAL}");
    }

    SECTION("no refs returns input unchanged") {
        CHECK(resolve_env_refs("no refs here") == "no refs here");
    }
}
