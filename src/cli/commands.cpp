#include "docqa/cli/commands.hpp"
#include "docqa/api/server.hpp"
#include "docqa/core/logger.hpp"
#include "docqa/infra/dotenv.hpp"
#include "docqa/retrieval/corpus.hpp"
#include "docqa/retrieval/embeddings.hpp"
#include "docqa/retrieval/lexical_index.hpp"
#include "docqa/retrieval/pipeline.hpp"
#include "docqa/retrieval/prompt.hpp"
#include "docqa/retrieval/qdrant_store.hpp"
#include "docqa/retrieval/reranker.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef DOCQA_VERSION_STRING
#define DOCQA_VERSION_STRING "0.1.0-dev"
#endif

namespace docqa::cli {

using json = nlohmann::json;

namespace {

// Collaborator HTTP calls block inside httplib; they run here.
constexpr size_t kBlockingThreads = 4;

/// Runs `task` to completion on `ioc` and returns its value.
template <typename T>
auto run_blocking(boost::asio::io_context& ioc, boost::asio::awaitable<T> task) -> T {
    std::optional<T> result;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc, std::move(task),
        [&result, &failure](std::exception_ptr e, T value) {
            if (e) {
                failure = e;
            } else {
                result = std::move(value);
            }
        });
    ioc.run();
    ioc.restart();
    if (failure) std::rethrow_exception(failure);
    return std::move(*result);
}

auto load_index(const Config& config) -> Result<std::shared_ptr<const retrieval::LexicalIndex>> {
    auto corpus = retrieval::load_corpus(config.corpus.snapshot_path);
    if (!corpus) {
        return std::unexpected(corpus.error());
    }
    auto index = retrieval::LexicalIndex::build(
        std::move(*corpus),
        retrieval::BM25Params{.k1 = config.corpus.bm25_k1, .b = config.corpus.bm25_b});
    if (!index) {
        return std::unexpected(index.error());
    }
    return std::make_shared<const retrieval::LexicalIndex>(std::move(*index));
}

/// Builds the shared pipeline state. `lexical_only` leaves the vector
/// collaborators out entirely.
auto build_pipeline_context(const Config& config,
                            boost::asio::any_io_executor blocking_executor,
                            bool lexical_only) -> Result<retrieval::PipelineContext> {
    retrieval::PipelineContext ctx;
    ctx.options = retrieval::PipelineOptions::from_config(config.retrieval);

    auto index = load_index(config);
    if (!index) {
        return std::unexpected(index.error());
    }
    ctx.lexical = std::move(*index);

    if (!lexical_only) {
        auto embedder = retrieval::make_embedding_provider(blocking_executor, config.embedding);
        if (!embedder) {
            return std::unexpected(embedder.error());
        }
        ctx.embedder = std::move(*embedder);
        ctx.vector_store = std::make_shared<retrieval::QdrantVectorStore>(
            blocking_executor, config.vector_store);
    }

    if (config.reranker.enabled) {
        auto model = std::make_shared<retrieval::TeiRerankModel>(
            blocking_executor, config.reranker);
        ctx.reranker = std::make_shared<retrieval::Reranker>(std::move(model));
    } else {
        LOG_INFO("Reranker disabled; contexts are ordered by source score");
    }

    return ctx;
}

/// Compares the collection's vector size with the embedding provider.
auto check_collection(retrieval::VectorIndexClient& store, size_t expected_dims)
    -> boost::asio::awaitable<Result<retrieval::CollectionInfo>> {
    auto info = co_await store.describe_collection();
    if (!info) {
        co_return info;
    }
    if (expected_dims != 0 && info->dimension != 0 && info->dimension != expected_dims) {
        LOG_WARN("Collection vector size {} differs from embedding dimension {}",
                 info->dimension, expected_dims);
    } else {
        LOG_INFO("Vector collection: {} points, dimension {}", info->points, info->dimension);
    }
    co_return info;
}

} // anonymous namespace

void redact_config_json(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "token", "secret", "password",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

auto load_runtime_config(const CommandContext& ctx) -> Result<Config> {
    Logger::init("docqa", ctx.log_level.empty() ? "info" : ctx.log_level);

    if (!ctx.env_file.empty()) {
        auto applied = infra::load_env_file(ctx.env_file);
        if (applied > 0) {
            LOG_DEBUG("Loaded {} variables from {}", applied, ctx.env_file);
        }
    }

    Config config = default_config();
    if (!ctx.config_path.empty()) {
        LOG_INFO("Loading configuration from: {}", ctx.config_path);
        config = load_config(std::filesystem::path(ctx.config_path));
    }
    apply_env_overrides(config);

    // An explicit --log-level beats the config file and DOCQA_LOG_LEVEL.
    if (!ctx.log_level.empty()) {
        config.log_level = ctx.log_level;
    }
    Logger::set_level(config.log_level);

    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("serve", "Serve the retrieval HTTP API");

    struct Options {
        uint16_t port = 0;
        std::string bind;
    };
    auto opts = std::make_shared<Options>();

    sub->add_option("-p,--port", opts->port, "Listen port (overrides config)");
    sub->add_option("-b,--bind", opts->bind, "Bind mode: loopback or all")
        ->check(CLI::IsMember({"loopback", "all"}));

    sub->callback([&ctx, opts]() {
        auto config = load_runtime_config(ctx);
        if (!config) {
            LOG_FATAL("Invalid configuration: {}", config.error().what());
            ctx.exit_code = 1;
            return;
        }

        // Apply CLI overrides.
        if (opts->port != 0) {
            config->server.port = opts->port;
        }
        if (!opts->bind.empty()) {
            config->server.bind = (opts->bind == "all") ? BindMode::All : BindMode::Loopback;
        }

        boost::asio::io_context ioc;
        boost::asio::thread_pool blocking_pool(kBlockingThreads);

        auto pipeline_ctx = build_pipeline_context(*config, blocking_pool.get_executor(), false);
        if (!pipeline_ctx) {
            LOG_FATAL("Startup failed: {}", pipeline_ctx.error().what());
            ctx.exit_code = 1;
            return;
        }

        // Dimension check is advisory; the service degrades to lexical-only
        // while the store is unreachable.
        auto collection = run_blocking(ioc, check_collection(
            *pipeline_ctx->vector_store, pipeline_ctx->embedder->dimensions()));
        if (!collection) {
            LOG_WARN("Vector store check failed: {}", collection.error().what());
        }

        retrieval::RetrievalPipeline pipeline(std::move(*pipeline_ctx));
        api::ApiServer server(ioc, config->server, pipeline);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc, &server](auto ec, auto /*sig*/) {
            if (!ec) {
                LOG_INFO("Received shutdown signal");
                server.stop();
                ioc.stop();
            }
        });

        boost::asio::co_spawn(ioc, server.start(),
            [&ioc, &ctx](std::exception_ptr e) {
                if (!e) return;
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    LOG_FATAL("API server failed: {}", ex.what());
                }
                ctx.exit_code = 1;
                ioc.stop();
            });

        LOG_INFO("docqa serving {} chunks. Press Ctrl+C to stop.",
                 pipeline.context().lexical->size());
        ioc.run();

        LOG_INFO("docqa stopped.");
        Logger::flush();
    });
}

// ---------------------------------------------------------------------------
// query command
// ---------------------------------------------------------------------------

void register_query_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("query", "Run one retrieval and print the result as JSON");

    struct Options {
        std::string text;
        size_t k = 0;
        bool prompt = false;
        bool lexical_only = false;
        bool explain = false;
    };
    auto opts = std::make_shared<Options>();

    sub->add_option("text", opts->text, "Query text")->required();
    sub->add_option("-k", opts->k, "Candidates requested from each retriever")
        ->check(CLI::PositiveNumber);
    sub->add_flag("--prompt", opts->prompt, "Include the grounded-answer prompt");
    sub->add_flag("--lexical-only", opts->lexical_only,
                  "Skip the embedding and vector store collaborators");
    sub->add_flag("--explain", opts->explain,
                  "Include per-term IDF and BM25 match counts");

    sub->callback([&ctx, opts]() {
        auto config = load_runtime_config(ctx);
        if (!config) {
            LOG_FATAL("Invalid configuration: {}", config.error().what());
            ctx.exit_code = 1;
            return;
        }

        boost::asio::io_context ioc;
        boost::asio::thread_pool blocking_pool(kBlockingThreads);

        auto pipeline_ctx = build_pipeline_context(
            *config, blocking_pool.get_executor(), opts->lexical_only);
        if (!pipeline_ctx) {
            LOG_FATAL("Startup failed: {}", pipeline_ctx.error().what());
            ctx.exit_code = 1;
            return;
        }

        retrieval::RetrievalPipeline pipeline(std::move(*pipeline_ctx));
        std::optional<size_t> k;
        if (opts->k != 0) k = opts->k;

        auto result = run_blocking(ioc, pipeline.retrieve(opts->text, k));
        if (!result) {
            LOG_ERROR("Retrieval failed: {}", result.error().what());
            std::cout << api::error_body(result.error()).dump(2) << "\n";
            ctx.exit_code = 2;
            return;
        }

        json out = *result;
        if (opts->prompt) {
            out["prompt"] = retrieval::build_prompt(result->contexts, opts->text);
        }
        if (opts->explain) {
            const auto& index = *pipeline.context().lexical;
            auto tokens = retrieval::tokenize(opts->text);
            json idf = json::object();
            for (const auto& t : tokens) idf[t] = index.idf(t);

            auto scores = index.score_all(tokens);
            size_t matched = 0;
            for (double s : scores) {
                if (s > 0.0) ++matched;
            }
            out["explain"] = {
                {"tokens", tokens},
                {"idf", idf},
                {"matched_documents", matched},
                {"corpus_size", index.size()},
                {"average_length", index.average_length()},
            };
        }
        std::cout << out.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("check",
        "Verify the corpus snapshot and the configured collaborators");

    sub->callback([&ctx]() {
        auto config = load_runtime_config(ctx);
        if (!config) {
            std::cout << "config      FAIL  " << config.error().what() << "\n";
            ctx.exit_code = 1;
            return;
        }
        std::cout << "config      ok\n";

        auto index = load_index(*config);
        if (!index) {
            std::cout << "corpus      FAIL  " << index.error().what() << "\n";
            ctx.exit_code = 1;
        } else {
            std::cout << "corpus      ok    " << (*index)->size() << " chunks, "
                      << (*index)->vocabulary_size() << " terms\n";
        }

        boost::asio::io_context ioc;
        boost::asio::thread_pool blocking_pool(kBlockingThreads);
        auto executor = blocking_pool.get_executor();

        auto embedder = retrieval::make_embedding_provider(executor, config->embedding);
        if (!embedder) {
            std::cout << "embedding   FAIL  " << embedder.error().what() << "\n";
            ctx.exit_code = 1;
            return;
        }
        auto probe = run_blocking(ioc, (*embedder)->embed("health check"));
        if (!probe) {
            std::cout << "embedding   FAIL  " << probe.error().what() << "\n";
            ctx.exit_code = 1;
        } else {
            std::cout << "embedding   ok    dimension " << probe->size() << "\n";
        }

        retrieval::QdrantVectorStore store(executor, config->vector_store);
        auto info = run_blocking(ioc, check_collection(store, (*embedder)->dimensions()));
        if (!info) {
            std::cout << "vector      FAIL  " << info.error().what() << "\n";
            ctx.exit_code = 1;
        } else {
            bool mismatch = info->dimension != (*embedder)->dimensions();
            std::cout << "vector      " << (mismatch ? "FAIL  " : "ok    ")
                      << config->vector_store.collection << ": " << info->points
                      << " points, dimension " << info->dimension << "\n";
            if (mismatch) ctx.exit_code = 1;
        }

        if (!config->reranker.enabled) {
            std::cout << "reranker    off\n";
            return;
        }
        retrieval::TeiRerankModel model(executor, config->reranker);
        auto scores = run_blocking(ioc, model.score("health check", {"health check"}));
        if (!scores) {
            // Retrieval still works without the reranker, ordered by source score.
            std::cout << "reranker    WARN  " << scores.error().what() << "\n";
        } else {
            std::cout << "reranker    ok\n";
        }
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("config", "Show or validate the effective configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&ctx, validate_only]() {
        auto config = load_runtime_config(ctx);
        if (!config) {
            std::cerr << "Configuration is invalid: " << config.error().what() << "\n";
            ctx.exit_code = 1;
            return;
        }

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        // Pretty-print the configuration as JSON (with secrets redacted).
        json j = *config;
        redact_config_json(j);
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "docqa " << DOCQA_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace docqa::cli
