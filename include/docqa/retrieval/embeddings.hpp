#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "docqa/core/config.hpp"
#include "docqa/core/error.hpp"

namespace docqa::retrieval {

using boost::asio::awaitable;

/// Abstract interface for turning a query into a dense vector. The
/// dimension must match the vector collection the indexer populated.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /// Embed a single text string into a float vector.
    virtual auto embed(std::string_view text)
        -> awaitable<Result<std::vector<float>>> = 0;

    /// Returns the dimensionality of the embedding vectors produced.
    [[nodiscard]] virtual auto dimensions() const -> size_t = 0;
};

/// Client for a text-embeddings-inference server (`POST /embed`).
class TeiEmbeddings : public EmbeddingProvider {
public:
    TeiEmbeddings(boost::asio::any_io_executor blocking_executor,
                  const EmbeddingConfig& config);
    ~TeiEmbeddings() override;

    TeiEmbeddings(const TeiEmbeddings&) = delete;
    TeiEmbeddings& operator=(const TeiEmbeddings&) = delete;

    auto embed(std::string_view text)
        -> awaitable<Result<std::vector<float>>> override;

    [[nodiscard]] auto dimensions() const -> size_t override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Client for an OpenAI-compatible `/v1/embeddings` endpoint.
class OpenAIEmbeddings : public EmbeddingProvider {
public:
    OpenAIEmbeddings(boost::asio::any_io_executor blocking_executor,
                     const EmbeddingConfig& config);
    ~OpenAIEmbeddings() override;

    OpenAIEmbeddings(const OpenAIEmbeddings&) = delete;
    OpenAIEmbeddings& operator=(const OpenAIEmbeddings&) = delete;

    auto embed(std::string_view text)
        -> awaitable<Result<std::vector<float>>> override;

    [[nodiscard]] auto dimensions() const -> size_t override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Creates the provider named by `config.provider`.
auto make_embedding_provider(boost::asio::any_io_executor blocking_executor,
                             const EmbeddingConfig& config)
    -> Result<std::shared_ptr<EmbeddingProvider>>;

/// Parses a TEI `/embed` response body (`[[f, f, ...]]`).
auto parse_tei_embedding(std::string_view body) -> Result<std::vector<float>>;

/// Parses an OpenAI embeddings response body (`{"data":[{"embedding":[...]}]}`).
auto parse_openai_embedding(std::string_view body) -> Result<std::vector<float>>;

} // namespace docqa::retrieval
