#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include "docqa/core/config.hpp"
#include "docqa/retrieval/vector_store.hpp"

namespace docqa::retrieval {

/// VectorIndexClient backed by the Qdrant REST API.
class QdrantVectorStore : public VectorIndexClient {
public:
    QdrantVectorStore(boost::asio::any_io_executor blocking_executor,
                      const VectorStoreConfig& config);
    ~QdrantVectorStore() override;

    QdrantVectorStore(const QdrantVectorStore&) = delete;
    QdrantVectorStore& operator=(const QdrantVectorStore&) = delete;

    auto search(const std::vector<float>& query, size_t limit)
        -> awaitable<Result<std::vector<Candidate>>> override;

    auto describe_collection() -> awaitable<Result<CollectionInfo>> override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parses a `points/search` response body into vector candidates, dropping
/// hits below `score_threshold` and hits with a non-finite score.
auto parse_search_response(std::string_view body, double score_threshold)
    -> Result<std::vector<Candidate>>;

/// Parses a `GET /collections/{name}` response body.
auto parse_collection_info(std::string_view body) -> Result<CollectionInfo>;

} // namespace docqa::retrieval
