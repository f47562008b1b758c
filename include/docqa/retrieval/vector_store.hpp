#pragma once

#include <cstdint>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "docqa/core/error.hpp"
#include "docqa/retrieval/types.hpp"

namespace docqa::retrieval {

using boost::asio::awaitable;

/// Shape of the collection as reported by the store.
struct CollectionInfo {
    uint64_t points = 0;
    size_t dimension = 0;
};

/// Abstract interface for nearest-neighbour search over an external vector
/// collection that the indexer populated.
class VectorIndexClient {
public:
    virtual ~VectorIndexClient() = default;

    /// Up to `limit` hits for `query`, best first. Hits scoring below the
    /// configured threshold are never returned.
    virtual auto search(const std::vector<float>& query, size_t limit)
        -> awaitable<Result<std::vector<Candidate>>> = 0;

    /// Point count and vector dimension of the collection.
    virtual auto describe_collection() -> awaitable<Result<CollectionInfo>> = 0;
};

} // namespace docqa::retrieval
