#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docqa::retrieval {

using json = nlohmann::json;

/// An immutable unit of indexed text. `text` is never empty for chunks that
/// made it into the corpus or the vector store.
struct Chunk {
    std::string id;  // provenance: "<source_path>#<chunk_id>" or "line:<n>"
    std::string text;
    std::optional<std::string> url;
    std::optional<std::string> title;
    std::optional<std::string> source_path;
};

enum class CandidateSource {
    Vector,
    Lexical,
};

NLOHMANN_JSON_SERIALIZE_ENUM(CandidateSource, {
    {CandidateSource::Vector, "vector"},
    {CandidateSource::Lexical, "lexical"},
})

/// A chunk retrieved for one request, scored on its source's own scale
/// (cosine similarity for vector hits, BM25 for lexical hits).
struct Candidate {
    Chunk chunk;
    double score = 0.0;
    CandidateSource source = CandidateSource::Lexical;
};

/// Final output unit. `rerank_score` is absent when reranking failed and
/// the candidate was ordered by its source score instead.
struct RankedContext {
    Candidate candidate;
    std::optional<double> rerank_score;

    [[nodiscard]] auto text() const -> const std::string& { return candidate.chunk.text; }
    [[nodiscard]] auto url() const -> const std::optional<std::string>& { return candidate.chunk.url; }
};

/// Result of one pipeline invocation.
struct RetrievalResponse {
    std::vector<RankedContext> contexts;
    std::vector<std::string> sources;
    bool vector_degraded = false;
    bool rerank_degraded = false;
    int64_t elapsed_ms = 0;
};

void to_json(json& j, const Chunk& c);
void to_json(json& j, const Candidate& c);
void to_json(json& j, const RankedContext& r);
void to_json(json& j, const RetrievalResponse& r);

/// Distinct non-empty urls of `contexts`, in first-seen order.
auto collect_sources(const std::vector<RankedContext>& contexts) -> std::vector<std::string>;

} // namespace docqa::retrieval
