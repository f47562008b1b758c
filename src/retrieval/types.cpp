#include "docqa/retrieval/types.hpp"

#include <unordered_set>

namespace docqa::retrieval {

// ---------------------------------------------------------------------------
// JSON serialization
// ---------------------------------------------------------------------------

namespace {

auto optional_string(const std::optional<std::string>& s) -> json {
    return s ? json(*s) : json(nullptr);
}

} // anonymous namespace

void to_json(json& j, const Chunk& c) {
    j = json{
        {"id", c.id},
        {"text", c.text},
        {"url", optional_string(c.url)},
        {"title", optional_string(c.title)},
    };
}

void to_json(json& j, const Candidate& c) {
    j = json{
        {"text", c.chunk.text},
        {"url", optional_string(c.chunk.url)},
        {"title", optional_string(c.chunk.title)},
        {"score", c.score},
        {"source", c.source},
    };
}

void to_json(json& j, const RankedContext& r) {
    to_json(j, r.candidate);
    j["rerank_score"] = r.rerank_score ? json(*r.rerank_score) : json(nullptr);
}

void to_json(json& j, const RetrievalResponse& r) {
    j = json{
        {"contexts", r.contexts},
        {"sources", r.sources},
        {"degraded", {
            {"vector", r.vector_degraded},
            {"rerank", r.rerank_degraded},
        }},
        {"elapsed_ms", r.elapsed_ms},
    };
}

auto collect_sources(const std::vector<RankedContext>& contexts) -> std::vector<std::string> {
    std::vector<std::string> sources;
    std::unordered_set<std::string> seen;
    for (const auto& ctx : contexts) {
        const auto& url = ctx.url();
        if (!url || url->empty()) continue;
        if (seen.insert(*url).second) {
            sources.push_back(*url);
        }
    }
    return sources;
}

} // namespace docqa::retrieval
