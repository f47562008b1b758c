#include "docqa/retrieval/prompt.hpp"

#include <fmt/format.h>

namespace docqa::retrieval {

const std::string_view kAnswerInstructions =
    "Answer the user based ONLY on the context. Cite 1-3 sources using markdown "
    "links to their URLs. If not found, say you cannot find it in the docs and "
    "suggest closest relevant links. Keep the answer concise with bullet points "
    "and bold key terms.";

auto format_context_block(const RankedContext& context) -> std::string {
    const auto& chunk = context.candidate.chunk;
    return fmt::format("Title: {}\nURL: {}\nSnippet: {}",
                       chunk.title.value_or(""),
                       chunk.url.value_or(""),
                       chunk.text);
}

auto build_prompt(const std::vector<RankedContext>& contexts, std::string_view query)
    -> std::string {
    std::string joined;
    for (size_t i = 0; i < contexts.size(); ++i) {
        if (i > 0) joined += "\n\n";
        joined += format_context_block(contexts[i]);
    }
    return fmt::format("{}\n\nContext:\n{}\n\nQuestion: {}\nAnswer:",
                       kAnswerInstructions, joined, query);
}

} // namespace docqa::retrieval
