#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "docqa/retrieval/types.hpp"

namespace docqa::retrieval {

/// Grounding instructions placed ahead of the context blocks.
extern const std::string_view kAnswerInstructions;

/// Formats one `Title/URL/Snippet` block per context for an answer model.
auto format_context_block(const RankedContext& context) -> std::string;

/// Builds the grounded-answer prompt: instructions, context blocks separated
/// by blank lines, then the question.
auto build_prompt(const std::vector<RankedContext>& contexts, std::string_view query)
    -> std::string;

} // namespace docqa::retrieval
