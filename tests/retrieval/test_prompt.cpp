#include <catch2/catch_test_macros.hpp>

#include "docqa/retrieval/prompt.hpp"
#include "support/fakes.hpp"

using namespace docqa::retrieval;
using docqa::test::make_candidate;

namespace {

auto ranked(std::string text, std::optional<std::string> url,
            std::optional<std::string> title) -> RankedContext {
    auto candidate = make_candidate(std::move(text), std::move(url), 0.5);
    candidate.chunk.title = std::move(title);
    return RankedContext{candidate, 1.0};
}

} // anonymous namespace

TEST_CASE("Context block formatting", "[retrieval][prompt]") {
    SECTION("all fields present") {
        auto block = format_context_block(
            ranked("Refunds take 5 days.", "https://docs/refunds", "Refunds"));
        CHECK(block == "Title: Refunds\nURL: https://docs/refunds\nSnippet: Refunds take 5 days.");
    }

    SECTION("missing title and url render empty") {
        auto block = format_context_block(ranked("Loose text", std::nullopt, std::nullopt));
        CHECK(block == "Title: \nURL: \nSnippet: Loose text");
    }
}

TEST_CASE("Prompt assembly", "[retrieval][prompt]") {
    std::vector<RankedContext> contexts = {
        ranked("First snippet", "https://a", "A"),
        ranked("Second snippet", "https://b", "B"),
    };

    auto prompt = build_prompt(contexts, "How do refunds work?");

    CHECK(prompt.starts_with(kAnswerInstructions));
    CHECK(prompt.find("\n\nContext:\nTitle: A\nURL: https://a\nSnippet: First snippet"
                      "\n\nTitle: B\nURL: https://b\nSnippet: Second snippet") != std::string::npos);
    CHECK(prompt.ends_with("\n\nQuestion: How do refunds work?\nAnswer:"));

    SECTION("context order is preserved") {
        CHECK(prompt.find("First snippet") < prompt.find("Second snippet"));
    }

    SECTION("no contexts still yields a well-formed prompt") {
        auto empty = build_prompt({}, "anything");
        CHECK(empty.find("Context:\n\n\nQuestion: anything") != std::string::npos);
    }
}
