#include <catch2/catch_test_macros.hpp>

#include <algorithm>

#include <boost/asio/thread_pool.hpp>

#include "docqa/retrieval/pipeline.hpp"
#include "support/async.hpp"
#include "support/fakes.hpp"
#include "support/local_server.hpp"

using namespace docqa;
using namespace docqa::retrieval;
using docqa::test::FakeEmbedder;
using docqa::test::FakeRerankModel;
using docqa::test::FakeVectorStore;
using docqa::test::make_candidate;
using docqa::test::make_chunk;
using docqa::test::run_sync;

namespace {

const std::string kRefundUrl = "https://docs.example.com/refund-policy";
const std::string kShippingUrl = "https://docs.example.com/shipping";
const std::string kAccountUrl = "https://docs.example.com/account-deletion";

const std::string kRefundText =
    "Our refund policy lets you request a refund within 30 days of purchase for any reason.";

auto help_center_index() -> std::shared_ptr<const LexicalIndex> {
    auto index = LexicalIndex::build({
        make_chunk(kRefundText, kRefundUrl, "Refund policy"),
        make_chunk("Shipping times are 3 to 5 business days for domestic orders.",
                   kShippingUrl, "Shipping times"),
        make_chunk("Account deletion is permanent and removes all of your data.",
                   kAccountUrl, "Account deletion"),
    });
    REQUIRE(index.has_value());
    return std::make_shared<const LexicalIndex>(std::move(*index));
}

// Scores texts mentioning refunds highest.
auto refund_scorer(const std::string& text) -> double {
    if (text.find("refund") != std::string::npos) return 8.5;
    if (text.find("Shipping") != std::string::npos) return 1.0;
    return -3.0;
}

struct Fixture {
    std::shared_ptr<FakeEmbedder> embedder = std::make_shared<FakeEmbedder>();
    std::shared_ptr<FakeVectorStore> store = std::make_shared<FakeVectorStore>();
    std::shared_ptr<FakeRerankModel> model = std::make_shared<FakeRerankModel>();
    PipelineContext ctx;

    Fixture() {
        model->scorer = refund_scorer;
        ctx.lexical = help_center_index();
        ctx.embedder = embedder;
        ctx.vector_store = store;
        ctx.reranker = std::make_shared<Reranker>(model);
    }

    auto retrieve(std::string query, std::optional<size_t> k = std::nullopt)
        -> Result<RetrievalResponse> {
        RetrievalPipeline pipeline(ctx);
        return run_sync(pipeline.retrieve(std::move(query), k));
    }
};

} // anonymous namespace

TEST_CASE("End-to-end refund question", "[retrieval][pipeline]") {
    Fixture f;
    // The vector store returns a near-duplicate of the refund chunk: same
    // first 64 characters and url, different tail.
    f.store->hits = {
        make_candidate(kRefundText.substr(0, 70) + " Updated in 2024.", kRefundUrl, 0.83),
        make_candidate("Shipping times are 3 to 5 business days for domestic orders.",
                       kShippingUrl, 0.31),
    };

    const std::string query = "how do I get a refund";

    SECTION("lexical search ranks the refund chunk first") {
        auto hits = f.ctx.lexical->search(tokenize(query), 8);
        REQUIRE_FALSE(hits.empty());
        CHECK(hits[0].chunk.url == kRefundUrl);
        CHECK(hits[0].score > 0.0);
    }

    SECTION("final output ranks the refund chunk first and cites it once") {
        auto response = f.retrieve(query);
        REQUIRE(response.has_value());
        REQUIRE_FALSE(response->contexts.empty());
        CHECK(response->contexts[0].url() == kRefundUrl);
        CHECK(std::count(response->sources.begin(), response->sources.end(), kRefundUrl) == 1);
        CHECK(response->sources.front() == kRefundUrl);
        CHECK_FALSE(response->vector_degraded);
        CHECK_FALSE(response->rerank_degraded);

        // The vector copy came first, so it is the one that survived dedup.
        CHECK(response->contexts[0].candidate.source == CandidateSource::Vector);

        // Three unique chunks: the vector duplicate of the refund chunk
        // collapsed into one entry.
        CHECK(response->contexts.size() == 3);
        REQUIRE(f.model->batches.size() == 1);
        CHECK(f.model->batches[0].size() == 3);
        CHECK(f.model->last_query == query);
    }
}

TEST_CASE("Pipeline output respects top_n and rerank ordering", "[retrieval][pipeline]") {
    std::vector<Chunk> corpus;
    for (int i = 0; i < 12; ++i) {
        corpus.push_back(make_chunk("policy document number " + std::to_string(i),
                                    "https://docs/" + std::to_string(i)));
    }
    auto index = LexicalIndex::build(std::move(corpus));
    REQUIRE(index.has_value());

    auto model = std::make_shared<FakeRerankModel>();
    // Later documents score higher.
    model->scorer = [](const std::string& text) {
        return std::stod(text.substr(text.rfind(' ') + 1));
    };

    PipelineContext ctx;
    ctx.lexical = std::make_shared<const LexicalIndex>(std::move(*index));
    ctx.reranker = std::make_shared<Reranker>(model);
    RetrievalPipeline pipeline(ctx);

    auto response = run_sync(pipeline.retrieve("policy", 12));
    REQUIRE(response.has_value());
    REQUIRE(response->contexts.size() == 6);
    for (size_t i = 1; i < response->contexts.size(); ++i) {
        CHECK(*response->contexts[i - 1].rerank_score >= *response->contexts[i].rerank_score);
    }
    CHECK(response->contexts[0].text() == "policy document number 11");
    CHECK(response->sources.size() == 6);
}

TEST_CASE("Pipeline validates its input", "[retrieval][pipeline]") {
    Fixture f;

    SECTION("blank query") {
        auto response = f.retrieve("   \t");
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().code() == ErrorCode::InvalidArgument);
        CHECK(f.store->calls == 0);
    }

    SECTION("query of vertical tabs and form feeds") {
        auto response = f.retrieve("\v\f \v");
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("k of zero") {
        auto response = f.retrieve("refund", 0);
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("k is clamped to max_k") {
        f.ctx.options.max_k = 10;
        auto response = f.retrieve("refund", 500);
        REQUIRE(response.has_value());
        CHECK(f.store->last_limit == 10);
    }

    SECTION("k defaults to default_k") {
        auto response = f.retrieve("refund");
        REQUIRE(response.has_value());
        CHECK(f.store->last_limit == 8);
    }
}

TEST_CASE("Pipeline degrades to lexical-only when the vector branch fails", "[retrieval][pipeline]") {
    Fixture f;
    f.store->failure = make_error(ErrorCode::BackendUnavailable, "Vector store unreachable");

    SECTION("lexical results stand in") {
        auto response = f.retrieve("how do I get a refund");
        REQUIRE(response.has_value());
        CHECK(response->vector_degraded);
        REQUIRE_FALSE(response->contexts.empty());
        CHECK(response->contexts[0].url() == kRefundUrl);
        for (const auto& c : response->contexts) {
            CHECK(c.candidate.source == CandidateSource::Lexical);
        }
    }

    SECTION("embedding failure degrades the same way") {
        f.store->failure.reset();
        f.embedder->fail = true;
        auto response = f.retrieve("refund");
        REQUIRE(response.has_value());
        CHECK(response->vector_degraded);
        CHECK(f.store->calls == 0);
    }

    SECTION("fallback disabled surfaces the backend error") {
        f.ctx.options.allow_lexical_fallback = false;
        auto response = f.retrieve("refund");
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().code() == ErrorCode::BackendUnavailable);
    }

    SECTION("no usable lexical results surfaces the backend error") {
        f.ctx.options.drop_zero_lexical = true;
        auto response = f.retrieve("warranty");
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().code() == ErrorCode::BackendUnavailable);
    }
}

TEST_CASE("Pipeline falls back to source order when reranking fails", "[retrieval][pipeline]") {
    Fixture f;
    f.model->fail = true;
    f.store->hits = {
        make_candidate("Shipping times are 3 to 5 business days for domestic orders.",
                       kShippingUrl, 0.61),
        make_candidate("Account deletion is permanent and removes all of your data.",
                       kAccountUrl, 0.20),
    };

    auto response = f.retrieve("shipping", 1);
    REQUIRE(response.has_value());
    CHECK(response->rerank_degraded);
    REQUIRE_FALSE(response->contexts.empty());
    for (const auto& c : response->contexts) {
        CHECK_FALSE(c.rerank_score.has_value());
    }
    // Merged order sorted by raw source score, highest first.
    for (size_t i = 1; i < response->contexts.size(); ++i) {
        CHECK(response->contexts[i - 1].candidate.score >= response->contexts[i].candidate.score);
    }
}

TEST_CASE("Pipeline returns an empty result when nothing matches", "[retrieval][pipeline]") {
    Fixture f;
    f.ctx.options.drop_zero_lexical = true;

    auto response = f.retrieve("warranty claims");
    REQUIRE(response.has_value());
    CHECK(response->contexts.empty());
    CHECK(response->sources.empty());
    CHECK_FALSE(response->vector_degraded);
    // Nothing to rerank, so the model is never called.
    CHECK(f.model->batches.empty());
}

TEST_CASE("Pipeline without optional collaborators", "[retrieval][pipeline]") {
    Fixture f;

    SECTION("no vector collaborators runs lexical-only without degradation") {
        f.ctx.embedder = nullptr;
        f.ctx.vector_store = nullptr;
        auto response = f.retrieve("refund");
        REQUIRE(response.has_value());
        CHECK_FALSE(response->vector_degraded);
        CHECK(f.embedder->calls == 0);
        CHECK(response->contexts[0].url() == kRefundUrl);
    }

    SECTION("no reranker orders by source score without degradation") {
        f.ctx.reranker = nullptr;
        auto response = f.retrieve("refund");
        REQUIRE(response.has_value());
        CHECK_FALSE(response->rerank_degraded);
        CHECK_FALSE(response->contexts[0].rerank_score.has_value());
    }
}

TEST_CASE("Oversized multi-byte query degrades to lexical-only", "[retrieval][pipeline]") {
    boost::asio::thread_pool pool(1);

    EmbeddingConfig cfg;
    cfg.base_url = docqa::test::kUnreachableUrl;
    cfg.dimensions = 3;
    cfg.timeout_seconds = 2;

    Fixture f;
    f.ctx.embedder = std::make_shared<TeiEmbeddings>(pool.get_executor(), cfg);

    // The embedding cap falls inside the trailing two-byte character.
    std::string query = "refund " + std::string(31992, 'q');
    REQUIRE(query.size() == 31999);
    query += "\xC3\xA9";

    auto response = f.retrieve(query);
    REQUIRE(response.has_value());
    CHECK(response->vector_degraded);
    REQUIRE_FALSE(response->contexts.empty());
    CHECK(response->contexts[0].url() == kRefundUrl);
    CHECK(f.store->calls == 0);
}
