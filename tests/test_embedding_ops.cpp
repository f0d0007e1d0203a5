#include <catch2/catch.hpp>
#include "embedding_ops.hpp"
#include "errors.hpp"
#include "fake_provider.hpp"

using namespace rembed;

// ── embed_one ───────────────────────────────────────────────────

TEST_CASE("EmbeddingOperations: embed_one runs on the pool", "[ops]") {
    WorkerPool pool(2);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "default prompt");
    auto provider = std::make_shared<FakeProvider>();

    auto embedding = ops.embed_one(make_fake_client(provider), "hello");

    REQUIRE((embedding == Embedding{5.0f, 1.0f}));
    REQUIRE(provider->embed_calls.load() == 1);
    REQUIRE(pool.submitted() == 1);
}

TEST_CASE("EmbeddingOperations: embed_one failure names client and stage", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "p");
    auto provider = std::make_shared<FakeProvider>();

    try {
        ops.embed_one(make_fake_client(provider), "x <fail-embed>");
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        REQUIRE(e.client_name() == "fake");
        REQUIRE(e.stage() == "embed");
        REQUIRE(e.detail().find("HTTP 500") != std::string::npos);
        REQUIRE(std::string(e.what()).rfind("Client 'fake' embed failed:", 0) == 0);
    }
    // No retries
    REQUIRE(provider->embed_calls.load() == 1);
}

// ── embed_many ──────────────────────────────────────────────────

TEST_CASE("EmbeddingOperations: embed_many issues one batched request", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "p");
    auto provider = std::make_shared<FakeProvider>();

    auto result = ops.embed_many(make_fake_client(provider), {"a", "bbb", "cc"});

    REQUIRE(provider->batch_calls.load() == 1);
    REQUIRE(provider->embed_calls.load() == 0);
    REQUIRE(result.size() == 3);
    REQUIRE(result[0][0] == 1.0f);
    REQUIRE(result[1][0] == 3.0f);
    REQUIRE(result[2][0] == 2.0f);
}

TEST_CASE("EmbeddingOperations: embed_many of nothing makes no request", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "p");
    auto provider = std::make_shared<FakeProvider>();

    REQUIRE(ops.embed_many(make_fake_client(provider), {}).empty());
    REQUIRE(provider->batch_calls.load() == 0);
    REQUIRE(pool.submitted() == 0);
}

TEST_CASE("EmbeddingOperations: embed_many is all-or-nothing", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "p");
    auto provider = std::make_shared<FakeProvider>();

    REQUIRE_THROWS_AS(ops.embed_many(make_fake_client(provider), {"ok", "<fail-embed>"}),
                      ProviderError);
}

TEST_CASE("EmbeddingOperations: embed_many rejects a short reply", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "p");
    auto provider = std::make_shared<FakeProvider>();
    provider->batch_result_size = 1;

    try {
        ops.embed_many(make_fake_client(provider), {"a", "b"});
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        REQUIRE(e.stage() == "embed");
        REQUIRE(e.detail().find("expected 2 embeddings, got 1") != std::string::npos);
    }
}

// ── embed_image ─────────────────────────────────────────────────

TEST_CASE("EmbeddingOperations: embed_image describes then embeds", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "default prompt");
    auto provider = std::make_shared<FakeProvider>();
    auto client = make_fake_client(provider);

    auto embedding = ops.embed_image(client, "img-1");
    REQUIRE(provider->describe_calls.load() == 1);
    REQUIRE(provider->embed_calls.load() == 1);
    REQUIRE(provider->last_prompt() == "default prompt");
    REQUIRE(embedding[0] == static_cast<float>(std::string("description of img-1").size()));

    ops.embed_image(client, "img-1", std::string("custom"));
    REQUIRE(provider->last_prompt() == "custom");
}

TEST_CASE("EmbeddingOperations: client prompt beats the default", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "default prompt");
    auto provider = std::make_shared<FakeProvider>();
    auto client = make_fake_client(provider);
    client->descriptor.vision_prompt = "client prompt";

    ops.embed_image(client, "img");
    REQUIRE(provider->last_prompt() == "client prompt");
}

TEST_CASE("EmbeddingOperations: embed_image reports the failing stage", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "p");
    auto provider = std::make_shared<FakeProvider>();
    provider->fail_describe = {"broken"};

    try {
        ops.embed_image(make_fake_client(provider), "broken");
        FAIL("expected ProviderError");
    } catch (const ProviderError& e) {
        REQUIRE(e.stage() == "describe");
    }
    REQUIRE(provider->embed_calls.load() == 0);
}

TEST_CASE("EmbeddingOperations: embed_image without vision is unsupported", "[ops]") {
    WorkerPool pool(1);
    ExecutionBridge bridge(pool);
    EmbeddingOperations ops(bridge, "p");
    auto provider = std::make_shared<FakeProvider>();
    auto client = make_fake_client(provider, 4, std::chrono::milliseconds(1000), false);

    REQUIRE_THROWS_AS(ops.embed_image(client, "img"), UnsupportedOperation);
    REQUIRE(pool.submitted() == 0);
}
