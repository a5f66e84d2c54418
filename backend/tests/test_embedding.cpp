// =============================================================================
// Embedding Client and Batcher Tests
// =============================================================================

#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include "EmbeddingBatcher.hpp"
#include "EmbeddingClient.hpp"
#include "Errors.hpp"
#include "VectorMath.hpp"

namespace {

// Batch calls always fail; single calls fail a fixed number of times per text,
// and forever for texts containing "poison"
class FlakyEmbeddingClient : public EmbeddingClient {
public:
    explicit FlakyEmbeddingClient(int failures_per_text) : failures_per_text_(failures_per_text) {}

    std::vector<float> embed(const std::string& text) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[text];
        if (text.find("poison") != std::string::npos) {
            throw std::runtime_error("model rejected input");
        }
        if (calls_[text] <= failures_per_text_) {
            throw std::runtime_error("transient failure");
        }
        return {1.0f, 0.0f, 0.0f};
    }

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>&) const override {
        throw std::runtime_error("batch endpoint down");
    }

    std::size_t dimension() const override { return 3; }
    std::string model_name() const override { return "flaky"; }

    int calls_for(const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(text);
        return it == calls_.end() ? 0 : it->second;
    }

private:
    int failures_per_text_;
    mutable std::map<std::string, int> calls_;
    mutable std::mutex mutex_;
};

// Returns vectors of the wrong size
class ShortVectorClient : public EmbeddingClient {
public:
    std::vector<float> embed(const std::string&) const override { return {1.0f}; }
    std::size_t dimension() const override { return 3; }
    std::string model_name() const override { return "short"; }
};

std::vector<Chunk> make_chunks(int count, int poisoned = -1) {
    std::vector<Chunk> chunks;
    for (int i = 0; i < count; ++i) {
        Chunk chunk;
        chunk.document_id = "doc";
        chunk.ordinal = i;
        chunk.text = (i == poisoned) ? "poison pill" : "chunk text " + std::to_string(i);
        chunk.section = "introduction";
        chunks.push_back(chunk);
    }
    return chunks;
}

EmbeddingConfig batcher_config(int max_retries, std::size_t batch_size = 3, std::size_t workers = 2) {
    EmbeddingConfig config;
    config.max_retries = max_retries;
    config.batch_size = batch_size;
    config.workers = workers;
    return config;
}

}

// -----------------------------------------------------------------------------
// Hashing model
// -----------------------------------------------------------------------------

TEST(HashingEmbeddingTest, DeterministicAndNormalized) {
    HashingEmbeddingClient client(384);

    auto a = client.embed("Column detection in research papers");
    auto b = client.embed("Column detection in research papers");

    ASSERT_EQ(a.size(), 384u);
    EXPECT_EQ(a, b);
    EXPECT_NEAR(vector_norm(a), 1.0, 1e-5);
    EXPECT_EQ(client.model_name(), "hashing-384");
}

TEST(HashingEmbeddingTest, CaseAndPunctuationInsensitive) {
    HashingEmbeddingClient client(128);
    EXPECT_EQ(client.embed("Hello, World!"), client.embed("hello world"));
}

TEST(HashingEmbeddingTest, EmptyTextIsZeroVector) {
    HashingEmbeddingClient client(16);
    auto vec = client.embed("  ");
    ASSERT_EQ(vec.size(), 16u);
    EXPECT_DOUBLE_EQ(vector_norm(vec), 0.0);
}

TEST(HashingEmbeddingTest, RelatedTextScoresHigher) {
    HashingEmbeddingClient client(384);
    auto query = client.embed("neural network training");

    double related = cosine_similarity(query, client.embed("training a neural network quickly"));
    double unrelated = cosine_similarity(query, client.embed("bibliography of medieval poetry"));

    EXPECT_GT(related, unrelated);
}

TEST(HashingEmbeddingTest, ZeroDimensionIsRejected) {
    EXPECT_THROW(HashingEmbeddingClient(0), std::invalid_argument);
}

TEST(EmbeddingFactoryTest, ProviderSelectsClient) {
    EmbeddingConfig config;
    config.dimension = 32;
    auto hashing = make_embedding_client(config);
    EXPECT_EQ(hashing->dimension(), 32u);
    EXPECT_EQ(hashing->model_name(), "hashing-32");

    config.provider = "http";
    config.model = "all-minilm";
    auto http = make_embedding_client(config);
    EXPECT_EQ(http->model_name(), "all-minilm");
    EXPECT_EQ(http->dimension(), 32u);
}

// -----------------------------------------------------------------------------
// Batcher
// -----------------------------------------------------------------------------

TEST(EmbeddingBatcherTest, EmbedsAllChunksInOrdinalOrder) {
    HashingEmbeddingClient client(8);
    EmbeddingBatcher batcher(client, batcher_config(3));

    EmbeddingOutcome outcome = batcher.embed_chunks(make_chunks(10));

    ASSERT_EQ(outcome.embedded.size(), 10u);
    EXPECT_TRUE(outcome.failed_ordinals.empty());
    for (size_t i = 0; i < outcome.embedded.size(); ++i) {
        EXPECT_EQ(outcome.embedded[i].ordinal, static_cast<int>(i));
        EXPECT_EQ(outcome.embedded[i].embedding.size(), 8u);
    }
}

TEST(EmbeddingBatcherTest, FailedBatchFallsBackToRetries) {
    FlakyEmbeddingClient client(2);
    EmbeddingBatcher batcher(client, batcher_config(3));

    EmbeddingOutcome outcome = batcher.embed_chunks(make_chunks(5));

    EXPECT_EQ(outcome.embedded.size(), 5u);
    EXPECT_TRUE(outcome.failed_ordinals.empty());
    EXPECT_EQ(client.calls_for("chunk text 0"), 3);
}

TEST(EmbeddingBatcherTest, PermanentFailureIsReportedNotDropped) {
    FlakyEmbeddingClient client(0);
    EmbeddingBatcher batcher(client, batcher_config(3));

    EmbeddingOutcome outcome = batcher.embed_chunks(make_chunks(6, 2));

    EXPECT_EQ(outcome.embedded.size(), 5u);
    EXPECT_EQ(outcome.failed_ordinals, (std::vector<int>{2}));
    EXPECT_EQ(client.calls_for("poison pill"), 3);
    for (const auto& chunk : outcome.embedded) {
        EXPECT_NE(chunk.ordinal, 2);
    }
}

TEST(EmbeddingBatcherTest, RetriesExhaustedMarksChunksFailed) {
    FlakyEmbeddingClient client(5);
    EmbeddingBatcher batcher(client, batcher_config(2));

    EmbeddingOutcome outcome = batcher.embed_chunks(make_chunks(3));

    EXPECT_TRUE(outcome.embedded.empty());
    EXPECT_EQ(outcome.failed_ordinals, (std::vector<int>{0, 1, 2}));
}

TEST(EmbeddingBatcherTest, ZeroRetriesStillTriesOnce) {
    FlakyEmbeddingClient client(0);
    EmbeddingBatcher batcher(client, batcher_config(0));

    EmbeddingOutcome outcome = batcher.embed_chunks(make_chunks(2));

    EXPECT_EQ(outcome.embedded.size(), 2u);
    EXPECT_EQ(client.calls_for("chunk text 1"), 1);
}

TEST(EmbeddingBatcherTest, WrongSizedVectorsAreFailures) {
    ShortVectorClient client;
    EmbeddingBatcher batcher(client, batcher_config(1));

    EmbeddingOutcome outcome = batcher.embed_chunks(make_chunks(2));

    EXPECT_TRUE(outcome.embedded.empty());
    EXPECT_EQ(outcome.failed_ordinals.size(), 2u);
}

TEST(EmbeddingBatcherTest, EmptyInputIsEmptyOutcome) {
    HashingEmbeddingClient client(8);
    EmbeddingBatcher batcher(client, batcher_config(3));

    EmbeddingOutcome outcome = batcher.embed_chunks({});

    EXPECT_TRUE(outcome.embedded.empty());
    EXPECT_TRUE(outcome.failed_ordinals.empty());
}

TEST(EmbeddingBatcherTest, CancelledTokenStopsEmbedding) {
    HashingEmbeddingClient client(8);
    EmbeddingBatcher batcher(client, batcher_config(3));
    CancellationToken token;
    token.cancel();

    EXPECT_THROW(batcher.embed_chunks(make_chunks(4), &token), IngestionCancelled);
}
