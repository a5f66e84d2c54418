// =============================================================================
// Ingestion Orchestrator, Processing Pool, Registry and Batch Writer Tests
// =============================================================================

#include <gtest/gtest.h>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include "BatchIndexWriter.hpp"
#include "DocumentRegistry.hpp"
#include "EmbeddingClient.hpp"
#include "Errors.hpp"
#include "IngestionOrchestrator.hpp"
#include "PDFProcessingPool.hpp"
#include "PaperFixtures.hpp"
#include "SearchService.hpp"

namespace fs = std::filesystem;

namespace {

// Serves the nine-page paper, or fails the way the real dumper can
class FakeLayoutSource : public LayoutSource {
public:
    enum class Mode { Paper, Unreadable, Timeout, Blocking };

    PdfLayout read(const std::string&, const std::string&,
                   std::chrono::steady_clock::time_point) const override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++reads_;
        switch (mode_) {
            case Mode::Unreadable:
                throw UnreadablePdf("not a PDF");
            case Mode::Timeout:
                throw ExtractionTimeout("layout dump exceeded budget");
            case Mode::Blocking:
                entered_ = true;
                cv_.notify_all();
                cv_.wait(lock, [this]() { return released_; });
                break;
            case Mode::Paper:
                break;
        }
        return fixtures::nine_page_paper();
    }

    void set_mode(Mode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_ = mode;
        entered_ = false;
        released_ = false;
    }

    void wait_until_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    int reads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reads_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    Mode mode_ = Mode::Paper;
    mutable bool entered_ = false;
    bool released_ = false;
    mutable int reads_ = 0;
};

// Hashing model whose calls wait while the gate is closed
class GatedEmbeddingClient : public EmbeddingClient {
public:
    explicit GatedEmbeddingClient(std::size_t dimension) : inner_(dimension) {}

    std::vector<float> embed(const std::string& text) const override {
        wait_at_gate();
        return inner_.embed(text);
    }

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const override {
        wait_at_gate();
        return inner_.embed_batch(texts);
    }

    std::size_t dimension() const override { return inner_.dimension(); }
    std::string model_name() const override { return inner_.model_name(); }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        entered_ = false;
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
        cv_.notify_all();
    }

    void wait_until_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return entered_; });
    }

private:
    void wait_at_gate() const {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!closed_) return;
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return !closed_; });
    }

    HashingEmbeddingClient inner_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool closed_ = false;
    mutable bool entered_ = false;
};

fs::path temp_dir_for(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("paperindex_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

IngestionRequest pdf_request(const std::string& id) {
    IngestionRequest request;
    request.document_id = id;
    request.pdf_bytes = std::string("%PDF-1.4 synthetic");
    return request;
}

IngestionRequest text_request(const std::string& id, const std::string& text,
                              std::vector<Section> sections = {}) {
    IngestionRequest request;
    request.document_id = id;
    request.full_text = text;
    request.sections = std::move(sections);
    return request;
}

}

class IngestionTest : public ::testing::Test {
protected:
    ServiceConfig config;
    FakeLayoutSource source;
    HashingEmbeddingClient embedder{384};
    VectorStore store{384};
    DocumentRegistry registry;
    std::unique_ptr<IngestionOrchestrator> orchestrator;

    void SetUp() override {
        orchestrator = std::make_unique<IngestionOrchestrator>(source, embedder, store, registry, config);
    }
};

// -----------------------------------------------------------------------------
// Successful runs
// -----------------------------------------------------------------------------

TEST_F(IngestionTest, IndexesPaperAndRecordsArtifacts) {
    IngestionResult result = orchestrator->process(pdf_request("p1"));

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.status, DocumentStatus::Indexed);
    EXPECT_GT(result.chunk_count, 0u);
    EXPECT_TRUE(result.failed_chunks.empty());
    EXPECT_EQ(store.chunks_for("p1").size(), result.chunk_count);

    auto doc = registry.get("p1");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->status, DocumentStatus::Indexed);
    EXPECT_EQ(doc->chunk_count, result.chunk_count);
    EXPECT_EQ(doc->page_count, 9);
    EXPECT_EQ(doc->title, std::string("Detecting Columns in Research Papers"));
    EXPECT_EQ(doc->tables.size(), 4u);
    EXPECT_EQ(doc->figures.size(), 10u);
    EXPECT_EQ(doc->references.size(), 28u);
    EXPECT_EQ(doc->stages.text, StageState::Done);
    EXPECT_EQ(doc->stages.tables, StageState::Done);
    EXPECT_EQ(doc->stages.figures, StageState::Done);
    EXPECT_EQ(doc->stages.references, StageState::Done);
    EXPECT_TRUE(doc->last_error.empty());

    ASSERT_FALSE(doc->sections.empty());
    EXPECT_EQ(doc->sections.front().name, "abstract");
    EXPECT_EQ(doc->sections.back().name, "unclassified");
}

TEST_F(IngestionTest, ChunksCarryOrdinalsPagesAndTypes) {
    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);

    auto chunks = store.chunks_for("p1");
    ASSERT_FALSE(chunks.empty());
    bool saw_reference = false;
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].ordinal, static_cast<int>(i));
        ASSERT_TRUE(chunks[i].page.has_value());
        EXPECT_GE(*chunks[i].page, 1);
        EXPECT_LE(*chunks[i].page, 9);
        if (chunks[i].type == ChunkType::Reference) {
            saw_reference = true;
            EXPECT_EQ(chunks[i].section, "references");
            EXPECT_EQ(*chunks[i].page, 9);
        }
    }
    EXPECT_TRUE(saw_reference);
}

TEST_F(IngestionTest, ReingestingProducesIdenticalChunks) {
    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);
    auto first = store.chunks_for("p1");

    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);
    auto second = store.chunks_for("p1");

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].ordinal, second[i].ordinal);
        EXPECT_EQ(first[i].text, second[i].text);
        EXPECT_EQ(first[i].section, second[i].section);
        EXPECT_EQ(first[i].page, second[i].page);
        EXPECT_EQ(first[i].embedding, second[i].embedding);
    }
    EXPECT_EQ(store.document_count(), 1u);
    EXPECT_EQ(orchestrator->get_stats().indexed, 2u);
}

TEST_F(IngestionTest, IndexedChunksAreSearchable) {
    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);
    SearchService search(store, embedder, nullptr);

    SearchRequest request;
    request.query = "Smith Learning item";
    request.max_results = 5;
    request.filters.chunk_type = ChunkType::Reference;
    json response = search.search(request);

    ASSERT_GT(response["results_count"].get<int>(), 0);
    for (const auto& chunk : response["chunks"]) {
        EXPECT_EQ(chunk["document_id"], "p1");
        EXPECT_EQ(chunk["chunk_type"], "reference");
    }
}

TEST_F(IngestionTest, TextInputIsSplitAndParsed) {
    IngestionResult result = orchestrator->process(text_request("t1",
        "Abstract\nWe study columns in papers.\nReferences\n[1] Smith J. A paper. 2019. doi:10.1000/abc42"));

    ASSERT_TRUE(result.success) << result.error;
    auto doc = registry.get("t1");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->references.size(), 1u);
    EXPECT_EQ(doc->doi, std::string("10.1000/abc42"));
    EXPECT_EQ(doc->stages.text, StageState::Done);
    EXPECT_EQ(doc->stages.references, StageState::Done);
    EXPECT_EQ(doc->stages.tables, StageState::Pending);
    EXPECT_EQ(doc->stages.figures, StageState::Pending);
    EXPECT_EQ(source.reads(), 0);
}

TEST_F(IngestionTest, CallerSectionsAreUsedAsGiven) {
    std::vector<Section> sections = {{"results", "It works well.", std::nullopt},
                                     {"abstract", "We tried it.", std::nullopt}};
    IngestionResult result = orchestrator->process(text_request("t2", "It works well. We tried it.", sections));

    ASSERT_TRUE(result.success);
    auto chunks = store.chunks_for("t2");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].section, "abstract");
    EXPECT_EQ(chunks[1].section, "results");
    EXPECT_FALSE(chunks[0].page.has_value());
}

TEST_F(IngestionTest, OcrFlagFromLayoutIsRecorded) {
    IngestionRequest request;
    request.document_id = "scan";
    request.layout = fixtures::nine_page_paper();
    request.layout->info.ocr_applied = true;

    ASSERT_TRUE(orchestrator->process(request).success);
    auto scanned = registry.get("scan");
    ASSERT_TRUE(scanned.has_value());
    EXPECT_TRUE(scanned->ocr_applied);
    EXPECT_EQ(document_to_json(*scanned, false)["ocr_applied"], true);

    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);
    EXPECT_FALSE(registry.get("p1")->ocr_applied);
}

TEST(ReplacementVisibilityTest, SearchSeesOldChunksUntilReplaceCompletes) {
    ServiceConfig config;
    FakeLayoutSource source;
    GatedEmbeddingClient embedder(384);
    HashingEmbeddingClient query_embedder(384);
    VectorStore store(384);
    DocumentRegistry registry;
    IngestionOrchestrator orchestrator(source, embedder, store, registry, config);
    SearchService search(store, query_embedder, nullptr);

    const std::string old_text = "Old notes about column detection.";
    const std::string new_text = "New notes about gradient descent.";
    ASSERT_TRUE(orchestrator.process(text_request("p1", old_text)).success);

    SearchRequest request;
    request.query = "column detection";
    request.filters.document_id = "p1";

    embedder.close();
    auto rerun = std::async(std::launch::async, [&]() {
        return orchestrator.process(text_request("p1", new_text));
    });
    embedder.wait_until_entered();

    json during = search.search(request);
    ASSERT_EQ(during["results_count"], 1);
    EXPECT_EQ(during["chunks"][0]["text"], old_text);
    EXPECT_EQ(registry.get("p1")->status, DocumentStatus::Embedding);

    embedder.open();
    ASSERT_TRUE(rerun.get().success);

    json after = search.search(request);
    ASSERT_EQ(after["results_count"], 1);
    EXPECT_EQ(after["chunks"][0]["text"], new_text);
}

// -----------------------------------------------------------------------------
// Failures
// -----------------------------------------------------------------------------

TEST_F(IngestionTest, TimeoutMarksFailedAndKeepsOldChunks) {
    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);
    size_t indexed_chunks = store.chunks_for("p1").size();

    source.set_mode(FakeLayoutSource::Mode::Timeout);
    IngestionResult result = orchestrator->process(pdf_request("p1"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, DocumentStatus::Failed);
    EXPECT_NE(result.error.find("timed out"), std::string::npos);

    auto doc = registry.get("p1");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->status, DocumentStatus::Failed);
    EXPECT_EQ(doc->stages.text, StageState::Failed);
    EXPECT_EQ(doc->stages.tables, StageState::Failed);
    EXPECT_NE(doc->last_error.find("timed out"), std::string::npos);

    EXPECT_EQ(store.chunks_for("p1").size(), indexed_chunks);
}

TEST_F(IngestionTest, UnreadablePdfFailsWithoutChunks) {
    source.set_mode(FakeLayoutSource::Mode::Unreadable);
    IngestionResult result = orchestrator->process(pdf_request("bad"));

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("unreadable PDF"), std::string::npos);
    EXPECT_FALSE(store.has_document("bad"));

    auto doc = registry.get("bad");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->status, DocumentStatus::Failed);
    EXPECT_EQ(doc->stages.references, StageState::Failed);
    EXPECT_EQ(orchestrator->get_stats().failed, 1u);
}

TEST_F(IngestionTest, BlankTextFails) {
    IngestionResult result = orchestrator->process(text_request("empty", "  \n "));

    EXPECT_EQ(result.status, DocumentStatus::Failed);
    EXPECT_EQ(result.error, "No text extracted");
    EXPECT_EQ(registry.get("empty")->stages.text, StageState::Failed);
}

TEST_F(IngestionTest, RequestWithoutInputFails) {
    IngestionRequest request;
    request.document_id = "nothing";

    IngestionResult result = orchestrator->process(request);

    EXPECT_EQ(result.status, DocumentStatus::Failed);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(IngestionTest, MissingIdFails) {
    IngestionResult result = orchestrator->process(text_request("", "Some text."));

    EXPECT_EQ(result.status, DocumentStatus::Failed);
    EXPECT_EQ(registry.size(), 0u);
}

// -----------------------------------------------------------------------------
// Concurrency and cancellation
// -----------------------------------------------------------------------------

TEST_F(IngestionTest, ConcurrentRunForSameDocumentIsRejected) {
    source.set_mode(FakeLayoutSource::Mode::Blocking);
    auto first = std::async(std::launch::async, [this]() {
        return orchestrator->process(pdf_request("p1"));
    });
    source.wait_until_entered();

    EXPECT_TRUE(orchestrator->in_flight("p1"));
    IngestionResult second = orchestrator->process(pdf_request("p1"));
    EXPECT_TRUE(second.rejected);
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.status, DocumentStatus::Extracting);

    // A different document is not blocked
    EXPECT_TRUE(orchestrator->process(text_request("other", "Unrelated text.")).success);

    source.release();
    IngestionResult done = first.get();
    EXPECT_TRUE(done.success);
    EXPECT_FALSE(orchestrator->in_flight("p1"));
    EXPECT_EQ(orchestrator->get_stats().rejected, 1u);
}

TEST_F(IngestionTest, CancellationRestoresPreviousRecord) {
    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);
    auto before = registry.get("p1");
    auto chunks_before = store.chunks_for("p1");

    CancellationToken token;
    token.cancel();
    IngestionResult result = orchestrator->process(pdf_request("p1"), &token);

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, DocumentStatus::Indexed);

    auto after = registry.get("p1");
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->status, DocumentStatus::Indexed);
    EXPECT_EQ(after->chunk_count, before->chunk_count);
    EXPECT_EQ(store.chunks_for("p1").size(), chunks_before.size());
    EXPECT_EQ(orchestrator->get_stats().cancelled, 1u);
}

TEST_F(IngestionTest, CancellingFirstRunLeavesUploadedRecord) {
    CancellationToken token;
    token.cancel();
    IngestionResult result = orchestrator->process(pdf_request("fresh"), &token);

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(store.has_document("fresh"));
    auto doc = registry.get("fresh");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->id, "fresh");
    EXPECT_EQ(doc->status, DocumentStatus::Uploaded);
    EXPECT_NE(doc->last_error.find("cancelled"), std::string::npos);
}

TEST_F(IngestionTest, DeleteDocumentDropsChunks) {
    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);
    size_t indexed_chunks = store.chunks_for("p1").size();

    EXPECT_EQ(orchestrator->delete_document("p1"), indexed_chunks);
    EXPECT_FALSE(store.has_document("p1"));

    auto doc = registry.get("p1");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->chunk_count, 0u);
    EXPECT_EQ(doc->status, DocumentStatus::Uploaded);
    EXPECT_EQ(orchestrator->delete_document("p1"), 0u);
}

TEST(IngestionResultTest, JsonCarriesOutcome) {
    IngestionResult result;
    result.document_id = "p1";
    result.rejected = true;
    result.error = "busy";

    json j = ingestion_result_to_json(result);

    EXPECT_EQ(j["document_id"], "p1");
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["rejected"], true);
    EXPECT_FALSE(j.contains("cancelled"));
    EXPECT_EQ(j["error"], "busy");
}

// -----------------------------------------------------------------------------
// Processing pool
// -----------------------------------------------------------------------------

TEST_F(IngestionTest, PoolRunsSubmittedJobs) {
    PDFProcessingPool pool(2, *orchestrator);

    auto paper = pool.submit(pdf_request("p1"));
    auto text = pool.submit(text_request("t1", "Abstract\nShort text."));

    EXPECT_TRUE(paper.get().success);
    EXPECT_TRUE(text.get().success);
    EXPECT_EQ(pool.get_stats().completed_tasks, 2u);
    EXPECT_EQ(pool.cancel("never-submitted"), 0u);
}

TEST_F(IngestionTest, PoolCancelsRunningJob) {
    ASSERT_TRUE(orchestrator->process(pdf_request("p1")).success);
    size_t indexed_chunks = store.chunks_for("p1").size();

    PDFProcessingPool pool(1, *orchestrator);
    source.set_mode(FakeLayoutSource::Mode::Blocking);
    auto future = pool.submit(pdf_request("p1"));
    source.wait_until_entered();

    EXPECT_EQ(pool.cancel("p1"), 1u);
    source.release();

    IngestionResult result = future.get();
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(store.chunks_for("p1").size(), indexed_chunks);
    EXPECT_EQ(pool.get_stats().cancelled_tasks, 1u);
}

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------

TEST_F(IngestionTest, FlushWritesSnapshotsThatReload) {
    fs::path dir = temp_dir_for("batch_writer");
    {
        BatchIndexWriter writer(store, registry, dir.string(), 100, std::chrono::seconds(3600));
        IngestionOrchestrator persisted(source, embedder, store, registry, config, &writer);

        ASSERT_TRUE(persisted.process(pdf_request("p1")).success);
        EXPECT_GT(writer.get_stats().current_queue_size, 0u);

        ASSERT_TRUE(writer.flush_now());
        EXPECT_TRUE(fs::exists(writer.vectors_path()));
        EXPECT_TRUE(fs::exists(writer.registry_path()));
        EXPECT_EQ(writer.get_stats().current_queue_size, 0u);
        EXPECT_EQ(writer.get_stats().batches_flushed, 1u);

        // Nothing changed since the last snapshot
        EXPECT_TRUE(writer.flush_now());
        EXPECT_EQ(writer.get_stats().batches_flushed, 1u);
    }

    VectorStore reloaded_store(384);
    ASSERT_TRUE(reloaded_store.load((dir / "vectors.bin").string()));
    EXPECT_EQ(reloaded_store.chunks_for("p1").size(), store.chunks_for("p1").size());

    DocumentRegistry reloaded_registry;
    ASSERT_TRUE(reloaded_registry.load((dir / "documents.json").string()));
    auto doc = reloaded_registry.get("p1");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->status, DocumentStatus::Indexed);
    EXPECT_EQ(doc->title, std::string("Detecting Columns in Research Papers"));
    EXPECT_EQ(doc->references.size(), 28u);
    EXPECT_TRUE(doc->full_text.empty());

    fs::remove_all(dir);
}

TEST(DocumentRegistryTest, InterruptedRunsLoadAsFailed) {
    fs::path dir = temp_dir_for("registry_interrupted");
    std::string path = (dir / "documents.json").string();
    {
        std::ofstream out(path);
        out << R"({"a": {"status": "embedding"}, "b": {"status": "indexed", "chunk_count": 3}})";
    }

    DocumentRegistry registry;
    ASSERT_TRUE(registry.load(path));

    EXPECT_EQ(registry.get("a")->status, DocumentStatus::Failed);
    EXPECT_EQ(registry.get("a")->last_error, "interrupted by shutdown");
    EXPECT_EQ(registry.get("b")->status, DocumentStatus::Indexed);
    EXPECT_EQ(registry.get("b")->chunk_count, 3u);

    auto counts = registry.status_counts();
    EXPECT_EQ(counts["failed"], 1u);
    EXPECT_EQ(counts["indexed"], 1u);

    fs::remove_all(dir);
}

TEST(DocumentRegistryTest, MissingOrCorruptFileLeavesRegistryEmpty) {
    fs::path dir = temp_dir_for("registry_corrupt");
    std::string path = (dir / "documents.json").string();
    {
        std::ofstream out(path);
        out << "{ broken";
    }

    DocumentRegistry registry;
    EXPECT_FALSE(registry.load(path));
    EXPECT_FALSE(registry.load((dir / "missing.json").string()));
    EXPECT_EQ(registry.size(), 0u);

    fs::remove_all(dir);
}
